#include <boost/program_options.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <vellum/audit/audit_store.hpp>
#include <vellum/audit/chain_verifier.hpp>
#include <vellum/audit/report.hpp>
#include <vellum/schema/primitives.hpp>
#include <vellum/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace {

namespace po = boost::program_options;

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  vellum_chain_audit verify --db-path P [--tenant T]\n"
            << "  vellum_chain_audit list --db-path P --tenant T\n"
            << "  vellum_chain_audit report --db-path P --tenant T "
               "[--from MS] [--to MS]\n\n";
  std::cout << options << '\n';
}

std::optional<uint64_t> get_optional_u64(const po::variables_map& vm,
                                         const std::string& name) {
  if (!vm.contains(name)) {
    return std::nullopt;
  }
  return vm[name].as<uint64_t>();
}

void print_counts(const std::string_view title,
                  const std::map<std::string, uint64_t>& counts) {
  std::cout << title << ":\n";
  for (const auto& [name, count] : counts) {
    std::cout << "  " << name << ' ' << count << '\n';
  }
}

int verify(const vellum::audit::audit_store& store,
           const std::optional<std::string>& tenant) {
  auto verifier = vellum::audit::chain_verifier{store};
  auto results =
      std::map<std::string, std::vector<vellum::schema::verification_error_t>>{};
  if (tenant) {
    results.emplace(*tenant, verifier.verify_tenant(*tenant));
  } else {
    results = verifier.verify_all();
  }

  auto breaks = std::size_t{0};
  for (const auto& [tenant_id, errors] : results) {
    for (const auto& error : errors) {
      std::cout << tenant_id << ' ' << to_string(error.kind) << ' '
                << error.entry_id << '\n';
    }
    breaks += errors.size();
  }
  if (breaks == 0) {
    std::cout << "ok " << results.size() << " tenant(s)\n";
    return 0;
  }
  return 2;
}

int list(const vellum::audit::audit_store& store, const std::string& tenant) {
  auto cursor = store.cursor_for_tenant(tenant);
  while (auto entry = cursor.next()) {
    std::cout << entry->id << ' '
              << vellum::schema::format_iso8601(entry->timestamp) << ' '
              << to_string(entry->event_type) << ' '
              << to_string(entry->severity) << ' '
              << to_string(entry->lifecycle_state) << ' '
              << entry->sequence_reference.value_or("-") << ' '
              << entry->content_hash << ' ' << entry->description << '\n';
  }
  return 0;
}

int report(const vellum::audit::audit_store& store,
           const std::string& tenant,
           const std::optional<uint64_t> from,
           const std::optional<uint64_t> to) {
  auto summary = vellum::audit::build_report(store, tenant, from, to);
  std::cout << "tenant " << summary.tenant_id << '\n'
            << "total " << summary.total << '\n'
            << "awaiting_review " << summary.awaiting_review << '\n';
  print_counts("event_type", summary.by_event_type);
  print_counts("actor", summary.by_actor);
  print_counts("severity", summary.by_severity);
  print_counts("state", summary.by_state);
  return 0;
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"vellum_chain_audit options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command), "verify|list|report")(
      "db-path", po::value<std::string>()->default_value("vellum.db"),
      "RocksDB directory")("tenant", po::value<std::string>(), "tenant id")(
      "from", po::value<uint64_t>(), "report range start, ms since epoch")(
      "to", po::value<uint64_t>(), "report range end, ms since epoch");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << e.what() << '\n';
    print_help(options);
    return 1;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return command.empty() && !vm.contains("help") ? 1 : 0;
  }

  // stdout carries the report; diagnostics go to stderr.
  spdlog::set_default_logger(spdlog::stderr_color_mt("vellum_chain_audit"));
  spdlog::set_level(spdlog::level::warn);
  auto tenant = vm.contains("tenant")
                    ? std::optional<std::string>{vm["tenant"].as<std::string>()}
                    : std::nullopt;
  if ((command == "list" || command == "report") && !tenant) {
    std::cerr << command << " requires --tenant\n";
    return 1;
  }
  if (command != "verify" && command != "list" && command != "report") {
    std::cerr << "command must be verify|list|report\n";
    return 1;
  }

  auto db_path = vm["db-path"].as<std::string>();
  if (!std::filesystem::is_directory(db_path)) {
    std::cerr << "no audit store at " << db_path << '\n';
    return 1;
  }

  auto encoder = vellum::audit::encoder_t{};
  auto storage = vellum::storage::make_read_only_storage<
      vellum::storage::rocksdb_storage_tag>(db_path);
  auto store = vellum::audit::audit_store{storage, encoder};

  if (command == "verify") {
    return verify(store, tenant);
  }
  if (command == "list") {
    return list(store, *tenant);
  }
  return report(store, *tenant, get_optional_u64(vm, "from"),
                get_optional_u64(vm, "to"));
}
