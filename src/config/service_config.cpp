#include <boost/program_options.hpp>
#include <vellum/common/error.hpp>
#include <vellum/config/service_config.hpp>

#include <sstream>

namespace po = boost::program_options;

namespace vellum::config {

namespace {

po::options_description make_description() {
  auto defaults = service_config{};
  auto description = po::options_description{"Vellum audit trail"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(), "INI file with the options below")(
      "db-path,d", po::value<std::string>()->default_value(defaults.db_path),
      "RocksDB directory")(
      "grpc-address,g",
      po::value<std::string>()->default_value(defaults.grpc_address),
      "IP:Port for the gRPC service")(
      "system-actor",
      po::value<std::string>()->default_value(defaults.system_actor),
      "Actor recorded when a caller supplies none")(
      "clock-skew-tolerance-ms",
      po::value<int64_t>()->default_value(
          defaults.clock_skew_tolerance.count()),
      "How far in the future an entry timestamp may lie")(
      "lock-timeout-ms",
      po::value<int64_t>()->default_value(defaults.lock_timeout.count()),
      "Wait for a busy tenant before failing")(
      "retention-days",
      po::value<uint32_t>()->default_value(defaults.retention_days),
      "Age after which validated entries are archived")(
      "log-file", po::value<std::string>()->default_value(defaults.log_file),
      "Log file path")(
      "log-level", po::value<std::string>()->default_value("info"),
      "trace|debug|info|warn|error|critical|off")(
      "verbose,v", "Enable verbose output");
  return description;
}

spdlog::level::level_enum parse_level(const std::string& name) {
  auto level = spdlog::level::from_str(name);
  if (level == spdlog::level::off && name != "off") {
    throw vellum::common::validation_error{"unknown log level '" + name + "'"};
  }
  return level;
}

std::chrono::milliseconds non_negative(const po::variables_map& vm,
                                       const std::string& name) {
  auto value = vm[name].as<int64_t>();
  if (value < 0) {
    throw vellum::common::validation_error{"--" + name +
                                           " must not be negative"};
  }
  return std::chrono::milliseconds{value};
}

}  // namespace

vellum::audit::recorder_options service_config::recorder_options() const {
  auto options = vellum::audit::recorder_options{};
  options.system_actor = system_actor;
  options.clock_skew_tolerance = clock_skew_tolerance;
  options.lock_timeout = lock_timeout;
  return options;
}

std::chrono::milliseconds service_config::retention() const {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::days{retention_days});
}

service_config parse_service_config(const int argc, const char* const argv[]) {
  auto description = make_description();
  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("config")) {
      po::store(po::parse_config_file<char>(
                    vm["config"].as<std::string>().c_str(), description),
                vm);
    }
    po::notify(vm);
  } catch (const po::error& e) {
    throw vellum::common::validation_error{e.what()};
  }

  auto config = service_config{};
  config.help = vm.contains("help");
  config.verbose = vm.contains("verbose");
  config.db_path = vm["db-path"].as<std::string>();
  config.grpc_address = vm["grpc-address"].as<std::string>();
  config.system_actor = vm["system-actor"].as<std::string>();
  config.clock_skew_tolerance = non_negative(vm, "clock-skew-tolerance-ms");
  config.lock_timeout = non_negative(vm, "lock-timeout-ms");
  config.retention_days = vm["retention-days"].as<uint32_t>();
  config.log_file = vm["log-file"].as<std::string>();
  config.log_level = parse_level(vm["log-level"].as<std::string>());
  if (config.verbose && config.log_level > spdlog::level::debug) {
    config.log_level = spdlog::level::debug;
  }
  if (config.system_actor.empty()) {
    throw vellum::common::validation_error{"--system-actor must not be empty"};
  }
  return config;
}

std::string usage() {
  auto out = std::ostringstream{};
  out << make_description();
  return out.str();
}

}  // namespace vellum::config
