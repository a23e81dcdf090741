#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <vellum/audit/audit_store.hpp>
#include <vellum/audit/notifier.hpp>
#include <vellum/audit/recorder.hpp>
#include <vellum/audit/workflow.hpp>
#include <vellum/common/error.hpp>
#include <vellum/config/service_config.hpp>
#include <vellum/schema/primitives.hpp>
#include <vellum/service/server.hpp>
#include <vellum/storage/rocksdb/storage.hpp>

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

void configure_logging(const vellum::config::service_config& config) {
  spdlog::init_thread_pool(8192, 1);

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "vellum", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(config.log_level);
}

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto config = vellum::config::service_config{};
  try {
    config = vellum::config::parse_service_config(argc, argv);
  } catch (const vellum::common::validation_error& e) {
    std::cerr << e.what() << "\n\n" << vellum::config::usage() << std::endl;
    return 1;
  }

  if (config.help) {
    std::cout << vellum::config::usage() << std::endl;
    return 0;
  }

  configure_logging(config);

  auto encoder = vellum::audit::encoder_t{};
  auto storage =
      vellum::storage::make_storage<vellum::storage::rocksdb_storage_tag>(
          config.db_path);
  auto store = vellum::audit::audit_store{storage, encoder};
  auto notifier = vellum::audit::logging_notifier{};
  auto workflow = vellum::audit::workflow{store, notifier};
  auto recorder =
      vellum::audit::recorder{store, workflow, config.recorder_options()};

  // Retention sweep at startup; entries are archived, never deleted.
  auto now = vellum::schema::now_milliseconds();
  auto retention =
      static_cast<vellum::schema::duration_milliseconds_t>(
          config.retention().count());
  for (const auto& tenant_id : store.list_tenants()) {
    workflow.archive_expired(tenant_id, now, retention);
  }

  spdlog::info("gRPC service listening on {}", config.grpc_address);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = vellum::service::listener{store, recorder, workflow};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(config.grpc_address,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    spdlog::error("Failed to start gRPC service on {}", config.grpc_address);
    spdlog::shutdown();
    return 1;
  }
  grpc_server->GetHealthCheckService()->SetServingStatus(false);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    while (!shutdown_requested()) {
      grpc_server->GetHealthCheckService()->SetServingStatus(true);
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  spdlog::shutdown();
  return 0;
}
