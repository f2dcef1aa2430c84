#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <iostream>
#include <procura/budget/budget_ledger.hpp>
#include <procura/budget/reservation_manager.hpp>
#include <procura/config/options.hpp>
#include <procura/orchestration/orchestrator.hpp>
#include <procura/policy/policy_store.hpp>
#include <procura/routing/approval_router.hpp>
#include <procura/rpc/server.hpp>
#include <procura/supplier/supplier_registry.hpp>
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

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto parsed = procura::config::parse_options(argc, argv);
  if (auto* error = std::get_if<procura::config::parse_error>(&parsed)) {
    std::cerr << "procurad: " << error->message << std::endl;
    return 1;
  }
  auto options = std::get<procura::config::options>(parsed);
  if (options.help) {
    std::cout << options.usage << std::endl;
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      options.log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "procurad", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_level(spdlog::level::from_str(options.log_level));
  if (options.config_file) {
    spdlog::info("Loaded configuration from {}", *options.config_file);
  }

  auto encoder = procura::schema::encoding::encoder<
      procura::schema::encoding::scale_encoder_tag>{};
  auto storage =
      procura::storage::make_storage<procura::storage::rocksdb_storage_tag>(
          options.db_path);

  auto policy = procura::policy::policy_store{encoder, storage};
  auto suppliers = procura::supplier::supplier_registry{encoder, storage};
  auto ledger =
      procura::budget::budget_ledger{encoder, storage, options.fiscal_year};
  auto reservations =
      procura::budget::reservation_manager{encoder, storage, ledger};
  auto router = procura::routing::approval_router{policy, suppliers,
                                                  options.fallback_role};
  auto orchestrator = procura::orchestration::orchestrator{
      encoder, storage, policy, router, reservations};

  spdlog::info("Escalations route to '{}'; fiscal year {}",
               options.fallback_role,
               options.fiscal_year == 0 ? std::string{"any"}
                                        : std::to_string(options.fiscal_year));

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = procura::rpc::listener{orchestrator, router, ledger,
                                              suppliers, policy};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(options.grpc_address,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    spdlog::critical("Failed to start gRPC service on {}",
                     options.grpc_address);
    spdlog::shutdown();
    return 1;
  }
  grpc_server->GetHealthCheckService()->SetServingStatus(false);
  spdlog::info("Procurement service listening on {}", options.grpc_address);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    while (!shutdown_requested()) {
      grpc_server->GetHealthCheckService()->SetServingStatus(true);
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    spdlog::info("Shutting down procurement service");
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  spdlog::shutdown();
  return 0;
}
