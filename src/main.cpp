#include <atomic>
#include <chrono>
#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <cairn/abci/server.hpp>
#include <cairn/common/log_level.hpp>
#include <cairn/execution/engine.hpp>
#include <iostream>
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

  auto grpc_address = std::string{};
  auto db_path = std::string{};
  auto chain_id = std::string{};
  auto max_payload_bytes = uint64_t{};
  auto strict_crypto = true;
  auto log_level = std::string{};
  auto log_file = std::string{};
  auto config_file = std::string{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"Cairn"};
  description.add_options()("help,h", "Show the help message")(
      "grpc-address,g",
      boost::program_options::value<std::string>(&grpc_address)
          ->default_value("0.0.0.0:26658"),
      "IP:Port for the ABCI server")(
      "db-path,d",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "cairn.db"),
      "RocksDB directory for committed state")(
      "chain-id",
      boost::program_options::value<std::string>(&chain_id)->default_value(""),
      "CometBFT chain-id; normally installed by InitChain")(
      "max-payload-bytes",
      boost::program_options::value<uint64_t>(&max_payload_bytes)
          ->default_value(cairn::execution::kDefaultMaxPayloadBytes),
      "Largest accepted push payload")(
      "strict-crypto",
      boost::program_options::value<bool>(&strict_crypto)->default_value(true),
      "Verify transaction signatures")(
      "log-level",
      boost::program_options::value<std::string>(&log_level)->default_value(
          "info"),
      "trace, debug, info, warn, error, critical or off")(
      "log-file",
      boost::program_options::value<std::string>(&log_file)->default_value(
          "cairn.log"),
      "Log file written beside console output")(
      "config,c",
      boost::program_options::value<std::string>(&config_file)
          ->default_value(""),
      "INI file with the same options; command line wins");

  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    if (vm.contains("config") && !vm["config"].as<std::string>().empty()) {
      boost::program_options::store(
          boost::program_options::parse_config_file<char>(
              vm["config"].as<std::string>().c_str(), description),
          vm);
    }
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& ex) {
    std::cerr << ex.what() << "\n" << description << std::endl;
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  auto level = cairn::common::parse_log_level(log_level);
  if (!level) {
    std::cerr << "unknown --log-level '" << log_level << "'\n"
              << description << std::endl;
    return 1;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "cairn", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(*level);

  auto encoder = cairn::schema::encoding::encoder<
      cairn::schema::encoding::scale_encoder_tag>{};
  auto storage =
      cairn::storage::make_storage<cairn::storage::rocksdb_storage_tag>(
          db_path);
  auto engine = cairn::execution::engine{encoder, storage, strict_crypto,
                                         max_payload_bytes};
  if (!chain_id.empty()) {
    engine.set_chain_id(chain_id);
  }

  spdlog::info("gRPC service listening on {}", grpc_address);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = cairn::abci::listener{engine};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(grpc_address,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    spdlog::critical("Failed to start gRPC server on {}", grpc_address);
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
    spdlog::info("Shutting down gRPC service");
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  spdlog::shutdown();
  return 0;
}
