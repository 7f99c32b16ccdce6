#include <signal.h>
#include <unistd.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <system_error>
#include <iostream>
#include <filesystem>

#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <runbox/logger.h>
#include <runbox/paths.h>
#include <runbox/utils.h>
#include <runbox/executor.h>
#include "config.h"
#include "server.h"

namespace {

const char kDefaultConfig[] = "/etc/runbox.conf";

std::atomic<int> stop_signal = 0;

void HandleSignal(int sig) {
  stop_signal = sig;
}

void ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "runbox");
  parser.add_argument("-c", "--config")
    .help("Path of configuration file (default " + std::string(kDefaultConfig) + ")");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-p", "--port")
    .scan<'d', int>()
    .help("Port to listen on");
  parser.add_argument("-w", "--workers")
    .scan<'d', int>()
    .help("Number of worker processes");
  parser.add_argument("-t", "--timeout")
    .scan<'d', int>()
    .help("Wall-clock limit of one execution in seconds");
  parser.add_argument("--max-requests")
    .scan<'d', int>()
    .help("Maximum number of requests in flight");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  InitLogger("[%t] %+", VerbosityToLevel(verbosity));
  kExecutorOptions.pool_size = DefaultPoolSize(std::thread::hardware_concurrency());
  auto config_file = parser.present<std::string>("--config");
  fs::path config_path = config_file ? fs::path(*config_file) : fs::path(kDefaultConfig);
  if (!ParseConfig(config_path, config_file.has_value())) {
    spdlog::error("Failed to parse configuration file {}", config_path.string());
    exit(1);
  }
  if (!ParseEnv()) exit(1);
  auto Positive = [](const char* name, int val) {
    if (val <= 0) {
      spdlog::error("{} must be positive", name);
      exit(1);
    }
    return val;
  };
  if (auto val = parser.present<int>("--port")) kPort = Positive("--port", *val);
  if (auto val = parser.present<int>("--workers")) kExecutorOptions.pool_size = Positive("--workers", *val);
  if (auto val = parser.present<int>("--timeout")) {
    kExecutorOptions.timeout = std::chrono::seconds(Positive("--timeout", *val));
  }
  if (auto val = parser.present<int>("--max-requests")) kMaxRequests = Positive("--max-requests", *val);
  if (kExecutorOptions.pool_size == 0 || kMaxRequests == 0) {
    spdlog::error("max_workers and max_requests must be positive");
    exit(1);
  }
}

} // namespace

int main(int argc, char** argv) {
  ParseArgs(argc, argv);
  spdlog::info("Configuration: max_requests={} max_workers={} worker_timeout={}s",
               kMaxRequests, kExecutorOptions.pool_size,
               std::chrono::duration_cast<std::chrono::seconds>(kExecutorOptions.timeout).count());

  struct sigaction action{};
  action.sa_handler = HandleSignal;
  sigemptyset(&action.sa_mask);
  sigaction(SIGINT, &action, nullptr);
  sigaction(SIGTERM, &action, nullptr);

  std::unique_ptr<Engine> engine;
  try {
    engine = std::make_unique<Engine>(kExecutorOptions, kMaxRequests);
  } catch (const std::system_error& e) {
    spdlog::error("Failed to start workers: {}", e.what());
    return 1;
  }
  SandboxServer server(*engine, kApiKey, kHttpThreads);
  std::atomic<bool> listen_failed = false;
  std::thread server_thread([&]() {
    if (!server.Listen(kListenHost, kPort)) {
      spdlog::error("Failed to listen on {}:{}", kListenHost, kPort);
      listen_failed = true;
    }
  });
  while (!stop_signal && !listen_failed) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }
  if (stop_signal) spdlog::warn("Received signal {}, shutting down", stop_signal.load());
  server.Stop();
  server_thread.join();
  engine.reset();
  return listen_failed ? 1 : 0;
}
