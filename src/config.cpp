#include "config.h"

#include <cstdlib>
#include <fstream>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <runbox/paths.h>

#include "server.h"

size_t kMaxRequests = 1000;
ExecutorOptions kExecutorOptions;

namespace {

// false if the key is set to zero or a negative number
template <class T>
bool IniPositive(tortellini::ini& ini, const char* key, T& val) {
  long x = ini[""][key] | (long)val;
  if (x <= 0) {
    spdlog::error("Configuration {}={} is not a positive integer", key, x);
    return false;
  }
  val = x;
  return true;
}

// false if set but not a positive integer
bool EnvPositive(const char* name, long& val) {
  const char* str = getenv(name);
  if (!str || !*str) return true;
  char* end;
  long x = strtol(str, &end, 10);
  if (*end || x <= 0) {
    spdlog::error("Environment variable {}={} is not a positive integer", name, str);
    return false;
  }
  val = x;
  return true;
}

} // namespace

bool ParseConfig(const fs::path& conf_path, bool required) {
  std::ifstream fin(conf_path);
  if (!fin) return !required;
  tortellini::ini ini;
  fin >> ini;
  kListenHost = ini[""]["listen_host"] | kListenHost;
  kApiKey = ini[""]["api_key"] | kApiKey;
  if (!IniPositive(ini, "port", kPort) ||
      !IniPositive(ini, "max_requests", kMaxRequests) ||
      !IniPositive(ini, "http_threads", kHttpThreads) ||
      !IniPositive(ini, "max_workers", kExecutorOptions.pool_size)) {
    return false;
  }
  long timeout = ini[""]["worker_timeout"] | (long)0;
  if (timeout > 0) kExecutorOptions.timeout = std::chrono::seconds(timeout);
  kExecutorOptions.node_path = ini[""]["node_path"] | kExecutorOptions.node_path;
  std::string scratch_dir = ini[""]["scratch_dir"] | "";
  std::string worker_program = ini[""]["worker_program"] | "";
  if (scratch_dir.size()) kScratchRoot = scratch_dir;
  if (worker_program.size()) kExecutorOptions.worker_program = worker_program;
  return true;
}

bool ParseEnv() {
  if (const char* key = getenv("API_KEY"); key && *key) kApiKey = key;
  long max_requests = kMaxRequests, max_workers = kExecutorOptions.pool_size;
  long timeout = std::chrono::duration_cast<std::chrono::seconds>(kExecutorOptions.timeout).count();
  if (!EnvPositive("MAX_REQUESTS", max_requests) || !EnvPositive("MAX_WORKERS", max_workers) ||
      !EnvPositive("WORKER_TIMEOUT", timeout)) {
    return false;
  }
  kMaxRequests = max_requests;
  kExecutorOptions.pool_size = max_workers;
  kExecutorOptions.timeout = std::chrono::seconds(timeout);
  return true;
}
