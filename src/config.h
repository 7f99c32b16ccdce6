#ifndef CONFIG_H_
#define CONFIG_H_

#include <filesystem>
#include <runbox/executor.h>

// Daemon configuration globals; the listen address and API key live in
// server.h. Filled by ParseConfig, then ParseEnv, then the command line.
extern size_t kMaxRequests;
extern ExecutorOptions kExecutorOptions;

// Reads the global section of an INI file. A missing file is an error only
// if required; a count set to zero or below is always one.
bool ParseConfig(const std::filesystem::path& conf_path, bool required);
// API_KEY, MAX_REQUESTS, MAX_WORKERS, WORKER_TIMEOUT
bool ParseEnv();

#endif  // CONFIG_H_
