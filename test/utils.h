#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <chrono>
#include <string>
#include <vector>
#include <sys/types.h>
#include <gtest/gtest.h>
#include <runbox/paths.h>
#include <runbox/executor.h>

// options pointing at the runbox-worker built next to the test binary
ExecutorOptions TestExecutorOptions(size_t pool_size, std::chrono::milliseconds timeout);

// command line of runbox-worker as WorkerPool starts it
std::vector<std::string> TestWorkerCommand();

bool NodeAvailable();

#define SKIP_WITHOUT_NODE() \
  if (!NodeAvailable()) GTEST_SKIP() << "node is not installed"

// waits up to 2 seconds for the process to exit (a zombie counts as dead)
bool ProcessDead(pid_t pid);

size_t CountFiles(const fs::path& dir);

#endif // TEST_UTILS_H_
