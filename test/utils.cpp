#include "utils.h"

#include <thread>
#include <fstream>
#include <iterator>
#include <runbox/paths.h>

#include "../src/runbox/utils.h"

ExecutorOptions TestExecutorOptions(size_t pool_size, std::chrono::milliseconds timeout) {
  ExecutorOptions opt;
  opt.pool_size = pool_size;
  opt.timeout = timeout;
  opt.worker_program = WorkerProgram();
  opt.scratch_dir = kScratchRoot;
  return opt;
}

std::vector<std::string> TestWorkerCommand() {
  return {WorkerProgram().string(), "--scratch-dir", kScratchRoot.string()};
}

bool NodeAvailable() {
  static const bool available = SpawnCapture({"node", "--version"}).ExitCode() == 0;
  return available;
}

bool ProcessDead(pid_t pid) {
  for (int i = 0; i < 200; i++) {
    std::ifstream fin("/proc/" + std::to_string(pid) + "/stat");
    std::string line;
    if (!fin || !std::getline(fin, line)) return true;
    size_t pos = line.rfind(')');
    if (pos != std::string::npos && pos + 2 < line.size() &&
        (line[pos + 2] == 'Z' || line[pos + 2] == 'X')) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return false;
}

size_t CountFiles(const fs::path& dir) {
  return std::distance(fs::directory_iterator(dir), fs::directory_iterator());
}
