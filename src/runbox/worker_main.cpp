#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <iostream>

#include <argparse/argparse.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <runbox/logger.h>
#include <runbox/paths.h>
#include <runbox/utils.h>

#include "runner.h"
#include "protocol.h"

// runbox-worker: started by WorkerPool, reads WorkerRequest frames on stdin
// and answers each with one WorkerResponse frame on stdout. Exits on EOF.

namespace {

struct WorkerArgs {
  std::string node_path;
  fs::path scratch_dir;
  spdlog::level::level_enum level;
};

WorkerArgs ParseArgs(int argc, char** argv) {
  argparse::ArgumentParser parser(argc ? argv[0] : "runbox-worker");
  parser.add_argument("--node-path")
    .default_value(std::string("node"))
    .help("Interpreter of the external runner");
  parser.add_argument("--scratch-dir")
    .default_value(kScratchRoot.string())
    .help("Directory for temporary source files");
  parser.add_argument("--log-level")
    .default_value(std::string("warn"))
    .help("spdlog level name");
  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }
  WorkerArgs ret;
  ret.node_path = parser.get<std::string>("--node-path");
  ret.scratch_dir = parser.get<std::string>("--scratch-dir");
  ret.level = spdlog::level::from_str(parser.get<std::string>("--log-level"));
  return ret;
}

// Moves the protocol pipes away from fds 0 and 1 and points those at
// /dev/null, so that nothing submitted code prints can corrupt a frame.
bool DetachProtocolFds(int& in_fd, int& out_fd) {
  in_fd = fcntl(0, F_DUPFD_CLOEXEC, 3);
  out_fd = fcntl(1, F_DUPFD_CLOEXEC, 3);
  int devnull = open("/dev/null", O_RDWR | O_CLOEXEC);
  if (in_fd < 0 || out_fd < 0 || devnull < 0 || dup2(devnull, 0) < 0 || dup2(devnull, 1) < 0) {
    spdlog::error("Failed to set up protocol fds: errno={} {}", errno, strerror(errno));
    return false;
  }
  close(devnull);
  return true;
}

} // namespace

int main(int argc, char** argv) {
  // stdout carries frames; logs go to stderr only
  spdlog::set_default_logger(spdlog::stderr_color_mt("worker"));
  WorkerArgs args = ParseArgs(argc, argv);
  InitLogger("[worker %P] %+", args.level);

  int in_fd, out_fd;
  if (!DetachProtocolFds(in_fd, out_fd)) return 1;

  auto embedded = CreateEmbeddedRunner();
  auto external = CreateExternalRunner(args.node_path, args.scratch_dir);
  std::vector<uint8_t> buf;
  while (ReadFrame(in_fd, buf)) {
    WorkerRequest req;
    try {
      req = WorkerRequest(buf);
    } catch (const std::out_of_range& e) {
      spdlog::error("Malformed request frame: {}", e.what());
      return 2;
    }
    spdlog::debug("Request: runner={} source={}B preload={}B network={}",
        RunnerKindName(req.kind), req.source.size(), req.preload.size(), req.enable_network);
    Runner& runner = req.kind == RunnerKind::EMBEDDED ? *embedded : *external;
    ExecutionResult res = runner.Run(req.source);
    if (!WriteFrame(out_fd, WorkerResponse(res).Serialize())) {
      spdlog::error("Failed to write response: errno={} {}", errno, strerror(errno));
      return 1;
    }
  }
  spdlog::debug("Request pipe closed, exiting");
  return 0;
}
