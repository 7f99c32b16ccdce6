#include <runbox/executor.h>

#include <cctype>
#include <cstring>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <runbox/paths.h>
#include <runbox/utils.h>

#include "utils.h"
#include "worker_pool.h"

namespace {

constexpr int kLanguageCount = 0
#define X(...) + 1
  ENUM_LANGUAGE_
#undef X
  ;

bool ProbeInterpreter(const std::string& path) {
  SpawnResult res = SpawnCapture({path, "--version"});
  if (res.sys_errno) {
    spdlog::warn("Interpreter {} cannot be started: errno={} {}",
                 path, res.sys_errno, strerror(res.sys_errno));
    return false;
  }
  if (res.ExitCode() != 0) {
    spdlog::warn("Interpreter {} --version {}", path, DescribeWaitStatus(res.status));
    return false;
  }
  std::string version = res.out;
  while (!version.empty() && isspace((unsigned char)version.back())) version.pop_back();
  spdlog::info("Interpreter {} version {}", path, version);
  return true;
}

std::vector<std::string> WorkerCommand(const ExecutorOptions& opt) {
  auto level = spdlog::level::to_string_view(spdlog::get_level());
  return {
    opt.worker_program.string(),
    "--node-path", opt.node_path,
    "--scratch-dir", opt.scratch_dir.string(),
    "--log-level", std::string(level.data(), level.size()),
  };
}

} // namespace

Executor::Executor(const ExecutorOptions& opt) : opt_(opt) {
  if (opt_.worker_program.empty()) opt_.worker_program = WorkerProgram();
  if (opt_.scratch_dir.empty()) opt_.scratch_dir = kScratchRoot;
  for (int i = (int)Language::NUL + 1; i < kLanguageCount; i++) {
    Language lang = (Language)i;
    switch (LanguageRunner(lang)) {
      case RunnerKind::EMBEDDED: available_[i] = true; break;
      case RunnerKind::EXTERNAL: available_[i] = ProbeInterpreter(opt_.node_path); break;
    }
    if (!available_[i]) spdlog::warn("Language {} disabled", LanguageName(lang));
  }
  pool_ = std::make_unique<WorkerPool>(opt_.pool_size, WorkerCommand(opt_));
}

Executor::~Executor() = default;

bool Executor::IsSupported(Language lang) const {
  return lang != Language::NUL;
}

bool Executor::IsAvailable(Language lang) const {
  auto it = available_.find((int)lang);
  return it != available_.end() && it->second;
}

ExecutionResult Executor::Execute(const ExecutionRequest& req) {
  long id = GetUniqueExecutionId();
  if (!IsSupported(req.language)) {
    spdlog::info("Execution {} rejected: unsupported language", id);
    return ExecutionResult::Failure(Outcome::UNSUPPORTED, "unsupported language");
  }
  if (!IsAvailable(req.language)) {
    spdlog::info("Execution {} rejected: {} unavailable", id, LanguageName(req.language));
    return ExecutionResult::Failure(Outcome::UNAVAILABLE,
        std::string(LanguageName(req.language)) + " runtime unavailable");
  }
  try {
    return Dispatch_(id, req);
  } catch (const std::exception& e) {
    spdlog::error("Execution {} failed: {}", id, e.what());
    return ExecutionResult::Failure(Outcome::INTERNAL_ERROR, e.what());
  }
}

ExecutionResult Executor::Dispatch_(long id, const ExecutionRequest& req) {
  spdlog::info("Execution {} started: language={} source={}B", id, LanguageName(req.language), req.source.size());
  auto start = std::chrono::steady_clock::now();
  DispatchResult res = pool_->Dispatch(WorkerRequest(LanguageRunner(req.language), req), opt_.timeout);

  ExecutionResult ret;
  switch (res.status) {
    case DispatchStatus::FINISHED: {
      ret.success = res.response.success;
      ret.output = std::move(res.response.output);
      ret.error = std::move(res.response.error);
      ret.outcome = res.response.outcome;
      break;
    }
    case DispatchStatus::TIMEOUT: {
      double seconds = std::chrono::duration<double>(opt_.timeout).count();
      ret = ExecutionResult::Failure(Outcome::TIMEOUT,
          fmt::format("execution timed out (>{:g} seconds)", seconds));
      break;
    }
    case DispatchStatus::CRASHED: {
      ret = ExecutionResult::Failure(Outcome::CRASHED, "worker crashed: " + res.message);
      break;
    }
  }
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  spdlog::info("Execution {} finished: {} ({}) in {} ms",
               id, OutcomeToAbr(ret.outcome), DispatchStatusName(res.status), elapsed.count());
  return ret;
}

EngineResponse Engine::Run(const ExecutionRequest& req) {
  EngineResponse ret{EngineStatus::ACCEPTED, ExecutionResult()};
  auto ticket = admission_.TryAdmit();
  if (!ticket) {
    ret.status = EngineStatus::OVERLOADED;
    return ret;
  }
  if (!executor_.IsSupported(req.language)) {
    ret.status = EngineStatus::UNSUPPORTED;
    ret.result = ExecutionResult::Failure(Outcome::UNSUPPORTED, "unsupported language");
    return ret;
  }
  // no worker slot for a language that cannot run
  if (!executor_.IsAvailable(req.language)) {
    ret.result = executor_.Execute(req);
    return ret;
  }
  RunningGuard guard = ticket->AwaitSlot();
  ret.result = executor_.Execute(req);
  return ret;
}
