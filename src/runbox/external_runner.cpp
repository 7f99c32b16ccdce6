#include "runner.h"

#include <cstring>

#include <spdlog/spdlog.h>

#include "utils.h"

namespace {

class ExternalRunner : public Runner {
  std::string interpreter_;
  fs::path scratch_dir_;
 public:
  ExternalRunner(const std::string& interpreter, const fs::path& scratch_dir) :
      interpreter_(interpreter), scratch_dir_(scratch_dir) {}

  ExecutionResult Run(const std::string& source) override {
    ExecutionResult ret;
    if (source.empty()) {
      ret.success = true;
      ret.outcome = Outcome::OK;
      return ret;
    }
    TempFile file(scratch_dir_, "runbox_", ".js");
    if (!file.IsValid() || !file.Write(source)) {
      return ExecutionResult::Failure(Outcome::INTERNAL_ERROR,
          "failed to write temporary source file in " + scratch_dir_.string());
    }
    SpawnResult res = SpawnCapture({interpreter_, file.Path().string()});
    if (res.sys_errno) {
      spdlog::warn("Failed to start {}: errno={} {}", interpreter_, res.sys_errno, strerror(res.sys_errno));
      return ExecutionResult::Failure(Outcome::UNAVAILABLE,
          "failed to start " + interpreter_ + ": " + strerror(res.sys_errno));
    }
    ret.output = std::move(res.out);
    if (!res.err.empty()) ret.error = std::move(res.err);
    if (res.Exited()) {
      ret.success = res.ExitCode() == 0;
      if (!ret.success && !ret.error) ret.error = "process " + DescribeWaitStatus(res.status);
    } else {
      ret.success = false;
      std::string desc = "process " + DescribeWaitStatus(res.status);
      ret.error = ret.error ? *ret.error + "\n" + desc : desc;
    }
    ret.outcome = ret.success ? Outcome::OK : Outcome::CODE_ERROR;
    spdlog::debug("{} finished: success={} stdout={}B", interpreter_, ret.success, ret.output.size());
    return ret;
  }
};

} // namespace

std::unique_ptr<Runner> CreateExternalRunner(
    const std::string& interpreter, const std::filesystem::path& scratch_dir) {
  return std::make_unique<ExternalRunner>(interpreter, scratch_dir);
}
