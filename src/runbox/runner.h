#ifndef RUNBOX_RUNNER_H_
#define RUNBOX_RUNNER_H_

#include <memory>
#include <string>
#include <filesystem>

#include <runbox/execution.h>

// Executes source code inside a worker process. Run never throws; every
// failure is reported through the result.
class Runner {
 public:
  virtual ~Runner() = default;
  virtual ExecutionResult Run(const std::string& source) = 0;
};

// CPython linked into the worker, initialized on first use
std::unique_ptr<Runner> CreateEmbeddedRunner();
// spawns `interpreter <tempfile>.js`; temp files live in scratch_dir
std::unique_ptr<Runner> CreateExternalRunner(
    const std::string& interpreter, const std::filesystem::path& scratch_dir);

#endif  // RUNBOX_RUNNER_H_
