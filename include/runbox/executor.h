#ifndef INCLUDE_RUNBOX_EXECUTOR_H_
#define INCLUDE_RUNBOX_EXECUTOR_H_

#include <chrono>
#include <memory>
#include <string>
#include <filesystem>
#include <unordered_map>

#include "execution.h"
#include "admission.h"

class WorkerPool;

struct ExecutorOptions {
  size_t pool_size;
  std::chrono::milliseconds timeout;
  // interpreter of the external runner; looked up in PATH if not absolute
  std::string node_path;
  std::filesystem::path worker_program; // empty = WorkerProgram()
  std::filesystem::path scratch_dir; // empty = kScratchRoot

  ExecutorOptions() :
      pool_size(4),
      timeout(std::chrono::seconds(30)),
      node_path("node") {}
};

// Public entry point of the engine. Execute never throws: every failure,
// including plumbing errors, comes back as an ExecutionResult.
class Executor {
  ExecutorOptions opt_;
  std::unique_ptr<WorkerPool> pool_;
  std::unordered_map<int, bool> available_; // (int)Language -> probe result

  ExecutionResult Dispatch_(long id, const ExecutionRequest&);
 public:
  explicit Executor(const ExecutorOptions&);
  ~Executor();
  Executor(const Executor&) = delete;
  Executor& operator=(const Executor&) = delete;

  ExecutionResult Execute(const ExecutionRequest&);

  bool IsSupported(Language) const;
  bool IsAvailable(Language) const;
  // only for monitoring and tests
  const WorkerPool& Pool() const { return *pool_; }
};

#define ENUM_ENGINE_STATUS_ \
  X(ACCEPTED) \
  X(OVERLOADED) \
  X(UNSUPPORTED)
enum class EngineStatus {
#define X(name) name,
  ENUM_ENGINE_STATUS_
#undef X
};

struct EngineResponse {
  EngineStatus status;
  ExecutionResult result; // left default if OVERLOADED
};

// Admission control in front of an Executor.
class Engine {
  AdmissionController admission_;
  Executor executor_;
 public:
  Engine(const ExecutorOptions& opt, size_t max_requests) :
      admission_(max_requests, opt.pool_size), executor_(opt) {}

  EngineResponse Run(const ExecutionRequest&);

  const AdmissionController& Admission() const { return admission_; }
};

#endif  // INCLUDE_RUNBOX_EXECUTOR_H_
