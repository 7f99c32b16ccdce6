#ifndef RUNBOX_WORKER_POOL_H_
#define RUNBOX_WORKER_POOL_H_

#include <mutex>
#include <atomic>
#include <chrono>
#include <string>
#include <vector>
#include <sys/types.h>
#include <condition_variable>

#include "protocol.h"

#define ENUM_DISPATCH_STATUS_ \
  X(FINISHED) \
  X(TIMEOUT) \
  X(CRASHED)
enum class DispatchStatus {
#define X(name) name,
  ENUM_DISPATCH_STATUS_
#undef X
};

struct DispatchResult {
  DispatchStatus status;
  WorkerResponse response; // valid if FINISHED
  std::string message; // diagnostic if not FINISHED
};

// Fixed set of long-lived runbox-worker processes. Each worker leads its own
// process group so that a kill also takes down interpreters it spawned.
class WorkerPool {
 public:
  using Clock = std::chrono::steady_clock;

 private:
  struct Worker {
    std::atomic<pid_t> pid;
    int to_fd; // worker stdin
    int from_fd; // worker stdout
    Worker() : pid(-1), to_fd(-1), from_fd(-1) {}
  };

  // Exclusive use of one worker; returns it to the idle list on destruction.
  class Slot {
    WorkerPool* pool_;
    size_t index_;
   public:
    Slot(WorkerPool* pool, size_t index) : pool_(pool), index_(index) {}
    Slot(Slot&& x) noexcept : pool_(x.pool_), index_(x.index_) { x.pool_ = nullptr; }
    Slot(const Slot&) = delete;
    Slot& operator=(const Slot&) = delete;
    Slot& operator=(Slot&&) = delete;
    ~Slot();
    size_t Index() const { return index_; }
  };

  std::vector<std::string> command_;
  std::vector<Worker> workers_;
  std::vector<size_t> idle_;
  mutable std::mutex mtx_;
  std::condition_variable cv_;
  std::atomic_long respawns_;

  // false with errno set on failure
  bool Spawn_(Worker&);
  // SIGKILL the process group, reap, close pipes; returns the wait status
  int Kill_(Worker&);
  void Respawn_(Worker&);
  DispatchResult Crashed_(Worker&, const std::string& reason);
  Slot Acquire_();
  void Release_(size_t index);
 public:
  // throws std::system_error if a worker cannot be started
  WorkerPool(size_t size, std::vector<std::string> command);
  ~WorkerPool();
  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  // Blocks until a worker is idle, then runs one request on it. The deadline
  // covers the execution only, not the wait for an idle worker.
  // throws std::system_error if a dead worker cannot be respawned
  DispatchResult Dispatch(const WorkerRequest&, std::chrono::milliseconds timeout);

  size_t Size() const { return workers_.size(); }
  size_t IdleCount() const;
  long RespawnCount() const { return respawns_.load(); }
  // current worker pids, -1 for a dead slot
  std::vector<pid_t> Pids() const;
};

const char* DispatchStatusName(DispatchStatus);

#endif  // RUNBOX_WORKER_POOL_H_
