#ifndef INCLUDE_RUNBOX_ADMISSION_H_
#define INCLUDE_RUNBOX_ADMISSION_H_

#include <mutex>
#include <atomic>
#include <optional>
#include <condition_variable>

// Counting semaphore; waiters are woken in no particular order.
class Semaphore {
  mutable std::mutex mtx_;
  std::condition_variable cv_;
  size_t available_;
 public:
  explicit Semaphore(size_t count) : available_(count) {}
  Semaphore(const Semaphore&) = delete;
  Semaphore& operator=(const Semaphore&) = delete;

  void Acquire();
  bool TryAcquire();
  void Release();
  size_t Available() const;
};

class AdmissionController;

// Holds one semaphore unit; released on destruction.
class RunningGuard {
  AdmissionController* controller_;
 public:
  explicit RunningGuard(AdmissionController* controller) : controller_(controller) {}
  RunningGuard(RunningGuard&& x) noexcept : controller_(x.controller_) { x.controller_ = nullptr; }
  RunningGuard(const RunningGuard&) = delete;
  RunningGuard& operator=(const RunningGuard&) = delete;
  RunningGuard& operator=(RunningGuard&&) = delete;
  ~RunningGuard();
};

// One accepted, not yet completed request. Counts against the in-flight
// ceiling for as long as it exists.
class AdmissionTicket {
  AdmissionController* controller_;
 public:
  explicit AdmissionTicket(AdmissionController* controller) : controller_(controller) {}
  AdmissionTicket(AdmissionTicket&& x) noexcept : controller_(x.controller_) { x.controller_ = nullptr; }
  AdmissionTicket(const AdmissionTicket&) = delete;
  AdmissionTicket& operator=(const AdmissionTicket&) = delete;
  AdmissionTicket& operator=(AdmissionTicket&&) = delete;
  ~AdmissionTicket();

  // Blocks until a running slot is free.
  RunningGuard AwaitSlot();
};

// Two-tier gate: an in-flight ceiling that rejects, and a concurrency
// semaphore (sized to the worker pool) that queues.
class AdmissionController {
  const size_t max_requests_;
  std::atomic<size_t> in_flight_;
  std::atomic<size_t> running_;
  Semaphore semaphore_;

  friend class AdmissionTicket;
  friend class RunningGuard;
  void ReleaseTicket();
  void ReleaseSlot();
 public:
  AdmissionController(size_t max_requests, size_t max_running) :
      max_requests_(max_requests), in_flight_(0), running_(0), semaphore_(max_running) {}

  // Returns nullopt immediately if the ceiling is reached.
  std::optional<AdmissionTicket> TryAdmit();

  size_t MaxRequests() const { return max_requests_; }
  size_t InFlight() const { return in_flight_.load(); }
  size_t Running() const { return running_.load(); }
};

#endif  // INCLUDE_RUNBOX_ADMISSION_H_
