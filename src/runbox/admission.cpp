#include <runbox/admission.h>

#include <spdlog/spdlog.h>

void Semaphore::Acquire() {
  std::unique_lock lck(mtx_);
  cv_.wait(lck, [this]() { return available_ > 0; });
  available_--;
}

bool Semaphore::TryAcquire() {
  std::lock_guard lck(mtx_);
  if (!available_) return false;
  available_--;
  return true;
}

void Semaphore::Release() {
  {
    std::lock_guard lck(mtx_);
    available_++;
  }
  cv_.notify_one();
}

size_t Semaphore::Available() const {
  std::lock_guard lck(mtx_);
  return available_;
}

RunningGuard::~RunningGuard() {
  if (controller_) controller_->ReleaseSlot();
}

AdmissionTicket::~AdmissionTicket() {
  if (controller_) controller_->ReleaseTicket();
}

RunningGuard AdmissionTicket::AwaitSlot() {
  controller_->semaphore_.Acquire();
  controller_->running_++;
  return RunningGuard(controller_);
}

std::optional<AdmissionTicket> AdmissionController::TryAdmit() {
  size_t cur = in_flight_.load();
  do {
    if (cur >= max_requests_) {
      spdlog::info("Admission rejected: {} requests in flight", cur);
      return std::nullopt;
    }
  } while (!in_flight_.compare_exchange_weak(cur, cur + 1));
  return AdmissionTicket(this);
}

void AdmissionController::ReleaseTicket() {
  in_flight_--;
}

void AdmissionController::ReleaseSlot() {
  running_--;
  semaphore_.Release();
}
