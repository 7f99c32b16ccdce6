#include <atomic>
#include <thread>
#include <vector>
#include <optional>
#include <stdexcept>
#include <gtest/gtest.h>
#include <runbox/admission.h>

TEST(Admission, RejectsOverCeiling) {
  AdmissionController ctrl(2, 1);
  auto t1 = ctrl.TryAdmit();
  auto t2 = ctrl.TryAdmit();
  ASSERT_TRUE(t1 && t2);
  EXPECT_EQ(ctrl.InFlight(), 2);
  EXPECT_FALSE(ctrl.TryAdmit());
  EXPECT_EQ(ctrl.InFlight(), 2);
  t1.reset();
  EXPECT_EQ(ctrl.InFlight(), 1);
  EXPECT_TRUE(ctrl.TryAdmit());
  EXPECT_EQ(ctrl.InFlight(), 1); // the temporary ticket is gone already
}

TEST(Admission, MovedTicketReleasesOnce) {
  AdmissionController ctrl(5, 1);
  {
    auto ticket = ctrl.TryAdmit();
    ASSERT_TRUE(ticket);
    AdmissionTicket moved = std::move(*ticket);
    ticket.reset();
    EXPECT_EQ(ctrl.InFlight(), 1);
  }
  EXPECT_EQ(ctrl.InFlight(), 0);
}

TEST(Admission, SlotReleasedOnException) {
  AdmissionController ctrl(5, 1);
  auto ticket = ctrl.TryAdmit();
  ASSERT_TRUE(ticket);
  try {
    RunningGuard guard = ticket->AwaitSlot();
    EXPECT_EQ(ctrl.Running(), 1);
    throw std::runtime_error("boom");
  } catch (const std::runtime_error&) {}
  EXPECT_EQ(ctrl.Running(), 0);
  RunningGuard again = ticket->AwaitSlot(); // would block forever if leaked
  EXPECT_EQ(ctrl.Running(), 1);
}

TEST(Admission, RunningNeverExceedsSemaphore) {
  constexpr size_t kSlots = 3;
  constexpr int kThreads = 16;
  AdmissionController ctrl(kThreads, kSlots);
  std::atomic<size_t> peak = 0;
  std::atomic<int> rejected = 0;
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; i++) {
    threads.emplace_back([&]() {
      auto ticket = ctrl.TryAdmit();
      if (!ticket) {
        rejected++;
        return;
      }
      RunningGuard guard = ticket->AwaitSlot();
      size_t now = ctrl.Running();
      size_t prev = peak.load();
      while (now > prev && !peak.compare_exchange_weak(prev, now));
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    });
  }
  for (auto& t : threads) t.join();
  EXPECT_EQ(rejected.load(), 0);
  EXPECT_LE(peak.load(), kSlots);
  EXPECT_GE(peak.load(), 1);
  EXPECT_EQ(ctrl.InFlight(), 0);
  EXPECT_EQ(ctrl.Running(), 0);
}

TEST(Admission, ConcurrentCeiling) {
  constexpr size_t kCeiling = 4;
  AdmissionController ctrl(kCeiling, 1);
  std::atomic<int> admitted = 0;
  std::vector<std::optional<AdmissionTicket>> tickets(32);
  std::vector<std::thread> threads;
  for (size_t i = 0; i < tickets.size(); i++) {
    threads.emplace_back([&, i]() {
      auto ticket = ctrl.TryAdmit();
      if (!ticket) return;
      tickets[i].emplace(std::move(*ticket));
      admitted++;
    });
  }
  for (auto& t : threads) t.join();
  EXPECT_EQ(admitted.load(), (int)kCeiling);
  EXPECT_EQ(ctrl.InFlight(), kCeiling);
  tickets.clear();
  EXPECT_EQ(ctrl.InFlight(), 0);
}

TEST(Semaphore, TryAcquire) {
  Semaphore sem(1);
  EXPECT_TRUE(sem.TryAcquire());
  EXPECT_FALSE(sem.TryAcquire());
  sem.Release();
  EXPECT_EQ(sem.Available(), 1);
}
