#include "worker_pool.h"

#include <poll.h>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cerrno>
#include <climits>
#include <cstring>
#include <system_error>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "utils.h"

namespace {

enum class ReadStatus { OK, TIMEOUT, CLOSED };

ReadStatus ReadUntil(int fd, void* buf, size_t len, WorkerPool::Clock::time_point deadline) {
  char* ptr = static_cast<char*>(buf);
  while (len) {
    auto now = WorkerPool::Clock::now();
    if (now >= deadline) return ReadStatus::TIMEOUT;
    long remain = std::chrono::ceil<std::chrono::milliseconds>(deadline - now).count();
    struct pollfd pfd = {fd, POLLIN, 0};
    int ret = poll(&pfd, 1, remain > INT_MAX ? INT_MAX : (int)remain);
    if (ret < 0) {
      if (errno == EINTR) continue;
      spdlog::warn("poll error: errno={} {}", errno, strerror(errno));
      return ReadStatus::CLOSED;
    }
    if (ret == 0) continue;
    ssize_t n = read(fd, ptr, len);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) return ReadStatus::CLOSED;
    ptr += n;
    len -= n;
  }
  return ReadStatus::OK;
}

} // namespace

#define X(name) case DispatchStatus::name: return #name;
const char* DispatchStatusName(DispatchStatus status) {
  switch (status) {
    ENUM_DISPATCH_STATUS_
  }
  __builtin_unreachable();
}
#undef X

WorkerPool::Slot::~Slot() {
  if (pool_) pool_->Release_(index_);
}

WorkerPool::WorkerPool(size_t size, std::vector<std::string> command) :
    command_(std::move(command)), workers_(size), respawns_(0) {
  // a dead worker must show up as EPIPE instead of killing the daemon
  signal(SIGPIPE, SIG_IGN);
  for (size_t i = 0; i < workers_.size(); i++) {
    if (!Spawn_(workers_[i])) {
      int err = errno;
      for (auto& w : workers_) Kill_(w);
      throw std::system_error(err, std::generic_category(),
          "failed to start " + (command_.empty() ? std::string("worker") : command_[0]));
    }
    idle_.push_back(i);
  }
  spdlog::info("Worker pool started: {} workers, command {}", workers_.size(), fmt::format("{}", command_));
}

WorkerPool::~WorkerPool() {
  for (auto& w : workers_) Kill_(w);
  spdlog::info("Worker pool stopped");
}

bool WorkerPool::Spawn_(Worker& w) {
  if (command_.empty()) {
    errno = EINVAL;
    return false;
  }
  // build argv before fork; the child may only make async-signal-safe calls
  std::vector<char*> argv;
  for (auto& i : command_) argv.push_back(const_cast<char*>(i.c_str()));
  argv.push_back(nullptr);

  int inpipe[2] = {-1, -1}, outpipe[2] = {-1, -1}, execpipe[2] = {-1, -1};
  auto CloseFds = [](std::initializer_list<int> fds) {
    int err = errno;
    for (int fd : fds) if (fd >= 0) close(fd);
    errno = err;
  };
  if (pipe2(inpipe, O_CLOEXEC) < 0 || pipe2(outpipe, O_CLOEXEC) < 0 ||
      pipe2(execpipe, O_CLOEXEC) < 0) {
    CloseFds({inpipe[0], inpipe[1], outpipe[0], outpipe[1], execpipe[0], execpipe[1]});
    return false;
  }
  pid_t pid = fork();
  if (pid < 0) {
    CloseFds({inpipe[0], inpipe[1], outpipe[0], outpipe[1], execpipe[0], execpipe[1]});
    return false;
  }
  if (pid == 0) {
    setpgid(0, 0);
    signal(SIGPIPE, SIG_DFL);
    if (CloexecFrom(3) >= 0 && dup2(inpipe[0], 0) >= 0 && dup2(outpipe[1], 1) >= 0) {
      execv(argv[0], argv.data());
    }
    int err = errno;
    IGNORE_RETURN(write(execpipe[1], &err, sizeof(err)));
    _exit(127);
  }
  // also set from the parent so that the group exists before anyone kills it
  if (setpgid(pid, pid) < 0 && errno != EACCES) {
    spdlog::debug("setpgid {} failed: errno={} {}", pid, errno, strerror(errno));
  }
  CloseFds({inpipe[0], outpipe[1], execpipe[1]});

  int exec_errno = 0;
  ssize_t n;
  while ((n = read(execpipe[0], &exec_errno, sizeof(exec_errno))) < 0 && errno == EINTR);
  CloseFds({execpipe[0]});
  if (n == sizeof(exec_errno)) {
    spdlog::error("exec {} failed: errno={} {}", command_[0], exec_errno, strerror(exec_errno));
    while (waitpid(pid, nullptr, 0) < 0 && errno == EINTR);
    CloseFds({inpipe[1], outpipe[0]});
    errno = exec_errno;
    return false;
  }
  w.to_fd = inpipe[1];
  w.from_fd = outpipe[0];
  w.pid = pid;
  spdlog::debug("Spawned worker pid={}", pid);
  return true;
}

int WorkerPool::Kill_(Worker& w) {
  pid_t pid = w.pid.exchange(-1);
  if (w.to_fd >= 0) close(w.to_fd);
  if (w.from_fd >= 0) close(w.from_fd);
  w.to_fd = w.from_fd = -1;
  int status = 0;
  if (pid <= 0) return status;
  if (kill(-pid, SIGKILL) < 0 && errno != ESRCH) {
    spdlog::warn("kill worker group {} failed: errno={} {}", pid, errno, strerror(errno));
  }
  while (waitpid(pid, &status, 0) < 0) {
    if (errno == EINTR) continue;
    spdlog::warn("waitpid {} failed: errno={} {}", pid, errno, strerror(errno));
    break;
  }
  spdlog::debug("Reaped worker pid={}: {}", pid, DescribeWaitStatus(status));
  return status;
}

void WorkerPool::Respawn_(Worker& w) {
  if (!Spawn_(w)) {
    // retried at the next acquisition of this slot
    spdlog::error("Failed to respawn worker: errno={} {}", errno, strerror(errno));
    return;
  }
  respawns_++;
}

DispatchResult WorkerPool::Crashed_(Worker& w, const std::string& reason) {
  pid_t pid = w.pid;
  int status = Kill_(w);
  DispatchResult ret{DispatchStatus::CRASHED, {}, reason + ", worker " + DescribeWaitStatus(status)};
  spdlog::warn("Worker pid={} crashed: {}", pid, ret.message);
  Respawn_(w);
  return ret;
}

WorkerPool::Slot WorkerPool::Acquire_() {
  std::unique_lock lck(mtx_);
  cv_.wait(lck, [this]() { return !idle_.empty(); });
  size_t index = idle_.back();
  idle_.pop_back();
  return Slot(this, index);
}

void WorkerPool::Release_(size_t index) {
  {
    std::lock_guard lck(mtx_);
    idle_.push_back(index);
  }
  cv_.notify_one();
}

DispatchResult WorkerPool::Dispatch(const WorkerRequest& req, std::chrono::milliseconds timeout) {
  Slot slot = Acquire_();
  Worker& w = workers_[slot.Index()];
  if (w.pid < 0) {
    if (!Spawn_(w)) {
      throw std::system_error(errno, std::generic_category(), "failed to respawn " + command_[0]);
    }
    respawns_++;
  }
  auto deadline = Clock::now() + timeout;
  if (!WriteFrame(w.to_fd, req.Serialize())) return Crashed_(w, "failed to send request");

  long size = 0;
  std::vector<uint8_t> payload;
  ReadStatus status = ReadUntil(w.from_fd, &size, sizeof(size), deadline);
  if (status == ReadStatus::OK) {
    if (size < 0 || size > kMaxFrameSize) return Crashed_(w, "malformed response frame");
    payload.resize(size);
    status = ReadUntil(w.from_fd, payload.data(), size, deadline);
  }
  if (status == ReadStatus::TIMEOUT) {
    pid_t pid = w.pid;
    Kill_(w);
    spdlog::info("Worker pid={} killed after {} ms", pid, timeout.count());
    Respawn_(w);
    return {DispatchStatus::TIMEOUT, {}, "deadline exceeded"};
  }
  if (status == ReadStatus::CLOSED) return Crashed_(w, "worker closed the pipe");
  try {
    return {DispatchStatus::FINISHED, WorkerResponse(payload), ""};
  } catch (const std::out_of_range& e) {
    return Crashed_(w, std::string("malformed response: ") + e.what());
  }
}

size_t WorkerPool::IdleCount() const {
  std::lock_guard lck(mtx_);
  return idle_.size();
}

std::vector<pid_t> WorkerPool::Pids() const {
  std::vector<pid_t> ret;
  for (auto& w : workers_) ret.push_back(w.pid.load());
  return ret;
}
