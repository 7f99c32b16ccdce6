#include "utils.h"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <algorithm>

#include <spdlog/spdlog.h>

namespace {

std::atomic_long execution_id_seq = 0;

} // namespace

long GetUniqueExecutionId() {
  return ++execution_id_seq;
}

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG1(cls, x, ...) case cls::x: return #x;
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;
#define X_RETURN_ARG3(cls, x, y, z, ...) case cls::x: return z;

#define X(...) X_RETURN_ARG2(Outcome, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* OutcomeToAbr, Outcome, ENUM_OUTCOME_)
#undef X

#define X(...) X_RETURN_ARG3(Outcome, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* OutcomeToDesc, Outcome, ENUM_OUTCOME_)
#undef X

#define X(...) X_RETURN_ARG1(RunnerKind, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* RunnerKindName, RunnerKind, ENUM_RUNNER_KIND_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG1
#undef X_RETURN_ARG2
#undef X_RETURN_ARG3

static const char* kLanguageNameTable[] = {
#define X(name, wire, alias, kind) wire,
  ENUM_LANGUAGE_
#undef X
};

static const char* kLanguageAliasTable[] = {
#define X(name, wire, alias, kind) alias,
  ENUM_LANGUAGE_
#undef X
};

static const RunnerKind kLanguageRunnerTable[] = {
#define X(name, wire, alias, kind) RunnerKind::kind,
  ENUM_LANGUAGE_
#undef X
};

const char* LanguageName(Language lang) {
  return kLanguageNameTable[(int)lang];
}

Language GetLanguage(const std::string& str) {
  constexpr size_t kNum = sizeof(kLanguageNameTable) / sizeof(kLanguageNameTable[0]);
  for (size_t i = (size_t)Language::NUL + 1; i < kNum; i++) {
    if (str == kLanguageNameTable[i] || str == kLanguageAliasTable[i]) return (Language)i;
  }
  return Language::NUL;
}

RunnerKind LanguageRunner(Language lang) {
  return kLanguageRunnerTable[(int)lang];
}

int DefaultPoolSize(int cpu_count) {
  return std::clamp(cpu_count * 4, 4, 32);
}

int CloexecFrom(int minfd) {
  // async-signal-safe, usable between fork and exec
  return close_range(minfd, ~0U, CLOSE_RANGE_CLOEXEC);
}

bool ReadFull(int fd, void* buf, size_t len) {
  char* ptr = static_cast<char*>(buf);
  while (len) {
    ssize_t n = read(fd, ptr, len);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) return false;
    ptr += n;
    len -= n;
  }
  return true;
}

bool WriteFull(int fd, const void* buf, size_t len) {
  const char* ptr = static_cast<const char*>(buf);
  while (len) {
    ssize_t n = write(fd, ptr, len);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) return false;
    ptr += n;
    len -= n;
  }
  return true;
}

std::string Truncate(const std::string& str, size_t len) {
  if (str.size() <= len) return str;
  return str.substr(0, len) + "...";
}

std::string DescribeWaitStatus(int status) {
  if (WIFEXITED(status)) return "exited with code " + std::to_string(WEXITSTATUS(status));
  if (WIFSIGNALED(status)) {
    int sig = WTERMSIG(status);
    return "killed by signal " + std::to_string(sig) + " (" + strsignal(sig) + ")";
  }
  return "unknown status " + std::to_string(status);
}

bool SpawnResult::Exited() const {
  return sys_errno == 0 && WIFEXITED(status);
}

int SpawnResult::ExitCode() const {
  return Exited() ? WEXITSTATUS(status) : -1;
}

SpawnResult SpawnCapture(const std::vector<std::string>& command) {
  SpawnResult ret;
  if (command.empty()) {
    ret.sys_errno = EINVAL;
    return ret;
  }
  // build argv before fork; the child may only make async-signal-safe calls
  std::vector<char*> argv;
  for (auto& i : command) argv.push_back(const_cast<char*>(i.c_str()));
  argv.push_back(nullptr);

  int outpipe[2] = {-1, -1}, errpipe[2] = {-1, -1}, execpipe[2] = {-1, -1};
  auto CloseFds = [](std::initializer_list<int> fds) {
    for (int fd : fds) if (fd >= 0) close(fd);
  };
  if (pipe2(outpipe, O_CLOEXEC) < 0 || pipe2(errpipe, O_CLOEXEC) < 0 ||
      pipe2(execpipe, O_CLOEXEC) < 0) {
    ret.sys_errno = errno;
    CloseFds({outpipe[0], outpipe[1], errpipe[0], errpipe[1], execpipe[0], execpipe[1]});
    return ret;
  }
  pid_t pid = fork();
  if (pid < 0) {
    ret.sys_errno = errno;
    CloseFds({outpipe[0], outpipe[1], errpipe[0], errpipe[1], execpipe[0], execpipe[1]});
    return ret;
  }
  if (pid == 0) {
    signal(SIGPIPE, SIG_DFL);
    int devnull = open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devnull >= 0 && CloexecFrom(3) >= 0 && dup2(devnull, 0) >= 0 &&
        dup2(outpipe[1], 1) >= 0 && dup2(errpipe[1], 2) >= 0) {
      execvp(argv[0], argv.data());
    }
    int err = errno;
    IGNORE_RETURN(write(execpipe[1], &err, sizeof(err)));
    _exit(127);
  }
  CloseFds({outpipe[1], errpipe[1], execpipe[1]});

  // execpipe is closed by exec on success, so read() returns 0
  int exec_errno = 0;
  ssize_t n;
  while ((n = read(execpipe[0], &exec_errno, sizeof(exec_errno))) < 0 && errno == EINTR);
  close(execpipe[0]);
  if (n == sizeof(exec_errno)) {
    spdlog::debug("exec {} failed: errno={} {}", command[0], exec_errno, strerror(exec_errno));
    CloseFds({outpipe[0], errpipe[0]});
    while (waitpid(pid, &ret.status, 0) < 0 && errno == EINTR);
    ret.sys_errno = exec_errno;
    return ret;
  }

  std::string* bufs[2] = {&ret.out, &ret.err};
  struct pollfd fds[2] = {{outpipe[0], POLLIN, 0}, {errpipe[0], POLLIN, 0}};
  int open_count = 2;
  char buf[65536];
  while (open_count) {
    if (poll(fds, 2, -1) < 0) {
      if (errno == EINTR) continue;
      spdlog::warn("poll error: errno={} {}", errno, strerror(errno));
      break;
    }
    for (int i = 0; i < 2; i++) {
      if (fds[i].fd < 0 || !fds[i].revents) continue;
      ssize_t len = read(fds[i].fd, buf, sizeof(buf));
      if (len > 0) {
        bufs[i]->append(buf, len);
      } else if (len == 0 || errno != EINTR) {
        close(fds[i].fd);
        fds[i].fd = -1;
        open_count--;
      }
    }
  }
  CloseFds({fds[0].fd, fds[1].fd});
  while (waitpid(pid, &ret.status, 0) < 0 && errno == EINTR);
  spdlog::debug("Spawned {} pid={} {}, stdout={}B stderr={}B",
                command[0], pid, DescribeWaitStatus(ret.status), ret.out.size(), ret.err.size());
  return ret;
}

TempFile::TempFile(const fs::path& dir, const std::string& prefix, const std::string& suffix) {
  std::string tmpl = (dir / (prefix + "XXXXXX" + suffix)).string();
  int fd = mkstemps(tmpl.data(), suffix.size());
  if (fd < 0) {
    spdlog::warn("mkstemps {} failed: errno={} {}", tmpl, errno, strerror(errno));
    return;
  }
  close(fd);
  path_ = tmpl;
}

TempFile::~TempFile() {
  if (path_.empty()) return;
  std::error_code ec;
  fs::remove(path_, ec);
  if (ec) spdlog::warn("Failed to remove {}: {}", path_.string(), ec.message());
}

bool TempFile::Write(const std::string& content) const {
  if (path_.empty()) return false;
  std::ofstream fout(path_, std::ios::binary | std::ios::trunc);
  fout.write(content.data(), content.size());
  return bool(fout);
}
