#ifndef RUNBOX_UTILS_H_
#define RUNBOX_UTILS_H_

#include <string>
#include <vector>
#include <filesystem>

#include <runbox/utils.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

// mark every fd >= minfd close-on-exec
int CloexecFrom(int minfd);

// Loop until all bytes are transferred; false on error or EOF
bool ReadFull(int fd, void* buf, size_t len);
bool WriteFull(int fd, const void* buf, size_t len);

std::string DescribeWaitStatus(int status);

struct SpawnResult {
  int sys_errno; // nonzero if the command could not be started
  int status; // raw waitpid status
  std::string out, err;

  SpawnResult() : sys_errno(0), status(0) {}
  bool Exited() const;
  int ExitCode() const; // -1 if killed by a signal
};

// fork & exec the command (PATH lookup), stdin from /dev/null,
//   drain stdout/stderr completely and wait for it to exit
SpawnResult SpawnCapture(const std::vector<std::string>& command);

// RAII temporary file created with mkstemps
class TempFile {
  fs::path path_;
 public:
  TempFile(const fs::path& dir, const std::string& prefix, const std::string& suffix);
  ~TempFile();
  TempFile(const TempFile&) = delete;
  TempFile& operator=(const TempFile&) = delete;

  bool IsValid() const { return !path_.empty(); }
  const fs::path& Path() const { return path_; }
  bool Write(const std::string& content) const;
};

#endif  // RUNBOX_UTILS_H_
