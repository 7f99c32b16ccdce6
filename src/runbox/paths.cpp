#include <runbox/paths.h>

fs::path kScratchRoot = "/tmp";

namespace internal {
fs::path kDataDir = fs::path(RUNBOX_DATA_DIR);
} // internal

fs::path WorkerProgram() {
  return internal::kDataDir / "runbox-worker";
}
