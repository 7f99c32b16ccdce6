#ifndef INCLUDE_RUNBOX_PATHS_H_
#define INCLUDE_RUNBOX_PATHS_H_

#include <filesystem>

namespace fs = std::filesystem;

// temporary source files of the external runner are created here
extern fs::path kScratchRoot;

namespace internal {

// does not meant to be publicly used; only for testing
extern fs::path kDataDir;

} // internal

// the runbox-worker helper binary
fs::path WorkerProgram();

#endif  // INCLUDE_RUNBOX_PATHS_H_
