#ifndef INCLUDE_RUNBOX_LOGGER_H_
#define INCLUDE_RUNBOX_LOGGER_H_

#include <spdlog/spdlog.h>

// 0 = warn, 1 = info, 2+ = debug
spdlog::level::level_enum VerbosityToLevel(int verbosity);

void InitLogger(const char* pattern, spdlog::level::level_enum level);

#endif  // INCLUDE_RUNBOX_LOGGER_H_
