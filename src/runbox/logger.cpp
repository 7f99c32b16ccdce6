#include <runbox/logger.h>

spdlog::level::level_enum VerbosityToLevel(int verbosity) {
  switch (verbosity) {
    case 0: return spdlog::level::warn;
    case 1: return spdlog::level::info;
    default: return spdlog::level::debug;
  }
}

// Forked children exec immediately and never log before that, so the
// console sink mutex needs no pthread_atfork handling.
void InitLogger(const char* pattern, spdlog::level::level_enum level) {
  spdlog::set_pattern(pattern);
  spdlog::set_level(level);
  spdlog::debug("Logger initialized, level={}", spdlog::level::to_string_view(level));
}
