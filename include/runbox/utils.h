#ifndef INCLUDE_RUNBOX_UTILS_H_
#define INCLUDE_RUNBOX_UTILS_H_

#include <string>

#include "execution.h"

long GetUniqueExecutionId();

const char* LanguageName(Language);
// accepts both the wire name and the alias; NUL if unknown
Language GetLanguage(const std::string&);
RunnerKind LanguageRunner(Language);

const char* OutcomeToAbr(Outcome);
const char* OutcomeToDesc(Outcome);

// logging
const char* RunnerKindName(RunnerKind);
// first len bytes, with "..." appended if anything was cut
std::string Truncate(const std::string& str, size_t len);

// cpu_count * 4 clamped into [4, 32]
int DefaultPoolSize(int cpu_count);

#endif  // INCLUDE_RUNBOX_UTILS_H_
