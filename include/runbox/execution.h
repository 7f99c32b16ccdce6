#ifndef INCLUDE_RUNBOX_EXECUTION_H_
#define INCLUDE_RUNBOX_EXECUTION_H_

#include <string>
#include <optional>
#include <utility>

#define ENUM_RUNNER_KIND_ \
  X(EMBEDDED) /* interpreter linked into the worker */ \
  X(EXTERNAL) /* interpreter spawned by the worker */
enum class RunnerKind {
#define X(name) name,
  ENUM_RUNNER_KIND_
#undef X
};

// (enum name, wire name, alias, runner kind)
#define ENUM_LANGUAGE_ \
  X(NUL, "", "", EMBEDDED) \
  X(PYTHON3, "python3", "embedded", EMBEDDED) \
  X(NODEJS, "nodejs", "external", EXTERNAL)
enum class Language {
#define X(name, wire, alias, kind) name,
  ENUM_LANGUAGE_
#undef X
};

#define ENUM_OUTCOME_ \
  X(OK, "OK", "Finished without error") \
  X(CODE_ERROR, "CE", "Submitted code failed") \
  X(TIMEOUT, "TLE", "Execution timed out") \
  X(UNSUPPORTED, "UL", "Unsupported language") \
  X(UNAVAILABLE, "RU", "Runtime unavailable") \
  X(CRASHED, "WC", "Worker crashed") \
  X(INTERNAL_ERROR, "IE", "Internal error")
enum class Outcome {
#define X(name, abr, desc) name,
  ENUM_OUTCOME_
#undef X
};

class ExecutionRequest {
 public:
  Language language;
  std::string source;
  // accepted and forwarded to the worker, but no runner acts on them yet
  std::string preload;
  bool enable_network;

  ExecutionRequest() : language(Language::NUL), enable_network(false) {}
  ExecutionRequest(Language lang, std::string code) :
      language(lang), source(std::move(code)), enable_network(false) {}
};

class ExecutionResult {
 public:
  bool success;
  std::string output; // captured stdout
  std::optional<std::string> error;
  Outcome outcome;

  ExecutionResult() : success(false), outcome(Outcome::INTERNAL_ERROR) {}

  static ExecutionResult Failure(Outcome outcome, std::string error, std::string output = "") {
    ExecutionResult ret;
    ret.outcome = outcome;
    ret.error = std::move(error);
    ret.output = std::move(output);
    return ret;
  }
};

#endif  // INCLUDE_RUNBOX_EXECUTION_H_
