#include <pybind11/embed.h>

#include "runner.h"

#include <spdlog/spdlog.h>

namespace py = pybind11;

namespace {

// str(obj) as UTF-8; lone surrogates are replaced
std::string ToString(const py::handle& obj) {
  if (!obj) return "";
  try {
    return py::str(obj).attr("encode")("utf-8", "replace").cast<std::string>();
  } catch (const py::error_already_set&) {
    return "<unprintable object>";
  }
}

// Swaps sys.stdout / sys.stderr for io.StringIO objects; the originals are
// put back on destruction no matter how the run ended.
class StreamCapture {
  py::module_ sys_;
  py::object out_, err_;
  py::object old_out_, old_err_;
 public:
  StreamCapture() : sys_(py::module_::import("sys")) {
    py::object string_io = py::module_::import("io").attr("StringIO");
    out_ = string_io();
    err_ = string_io();
    old_out_ = sys_.attr("stdout");
    old_err_ = sys_.attr("stderr");
    sys_.attr("stdout") = out_;
    sys_.attr("stderr") = err_;
  }
  ~StreamCapture() {
    try {
      sys_.attr("stdout") = old_out_;
      sys_.attr("stderr") = old_err_;
    } catch (const py::error_already_set& e) {
      spdlog::error("Failed to restore sys.stdout / sys.stderr: {}", e.what());
    }
  }
  StreamCapture(const StreamCapture&) = delete;
  StreamCapture& operator=(const StreamCapture&) = delete;

  std::string Stdout() const { return ToString(out_.attr("getvalue")()); }
  std::string Stderr() const { return ToString(err_.attr("getvalue")()); }
};

// SystemExit(None) and SystemExit(0) are clean exits
bool IsCleanExit(const py::error_already_set& e) {
  if (!e.matches(PyExc_SystemExit)) return false;
  try {
    py::object code = e.value().attr("code");
    return code.is_none() || (py::isinstance<py::int_>(code) && code.equal(py::int_(0)));
  } catch (const py::error_already_set&) {
    return false;
  }
}

// str(e) + traceback, the message format callers see
std::string Describe(const py::error_already_set& e) {
  std::string trace;
  try {
    py::object tb = e.trace() ? e.trace() : py::object(py::none());
    py::list lines = py::module_::import("traceback").attr("format_exception")(e.type(), e.value(), tb);
    trace = ToString(py::str("").attr("join")(lines));
  } catch (const py::error_already_set&) {
    trace = ToString(e.type()) + "\n";
  }
  return ToString(e.value()) + "\n\nTraceback:\n" + trace;
}

class EmbeddedRunner : public Runner {
  bool initialized_;

  bool EnsureInitialized_() {
    if (initialized_) return true;
    try {
      // no signal handlers: SIGINT / SIGTERM keep their default meaning
      if (!Py_IsInitialized()) py::initialize_interpreter(false);
      initialized_ = true;
      spdlog::info("Python {} initialized", ToString(py::module_::import("sys").attr("version")));
    } catch (const std::exception& e) {
      spdlog::error("Python initialization failed: {}", e.what());
    }
    return initialized_;
  }

  static ExecutionResult Succeeded_(const StreamCapture& capture) {
    ExecutionResult ret;
    ret.success = true;
    ret.outcome = Outcome::OK;
    ret.output = capture.Stdout();
    std::string err = capture.Stderr();
    if (!err.empty()) ret.error = std::move(err);
    return ret;
  }

  // throws py::error_already_set only if the capture or globals cannot be set up
  static ExecutionResult Execute_(const std::string& source) {
    StreamCapture capture;
    py::module_ builtins = py::module_::import("builtins");
    py::dict globals;
    globals["__builtins__"] = builtins;
    globals["__name__"] = "__main__";
    try {
      // bytes: compile decodes them as UTF-8 and reports bad input as SyntaxError
      py::object code = builtins.attr("compile")(py::bytes(source), "<string>", "exec");
      builtins.attr("exec")(code, globals);
    } catch (const py::error_already_set& e) {
      if (IsCleanExit(e)) return Succeeded_(capture);
      spdlog::info("Python code raised: {}", ToString(e.value()));
      return ExecutionResult::Failure(Outcome::CODE_ERROR, Describe(e), capture.Stdout());
    }
    return Succeeded_(capture);
  }
 public:
  EmbeddedRunner() : initialized_(false) {}
  // No finalize_interpreter: it blocks on threads left behind by submitted code.

  ExecutionResult Run(const std::string& source) override {
    if (source.empty()) {
      ExecutionResult ret;
      ret.success = true;
      ret.outcome = Outcome::OK;
      return ret;
    }
    if (source.find('\0') != std::string::npos) {
      return ExecutionResult::Failure(Outcome::CODE_ERROR, "source code string cannot contain null bytes");
    }
    if (!EnsureInitialized_()) {
      return ExecutionResult::Failure(Outcome::UNAVAILABLE, "python runtime unavailable");
    }
    try {
      return Execute_(source);
    } catch (const py::error_already_set& e) {
      spdlog::error("Failed to set up python execution: {}", e.what());
      return ExecutionResult::Failure(Outcome::INTERNAL_ERROR,
          std::string("failed to set up execution: ") + e.what());
    }
  }
};

} // namespace

std::unique_ptr<Runner> CreateEmbeddedRunner() {
  return std::make_unique<EmbeddedRunner>();
}
