#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <runbox/executor.h>
#include <runbox/utils.h>

#include "utils.h"
#include "../src/runbox/worker_pool.h"

using ::testing::HasSubstr;
using ::testing::StartsWith;
using namespace std::chrono_literals;

namespace {

struct OutcomeParam {
  const char* name;
  Language lang;
  std::string code;
  bool success;
  Outcome outcome;
  std::string output;
  std::string error_prefix; // empty: no error expected
};

std::string ParamName(const ::testing::TestParamInfo<OutcomeParam>& info) {
  return info.param.name;
}

} // namespace

class ExecutorOutcome : public testing::TestWithParam<OutcomeParam> {
 protected:
  static std::unique_ptr<Executor> executor;
  static void SetUpTestSuite() {
    executor = std::make_unique<Executor>(TestExecutorOptions(2, 1s));
  }
  static void TearDownTestSuite() {
    executor.reset();
  }
};
std::unique_ptr<Executor> ExecutorOutcome::executor;

TEST_P(ExecutorOutcome, Normalized) {
  auto& param = GetParam();
  ExecutionResult res = executor->Execute(ExecutionRequest(param.lang, param.code));
  EXPECT_EQ(res.success, param.success);
  EXPECT_EQ(res.outcome, param.outcome) << OutcomeToDesc(res.outcome);
  EXPECT_EQ(res.output, param.output);
  if (param.error_prefix.empty()) {
    EXPECT_FALSE(res.error.has_value()) << *res.error;
  } else {
    ASSERT_TRUE(res.error.has_value());
    EXPECT_THAT(*res.error, StartsWith(param.error_prefix));
  }
  EXPECT_EQ(executor->Pool().IdleCount(), executor->Pool().Size());
}
INSTANTIATE_TEST_SUITE_P(Python, ExecutorOutcome,
    testing::Values(
      OutcomeParam{"ok", Language::PYTHON3, "print('hi')", true, Outcome::OK, "hi\n", ""},
      OutcomeParam{"stderr", Language::PYTHON3, "import sys\nsys.stderr.write('w')",
                   true, Outcome::OK, "", "w"},
      OutcomeParam{"exception", Language::PYTHON3, "print('a')\nraise ValueError('nope')",
                   false, Outcome::CODE_ERROR, "a\n", "nope\n\nTraceback:\n"},
      OutcomeParam{"timeout", Language::PYTHON3, "print('lost')\nwhile True: pass",
                   false, Outcome::TIMEOUT, "", "execution timed out (>1 seconds)"},
      OutcomeParam{"crash", Language::PYTHON3, "import os\nos._exit(1)",
                   false, Outcome::CRASHED, "", "worker crashed: "},
      OutcomeParam{"unsupported", Language::NUL, "print(1)",
                   false, Outcome::UNSUPPORTED, "", "unsupported language"}
    ),
    ParamName);

TEST(Executor, UnsupportedDoesNotTouchPool) {
  Executor executor(TestExecutorOptions(1, 1s));
  auto pids = executor.Pool().Pids();
  auto res = executor.Execute(ExecutionRequest(Language::NUL, "while True: pass"));
  EXPECT_EQ(res.outcome, Outcome::UNSUPPORTED);
  EXPECT_EQ(executor.Pool().Pids(), pids);
  EXPECT_EQ(executor.Pool().RespawnCount(), 0);
}

TEST(Executor, UnavailableInterpreter) {
  auto opt = TestExecutorOptions(1, 1s);
  opt.node_path = "/nonexistent/node";
  Executor executor(opt);
  EXPECT_TRUE(executor.IsSupported(Language::NODEJS));
  EXPECT_FALSE(executor.IsAvailable(Language::NODEJS));
  EXPECT_TRUE(executor.IsAvailable(Language::PYTHON3));
  auto res = executor.Execute(ExecutionRequest(Language::NODEJS, "console.log(1)"));
  EXPECT_FALSE(res.success);
  EXPECT_EQ(res.outcome, Outcome::UNAVAILABLE);
  ASSERT_TRUE(res.error.has_value());
  EXPECT_EQ(*res.error, "nodejs runtime unavailable");
  // python is unaffected
  EXPECT_TRUE(executor.Execute(ExecutionRequest(Language::PYTHON3, "pass")).success);
}

TEST(Executor, FractionalTimeoutMessage) {
  Executor executor(TestExecutorOptions(1, 500ms));
  auto res = executor.Execute(ExecutionRequest(Language::PYTHON3, "while True: pass"));
  EXPECT_EQ(res.outcome, Outcome::TIMEOUT);
  ASSERT_TRUE(res.error.has_value());
  EXPECT_EQ(*res.error, "execution timed out (>0.5 seconds)");
}

TEST(Executor, NodeThroughPool) {
  SKIP_WITHOUT_NODE();
  Executor executor(TestExecutorOptions(1, 5s));
  ASSERT_TRUE(executor.IsAvailable(Language::NODEJS));
  auto ok = executor.Execute(ExecutionRequest(Language::NODEJS, "console.log([1,2].map(x => x * 2).join(','))"));
  EXPECT_TRUE(ok.success);
  EXPECT_EQ(ok.output, "2,4\n");
  auto failed = executor.Execute(ExecutionRequest(Language::NODEJS, "undefinedFunction()"));
  EXPECT_FALSE(failed.success);
  EXPECT_EQ(failed.outcome, Outcome::CODE_ERROR);
  ASSERT_TRUE(failed.error.has_value());
  EXPECT_THAT(*failed.error, HasSubstr("ReferenceError"));
}

TEST(Executor, NodeTimeout) {
  SKIP_WITHOUT_NODE();
  Executor executor(TestExecutorOptions(1, 1s));
  auto res = executor.Execute(ExecutionRequest(Language::NODEJS, "setInterval(() => {}, 1000);"));
  EXPECT_EQ(res.outcome, Outcome::TIMEOUT);
  EXPECT_EQ(executor.Pool().RespawnCount(), 1);
  auto next = executor.Execute(ExecutionRequest(Language::NODEJS, "console.log('again')"));
  EXPECT_EQ(next.output, "again\n");
}

TEST(Executor, MissingWorkerProgram) {
  auto opt = TestExecutorOptions(1, 1s);
  opt.worker_program = "/nonexistent/runbox-worker";
  EXPECT_THROW(Executor{opt}, std::system_error);
}
