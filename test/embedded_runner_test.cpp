#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "../src/runbox/runner.h"

using ::testing::HasSubstr;
using ::testing::StartsWith;

class EmbeddedRunnerTest : public ::testing::Test {
 protected:
  std::unique_ptr<Runner> runner = CreateEmbeddedRunner();
};

TEST_F(EmbeddedRunnerTest, CapturesStdout) {
  auto res = runner->Run("print('hello')\nprint(1 + 2)");
  EXPECT_TRUE(res.success);
  EXPECT_EQ(res.outcome, Outcome::OK);
  EXPECT_EQ(res.output, "hello\n3\n");
  EXPECT_FALSE(res.error.has_value());
}

TEST_F(EmbeddedRunnerTest, EmptySource) {
  auto res = runner->Run("");
  EXPECT_TRUE(res.success);
  EXPECT_EQ(res.output, "");
  EXPECT_FALSE(res.error.has_value());
}

TEST_F(EmbeddedRunnerTest, StderrOnSuccess) {
  auto res = runner->Run("import sys\nsys.stderr.write('warn')\nprint('x')");
  EXPECT_TRUE(res.success);
  EXPECT_EQ(res.output, "x\n");
  ASSERT_TRUE(res.error.has_value());
  EXPECT_EQ(*res.error, "warn");
}

TEST_F(EmbeddedRunnerTest, ExceptionKeepsPartialOutput) {
  auto res = runner->Run("print('before')\n1/0\nprint('after')");
  EXPECT_FALSE(res.success);
  EXPECT_EQ(res.outcome, Outcome::CODE_ERROR);
  EXPECT_EQ(res.output, "before\n");
  ASSERT_TRUE(res.error.has_value());
  EXPECT_THAT(*res.error, StartsWith("division by zero\n\nTraceback:\n"));
  EXPECT_THAT(*res.error, HasSubstr("Traceback (most recent call last)"));
  EXPECT_THAT(*res.error, HasSubstr("ZeroDivisionError"));
}

TEST_F(EmbeddedRunnerTest, SyntaxError) {
  auto res = runner->Run("def f(:\n  pass");
  EXPECT_FALSE(res.success);
  ASSERT_TRUE(res.error.has_value());
  EXPECT_THAT(*res.error, HasSubstr("SyntaxError"));
}

TEST_F(EmbeddedRunnerTest, FreshGlobalsPerRun) {
  ASSERT_TRUE(runner->Run("leftover = 42").success);
  auto res = runner->Run("print(leftover)");
  EXPECT_FALSE(res.success);
  ASSERT_TRUE(res.error.has_value());
  EXPECT_THAT(*res.error, HasSubstr("NameError"));
  EXPECT_TRUE(runner->Run("assert __name__ == '__main__'").success);
}

TEST_F(EmbeddedRunnerTest, CaptureSurvivesFailedRun) {
  runner->Run("import sys\nsys.stdout = None\nraise RuntimeError('x')");
  auto res = runner->Run("print('still captured')");
  EXPECT_TRUE(res.success);
  EXPECT_EQ(res.output, "still captured\n");
}

TEST_F(EmbeddedRunnerTest, SystemExit) {
  auto clean = runner->Run("import sys\nprint('bye')\nsys.exit()");
  EXPECT_TRUE(clean.success);
  EXPECT_EQ(clean.output, "bye\n");
  EXPECT_TRUE(runner->Run("import sys\nsys.exit(0)").success);

  auto failed = runner->Run("import sys\nsys.exit(3)");
  EXPECT_FALSE(failed.success);
  EXPECT_EQ(failed.outcome, Outcome::CODE_ERROR);
  ASSERT_TRUE(failed.error.has_value());
  EXPECT_THAT(*failed.error, StartsWith("3\n\nTraceback:\n"));
}

TEST_F(EmbeddedRunnerTest, NullByteInSource) {
  auto res = runner->Run(std::string("print(1)\0", 9));
  EXPECT_FALSE(res.success);
  ASSERT_TRUE(res.error.has_value());
  EXPECT_THAT(*res.error, HasSubstr("null bytes"));
}

TEST_F(EmbeddedRunnerTest, NonAsciiOutput) {
  auto res = runner->Run("print('\xe4\xbd\xa0\xe5\xa5\xbd')");
  EXPECT_TRUE(res.success);
  EXPECT_EQ(res.output, "\xe4\xbd\xa0\xe5\xa5\xbd\n");
}

TEST_F(EmbeddedRunnerTest, TracebackLineNumbers) {
  auto res = runner->Run("x = 1\nraise ValueError('on two')");
  EXPECT_FALSE(res.success);
  ASSERT_TRUE(res.error.has_value());
  EXPECT_THAT(*res.error, StartsWith("on two\n\nTraceback:\n"));
  EXPECT_THAT(*res.error, HasSubstr("File \"<string>\", line 2"));
  EXPECT_THAT(*res.error, HasSubstr("ValueError: on two"));
}

TEST_F(EmbeddedRunnerTest, InvalidUtf8IsCodeError) {
  auto res = runner->Run("print('\xff')");
  EXPECT_FALSE(res.success);
  EXPECT_EQ(res.outcome, Outcome::CODE_ERROR);
  ASSERT_TRUE(res.error.has_value());
  EXPECT_THAT(*res.error, HasSubstr("SyntaxError"));
}
