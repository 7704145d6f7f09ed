#include <fcntl.h>
#include <unistd.h>
#include <cstdio>
#include "common/exceptions.hpp"
#include "config.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "judge/judger.hpp"

using namespace std;
using namespace judgebox;
using ::testing::HasSubstr;

TEST(JudgerTest, ExactJudgerTest) {
    exact_judger judger;
    EXPECT_TRUE(judger.judge(0, "1\n", "hello world", "hello world"));
    EXPECT_FALSE(judger.judge(0, "1\n", "hello world", "hello  world"));
    EXPECT_FALSE(judger.judge(0, "1\n", "1", ""));
}

TEST(JudgerTest, MakeJudgerTest) {
    EXPECT_NE(dynamic_cast<exact_judger *>(make_judger(nullopt).get()), nullptr);
    EXPECT_NE(dynamic_cast<exact_judger *>(make_judger(string()).get()), nullptr);
    EXPECT_NE(dynamic_cast<python_judger *>(make_judger(string("def judge(i, a, b, c): return True")).get()), nullptr);
}

TEST(JudgerTest, PythonJudgerTest) {
    auto judger = python_judger::load(R"(
def judge(index, input, expected_output, actual_output):
    return sorted(expected_output.split()) == sorted(actual_output.split())
)");
    EXPECT_TRUE(judger->judge(0, "\n", "1 2 3", "3 2 1"));
    EXPECT_FALSE(judger->judge(1, "\n", "1 2 3", "3 2"));
}

TEST(JudgerTest, PythonJudgerArgumentsTest) {
    auto judger = python_judger::load(R"(
def judge(index, input, expected_output, actual_output):
    return index == 2 and input == "in\n" and expected_output == "exp" and actual_output == "act"
)");
    EXPECT_TRUE(judger->judge(2, "in\n", "exp", "act"));
    EXPECT_FALSE(judger->judge(1, "in\n", "exp", "act"));
}

TEST(JudgerTest, FreshNamespaceTest) {
    auto first = python_judger::load(R"(
counter = 0
def judge(index, input, expected_output, actual_output):
    global counter
    counter += 1
    return counter == 1
)");
    EXPECT_TRUE(first->judge(0, "", "", ""));
    EXPECT_FALSE(first->judge(1, "", "", ""));

    auto second = python_judger::load("def judge(i, a, b, c): return 'counter' not in globals()");
    EXPECT_TRUE(second->judge(0, "", "", ""));
}

TEST(JudgerTest, MissingJudgeTest) {
    EXPECT_THROW(python_judger::load("def compare(a, b): return True"), judger_error);
}

TEST(JudgerTest, NotCallableTest) {
    EXPECT_THROW(python_judger::load("judge = 42"), judger_error);
}

TEST(JudgerTest, SyntaxErrorTest) {
    try {
        python_judger::load("def judge(:");
        FAIL() << "expected judger_error";
    } catch (judger_error &e) {
        EXPECT_THAT(e.what(), HasSubstr("SyntaxError"));
    }
}

TEST(JudgerTest, RaisingJudgeTest) {
    auto judger = python_judger::load("def judge(i, a, b, c): raise ValueError('broken')");
    try {
        judger->judge(0, "", "", "");
        FAIL() << "expected judger_error";
    } catch (judger_error &e) {
        EXPECT_THAT(e.what(), HasSubstr("ValueError: broken"));
    }
}

TEST(JudgerTest, NonBoolResultTest) {
    auto judger = python_judger::load("def judge(i, a, b, c): return 1");
    EXPECT_THROW(judger->judge(0, "", "", ""), judger_error);
}

TEST(JudgerTest, InvalidUtf8OutputTest) {
    auto judger = python_judger::load("def judge(i, a, b, c): return True");
    EXPECT_THROW(judger->judge(0, "", "", "\xff\xfe"), judger_error);
}

TEST(JudgerTest, ValidateJudgerTest) {
    EXPECT_EQ(validate_judger("def judge(index, input, expected, actual): return expected == actual"), nullopt);
    EXPECT_EQ(validate_judger("def judge(*args): return True"), nullopt);
}

TEST(JudgerTest, ValidateJudgerFailureTest) {
    EXPECT_NE(validate_judger("x = 1"), nullopt);
    EXPECT_NE(validate_judger("def judge(a, b): return True"), nullopt);
    EXPECT_NE(validate_judger("def judge(i, a, b, c): return 'yes'"), nullopt);
    EXPECT_NE(validate_judger("def judge(i, a, b, c): raise RuntimeError()"), nullopt);
    EXPECT_NE(validate_judger("import nonexistent_module_for_judgebox"), nullopt);
}

TEST(JudgerTest, ValidateJudgerMessageTest) {
    auto error = validate_judger("def judge(a, b): return True");
    ASSERT_NE(error, nullopt);
    EXPECT_THAT(*error, HasSubstr("TypeError"));
}

TEST(JudgerTest, PrintDoesNotReachStdoutTest) {
    int pipefd[2];
    ASSERT_EQ(pipe2(pipefd, O_NONBLOCK), 0);
    fflush(stdout);
    int saved_stdout = dup(STDOUT_FILENO);
    ASSERT_GE(saved_stdout, 0);
    ASSERT_GE(dup2(pipefd[1], STDOUT_FILENO), 0);

    bool correct = false;
    try {
        auto judger = python_judger::load(R"(
import sys
def judge(index, input, expected_output, actual_output):
    print('debug', index, flush=True)
    sys.stdout.write('x' * 100000)
    sys.stdout.flush()
    return expected_output == actual_output
)");
        correct = judger->judge(0, "1\n", "1", "1");
    } catch (judger_error &e) {
        ADD_FAILURE() << e.what();
    }

    fflush(stdout);
    dup2(saved_stdout, STDOUT_FILENO);
    close(saved_stdout);
    close(pipefd[1]);
    char buf[64];
    ssize_t n = read(pipefd[0], buf, sizeof(buf));
    close(pipefd[0]);

    EXPECT_TRUE(correct);
    EXPECT_EQ(n, 0) << "judger wrote to stdout";
}

class JudgerTimeLimitTest : public ::testing::Test {
protected:
    void SetUp() override {
        old_limit = JUDGER_TIME_LIMIT;
        JUDGER_TIME_LIMIT = 1;
    }

    void TearDown() override {
        JUDGER_TIME_LIMIT = old_limit;
    }

    int old_limit;
};

TEST_F(JudgerTimeLimitTest, EndlessJudgeTest) {
    auto judger = python_judger::load(R"(
def judge(index, input, expected_output, actual_output):
    while True:
        pass
)");
    try {
        judger->judge(0, "", "", "");
        FAIL() << "expected judger_error";
    } catch (judger_error &e) {
        EXPECT_THAT(e.what(), HasSubstr("TimeoutError"));
    }
}

TEST_F(JudgerTimeLimitTest, SwallowedTimeoutTest) {
    auto judger = python_judger::load(R"(
def judge(index, input, expected_output, actual_output):
    try:
        while True:
            pass
    except TimeoutError:
        pass
    while True:
        pass
)");
    EXPECT_THROW(judger->judge(0, "", "", ""), judger_error);
}

TEST_F(JudgerTimeLimitTest, EndlessLoadTest) {
    EXPECT_THROW(python_judger::load("while True:\n    pass\n"), judger_error);
}

TEST_F(JudgerTimeLimitTest, EndlessValidateTest) {
    auto error = validate_judger(R"(
def judge(index, input, expected_output, actual_output):
    while True:
        pass
)");
    ASSERT_NE(error, nullopt);
    EXPECT_THAT(*error, HasSubstr("TimeoutError"));
}

TEST_F(JudgerTimeLimitTest, FastJudgeAfterTimeoutTest) {
    auto slow = python_judger::load("def judge(i, a, b, c):\n    while True:\n        pass\n");
    EXPECT_THROW(slow->judge(0, "", "", ""), judger_error);

    auto fast = python_judger::load("def judge(i, a, b, c): return b == c");
    EXPECT_TRUE(fast->judge(0, "", "1", "1"));
}
