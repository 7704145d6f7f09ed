#include "common/status.hpp"
#include "gtest/gtest.h"
#include "judge/harness.hpp"
#include "test/assertions.hpp"

using namespace std;
using namespace judgebox;

static const int64_t MB = 1024 * 1024;

static runguard_result make_result(int exitcode, bool timed_out = false, int signal = -1) {
    runguard_result result;
    result.exitcode = exitcode;
    result.timed_out = timed_out;
    result.signal = signal;
    return result;
}

TEST(ClassifyTest, NormalExitTest) {
    EXPECT_EQ(classify(make_result(0), 10 * MB, 64), nullopt);
}

TEST(ClassifyTest, TimeLimitFirstTest) {
    // 超时被杀死的程序同时内存超限、退出码不为 0
    auto result = make_result(137, true, 9);
    EXPECT_EQ(classify(result, 100 * MB, 64), status::TIME_LIMIT_EXCEEDED);
}

TEST(ClassifyTest, MemoryBeforeExitCodeTest) {
    EXPECT_EQ(classify(make_result(1), 100 * MB, 64), status::MEMORY_LIMIT_EXCEEDED);
    EXPECT_EQ(classify(make_result(0), 100 * MB, 64), status::MEMORY_LIMIT_EXCEEDED);
}

TEST(ClassifyTest, MemoryLimitBoundaryTest) {
    EXPECT_EQ(classify(make_result(0), 64 * MB, 64), nullopt);
    EXPECT_EQ(classify(make_result(0), 64 * MB + 1, 64), status::MEMORY_LIMIT_EXCEEDED);
}

TEST(ClassifyTest, NoMemoryLimitTest) {
    EXPECT_EQ(classify(make_result(0), 4096 * MB, nullopt), nullopt);
}

TEST(ClassifyTest, RuntimeErrorTest) {
    EXPECT_EQ(classify(make_result(3), 0, 64), status::RUNTIME_ERROR);
    EXPECT_EQ(classify(make_result(139, false, 11), 0, 64), status::RUNTIME_ERROR);
}

TEST(StatusTest, WireNameTest) {
    EXPECT_STREQ(get_wire_name(status::TIME_LIMIT_EXCEEDED), "TimeLimitExceeded");
    EXPECT_STREQ(get_wire_name(status::MEMORY_LIMIT_EXCEEDED), "MemoryLimitExceeded");
    EXPECT_STREQ(get_wire_name(status::RUNTIME_ERROR), "RuntimeError");
    EXPECT_STREQ(get_wire_name(status::CORRECT), "Correct");
    EXPECT_STREQ(get_wire_name(status::WRONG), "Wrong");
    EXPECT_STREQ(get_display_message(status::WRONG), "Wrong Answer");
}

TEST(StatusTest, PassRecordJsonTest) {
    pass_record record;
    record.kind = status::CORRECT;
    record.time = 12;
    record.memory_usage = 2048;
    nlohmann::json expected = {{"kind", "Correct"}, {"time", 12}, {"memory_usage", 2048}};
    EXPECT_JSON_EQ(nlohmann::json(record), expected);
}
