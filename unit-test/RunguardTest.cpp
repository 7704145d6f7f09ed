#include <signal.h>
#include <system_error>
#include "gtest/gtest.h"
#include "runguard.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace judgebox;

static runguard_options shell(const string &script) {
    runguard_options opt;
    opt.command = {"sh", "-c", script};
    opt.use_wall_limit = true;
    opt.wall_limit = 10;
    return opt;
}

TEST(RunguardTest, StdinToStdoutTest) {
    auto opt = shell("cat");
    opt.stdin_data = "hello\nworld\n";
    auto result = runit(opt);
    EXPECT_EQ(result.stdout_data, "hello\nworld\n");
    EXPECT_EQ(result.exitcode, 0);
    EXPECT_EQ(result.signal, -1);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.stdin_bytes, 12);
    EXPECT_GT(result.memory, 0);
}

TEST(RunguardTest, LargeInputTest) {
    // 输入和输出都远大于管道缓冲区，必须同时读写才不会死锁
    auto opt = shell("cat");
    opt.stdin_data = string(4 * 1024 * 1024, 'x');
    auto result = runit(opt);
    EXPECT_EQ(result.stdout_data.size(), opt.stdin_data.size());
    EXPECT_EQ(result.exitcode, 0);
}

TEST(RunguardTest, ChildIgnoresStdinTest) {
    auto opt = shell("exit 0");
    opt.stdin_data = string(4 * 1024 * 1024, 'x');
    auto result = runit(opt);
    EXPECT_EQ(result.exitcode, 0);
    EXPECT_LT(result.stdin_bytes, opt.stdin_data.size());
}

TEST(RunguardTest, ExitCodeTest) {
    auto result = runit(shell("exit 3"));
    EXPECT_EQ(result.exitcode, 3);
    EXPECT_EQ(result.signal, -1);
}

TEST(RunguardTest, SignalTest) {
    auto result = runit(shell("kill -9 $$"));
    EXPECT_EQ(result.signal, SIGKILL);
    EXPECT_EQ(result.exitcode, 128 + SIGKILL);
    EXPECT_FALSE(result.timed_out);
}

TEST(RunguardTest, TimeoutTest) {
    auto opt = shell("echo started; sleep 10");
    opt.wall_limit = 0.3;
    auto result = runit(opt);
    EXPECT_TRUE(result.timed_out);
    EXPECT_NE(result.signal, -1);
    EXPECT_GE(result.wall_time, 0.3);
    EXPECT_LT(result.wall_time, 5);
    EXPECT_EQ(result.stdout_data, "started\n");
}

TEST(RunguardTest, TrappedTermTest) {
    // 忽略 SIGTERM 的程序会在宽限期后被 SIGKILL 杀死
    auto opt = shell("trap '' TERM; sleep 10");
    opt.wall_limit = 0.2;
    auto result = runit(opt);
    EXPECT_TRUE(result.timed_out);
    EXPECT_LT(result.wall_time, 5);
}

TEST(RunguardTest, BackgroundProcessTest) {
    // 后台进程持有 stdout，不应让父进程一直等待
    auto result = runit(shell("sleep 10 & echo done"));
    EXPECT_EQ(result.exitcode, 0);
    EXPECT_EQ(result.stdout_data, "done\n");
    EXPECT_LT(result.wall_time, 5);
}

TEST(RunguardTest, SeparateStderrTest) {
    auto result = runit(shell("echo out; echo err >&2"));
    EXPECT_EQ(result.stdout_data, "out\n");
    EXPECT_EQ(result.stderr_data, "err\n");
}

TEST(RunguardTest, MergeStderrTest) {
    auto opt = shell("echo out; echo err >&2");
    opt.merge_stderr = true;
    auto result = runit(opt);
    EXPECT_EQ(result.stdout_data, "out\nerr\n");
    EXPECT_EQ(result.stderr_data, "");
}

TEST(RunguardTest, StreamSizeTest) {
    auto opt = shell("head -c 100000 /dev/zero");
    opt.stream_size = 1000;
    auto result = runit(opt);
    EXPECT_EQ(result.exitcode, 0);
    EXPECT_EQ(result.stdout_data.size(), 1000);
    EXPECT_EQ(result.stdout_bytes, 100000);
}

TEST(RunguardTest, WorkDirTest) {
    test::scoped_work_dir dir;
    auto opt = shell("pwd");
    opt.work_dir = dir.path().string();
    auto result = runit(opt);
    EXPECT_EQ(filesystem::equivalent(result.stdout_data.substr(0, result.stdout_data.size() - 1), dir.path()), true);
}

TEST(RunguardTest, EnvironmentTest) {
    auto opt = shell("echo $JUDGEBOX_TEST");
    opt.env = {"JUDGEBOX_TEST=42"};
    EXPECT_EQ(runit(opt).stdout_data, "42\n");
}

TEST(RunguardTest, MissingProgramTest) {
    runguard_options opt;
    opt.command = {"/nonexistent/program"};
    EXPECT_THROW(runit(opt), system_error);
}

TEST(RunguardTest, MissingWorkDirTest) {
    auto opt = shell("true");
    opt.work_dir = "/nonexistent/directory";
    EXPECT_THROW(runit(opt), system_error);
}

TEST(RunguardTest, EmptyCommandTest) {
    runguard_options opt;
    EXPECT_THROW(runit(opt), invalid_argument);
}

TEST(RunguardTest, BaselineTest) {
    int64_t baseline = calibrate_baseline(3);
    EXPECT_GT(baseline, 0);

    auto result = runit(shell("true"));
    EXPECT_GE(adjusted_memory(result.memory, baseline), 0);
}

TEST(RunguardTest, AdjustedMemoryTest) {
    EXPECT_EQ(adjusted_memory(1000, 400), 600);
    EXPECT_EQ(adjusted_memory(400, 1000), 0);
    EXPECT_EQ(adjusted_memory(0, 0), 0);
}

TEST(RunguardTest, RunProgramTest) {
    test::scoped_work_dir dir;
    auto result = run_program({"sh", "-c", "read x; echo $((x * 2))"}, dir.path(), "21\n", 5000);
    EXPECT_EQ(result.stdout_data, "42\n");
    EXPECT_EQ(result.exitcode, 0);
}

TEST(RunguardTest, RunToolTest) {
    auto result = run_tool({"sh", "-c", "echo out; echo err >&2; exit 1"}, {}, 5);
    EXPECT_EQ(result.stdout_data, "out\nerr\n");
    EXPECT_EQ(result.exitcode, 1);
}
