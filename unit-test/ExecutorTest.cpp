#include <signal.h>
#include <filesystem>
#include <thread>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "sandbox/executor.hpp"
#include "sandbox/process.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace grader;
using namespace grader::sandbox;
using ::testing::EndsWith;

class ExecutorTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        filesystem::remove_all(scratch_root);
        filesystem::create_directories(scratch_root);
    }

    static void TearDownTestCase() {
        filesystem::remove_all(scratch_root);
    }

    static execution_context context() {
        execution_context ctx = test::test_context();
        ctx.scratch_root = scratch_root;
        ctx.keep_scratch = false;
        return ctx;
    }

    static execution_request shell(const string &script, double time_limit = 5.0) {
        execution_request request;
        request.source_file = "main.sh";
        request.source = script;
        request.command = {"sh", "{{source}}"};
        request.time_limit = time_limit;
        return request;
    }

    static size_t scratch_entries() {
        size_t count = 0;
        for (auto &entry : filesystem::directory_iterator(scratch_root)) {
            (void)entry;
            ++count;
        }
        return count;
    }

    static filesystem::path scratch_root;
};

filesystem::path ExecutorTest::scratch_root = "/tmp/grader-test/executor";

TEST_F(ExecutorTest, OutputAndExitCodeTest) {
    process_executor executor(context());
    raw_result result = executor.execute(shell("echo hello\necho oops >&2\nexit 3\n"));
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.signal, 0);
    EXPECT_EQ(result.stdout_text, "hello\n");
    EXPECT_EQ(result.stderr_text, "oops\n");
    EXPECT_FALSE(result.timed_out);
    EXPECT_FALSE(result.stdout_truncated);
    EXPECT_LT(result.wall_time, 5.0);
}

TEST_F(ExecutorTest, StdinTest) {
    process_executor executor(context());
    execution_request request = shell("cat\n");
    request.stdin_data = "line 1\nline 2";
    raw_result result = executor.execute(request);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_text, "line 1\nline 2");
}

TEST_F(ExecutorTest, TimeoutTest) {
    process_executor executor(context());
    raw_result result = executor.execute(shell("sleep 10\n", 0.5));
    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.signal, SIGKILL);
    EXPECT_EQ(result.exit_code, 128 + SIGKILL);
    EXPECT_GE(result.wall_time, 0.5);
    EXPECT_LT(result.wall_time, 2.0);
    EXPECT_DOUBLE_EQ(result.time_limit, 0.5);
}

TEST_F(ExecutorTest, BackgroundProcessKilledTest) {
    process_executor executor(context());
    elapsed_time timer;
    raw_result result = executor.execute(shell("sleep 30 &\necho started\n"));
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_text, "started\n");
    EXPECT_FALSE(result.timed_out);
    EXPECT_LT(timer.seconds(), 5.0);
}

TEST_F(ExecutorTest, SignalTest) {
    process_executor executor(context());
    raw_result result = executor.execute(shell("kill -SEGV $$\n"));
    EXPECT_EQ(result.signal, SIGSEGV);
    EXPECT_EQ(result.exit_code, 128 + SIGSEGV);
    EXPECT_EQ(describe_exit(result), "killed by signal 11 (SIGSEGV)");
}

TEST_F(ExecutorTest, OutputLimitTest) {
    execution_context ctx = context();
    ctx.output_limit = 16;
    process_executor executor(ctx);
    raw_result result = executor.execute(shell(
        "i=0\n"
        "while [ $i -lt 100 ]; do printf 'aaaaaaaaaa'; i=$((i+1)); done\n"
        "echo done >&2\n"));
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_text, string(16, 'a'));
    EXPECT_EQ(result.stdout_bytes, 1000u);
    EXPECT_TRUE(result.stdout_truncated);
    EXPECT_EQ(result.stderr_text, "done\n");
}

TEST_F(ExecutorTest, MarkersTest) {
    process_executor executor(context());
    execution_request request = shell(
        "echo noise\n"
        "echo '@@GRADER:abc@@ 0 PASS'\n"
        "echo '@@GRADER:forged@@ 1 PASS'\n"
        "printf 'partial'\n"
        "echo '@@GRADER:abc@@ 1 FAIL'\n");
    request.marker_delimiter = "@@GRADER:abc@@";
    raw_result result = executor.execute(request);
    EXPECT_EQ(result.stdout_text, "noise\n@@GRADER:forged@@ 1 PASS\npartial");
    ASSERT_EQ(result.markers.size(), 2u);
    EXPECT_EQ(result.markers[0], (test_marker{0, true}));
    EXPECT_EQ(result.markers[1], (test_marker{1, false}));
}

TEST_F(ExecutorTest, EnvironmentTest) {
    set_env("GRADER_TEST_SECRET", "leaked");
    process_executor executor(context());
    execution_request request = shell("echo \"$HOME\"\necho \"$FOO\"\necho \"${GRADER_TEST_SECRET:-unset}\"\npwd\n");
    request.environment = {{"FOO", "bar"}};
    raw_result result = executor.execute(request);
    vector<string> lines = split_lines(result.stdout_text);
    ASSERT_GE(lines.size(), 4u);
    EXPECT_THAT(lines[0], EndsWith("/work"));
    EXPECT_EQ(lines[1], "bar");
    EXPECT_EQ(lines[2], "unset");
    EXPECT_EQ(lines[3], lines[0]);
}

TEST_F(ExecutorTest, ScratchDirectoryRemovedTest) {
    process_executor executor(context());
    execution_request request = shell("echo data > out.txt\ncat helper.txt\n");
    request.extra_files = {{"helper.txt", "from helper"}};
    raw_result result = executor.execute(request);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_text, "from helper");
    EXPECT_EQ(scratch_entries(), 0u);
}

TEST_F(ExecutorTest, KeepScratchTest) {
    execution_context ctx = context();
    ctx.keep_scratch = true;
    process_executor executor(ctx);
    executor.execute(shell("true\n"));
    EXPECT_EQ(scratch_entries(), 1u);
    for (auto &entry : filesystem::directory_iterator(scratch_root))
        filesystem::remove_all(entry.path());
}

TEST_F(ExecutorTest, LaunchErrorTest) {
    process_executor executor(context());

    execution_request request = shell("true\n");
    request.command = {"grader-no-such-interpreter", "{{source}}"};
    EXPECT_THROW(executor.execute(request), launch_error);

    request = shell("true\n");
    request.source_file = "../escape.sh";
    EXPECT_THROW(executor.execute(request), launch_error);

    request = shell("true\n");
    request.command.clear();
    EXPECT_THROW(executor.execute(request), launch_error);

    // 没有时间限制的程序不允许运行
    EXPECT_THROW(executor.execute(shell("sleep 100\n", 0)), launch_error);
    EXPECT_THROW(executor.execute(shell("sleep 100\n", -1)), launch_error);

    EXPECT_EQ(scratch_entries(), 0u);
}

TEST_F(ExecutorTest, ConcurrentRunsIsolatedTest) {
    process_executor executor(context());
    vector<raw_result> results(4);
    vector<thread> threads;
    for (size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&, i] {
            results[i] = executor.execute(shell("echo " + std::to_string(i) + " > mine\nsleep 0.2\ncat mine\n"));
        });
    }
    for (auto &thd : threads) thd.join();
    for (size_t i = 0; i < results.size(); ++i) {
        EXPECT_EQ(results[i].exit_code, 0);
        EXPECT_EQ(results[i].stdout_text, std::to_string(i) + "\n");
    }
}

TEST_F(ExecutorTest, MemoryLimitTest) {
    if (!test::has_program("python3")) GTEST_SKIP() << "python3 is not installed";

    process_executor executor(context());
    execution_request request;
    request.source_file = "main.py";
    request.source = "import time\ndata = b'a' * (256 * 1024 * 1024)\ntime.sleep(3)\n";
    request.command = {"python3", "{{source}}"};
    request.time_limit = 5.0;
    request.memory_limit = 64;
    raw_result result = executor.execute(request);
    EXPECT_TRUE(result.killed_for_memory);
    EXPECT_FALSE(result.timed_out);
    EXPECT_GT(result.memory_peak, 64LL * 1024 * 1024);
}

TEST_F(ExecutorTest, ProcessInfoTest) {
    auto info = read_process_info(getpid());
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->pid, getpid());
    EXPECT_EQ(info->ppid, getppid());
    EXPECT_GT(info->rss_pages, 0);
    EXPECT_FALSE(read_process_info(-1).has_value());
}
