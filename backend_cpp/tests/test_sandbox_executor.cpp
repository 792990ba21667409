#include <gtest/gtest.h>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <signal.h>
#include "sandbox/SandboxExecutor.hpp"
#include "model/Errors.hpp"

using namespace pyguard;
using namespace pyguard::sandbox;

// These run real CPython subprocesses.
class SandboxExecutorTest : public ::testing::Test {
protected:
    SandboxExecutor executor;
    ResourceLimits limits;

    void SetUp() override {
        if (!executor.available()) GTEST_SKIP() << "python3 >= 3.8 not available";
        limits.max_wall_time = std::chrono::milliseconds(5000);
    }

    ExecutionResult run(const std::string& code) {
        return executor.execute(SourceFragment(code), limits);
    }
};

TEST_F(SandboxExecutorTest, SuccessfulRunCapturesStdout) {
    auto result = run("print('hello')\nprint(sum(range(5)))\n");
    EXPECT_EQ(result.status, ExecutionStatus::SUCCESS);
    EXPECT_EQ(result.stdout_data, "hello\n10\n");
    EXPECT_FALSE(result.exception_trace.has_value());
    ASSERT_TRUE(result.exit_code.has_value());
    EXPECT_EQ(*result.exit_code, 0);
    EXPECT_GT(result.peak_memory, 0u);
}

TEST_F(SandboxExecutorTest, UncaughtExceptionIsStructured) {
    auto result = run("x = 1\nprint(x / 0)\n");
    EXPECT_EQ(result.status, ExecutionStatus::RUNTIME_ERROR);
    ASSERT_TRUE(result.exception_trace.has_value());
    EXPECT_EQ(result.exception_trace->type, "ZeroDivisionError");
    EXPECT_EQ(result.exception_trace->message, "division by zero");
    ASSERT_TRUE(result.exception_trace->line.has_value());
    EXPECT_EQ(*result.exception_trace->line, 2);
    EXPECT_NE(result.exception_trace->formatted.find("ZeroDivisionError"), std::string::npos);
}

TEST_F(SandboxExecutorTest, ExceptionLineIsInnermostFragmentFrame) {
    auto result = run(
        "def inner(values):\n"
        "    return values[3]\n"
        "\n"
        "def outer():\n"
        "    return inner([1, 2])\n"
        "\n"
        "outer()\n");
    ASSERT_TRUE(result.exception_trace.has_value());
    EXPECT_EQ(result.exception_trace->type, "IndexError");
    EXPECT_EQ(*result.exception_trace->line, 2);
    EXPECT_EQ(result.exception_trace->frames.size(), 3u);
}

TEST_F(SandboxExecutorTest, NonZeroSysExitIsRuntimeError) {
    auto result = run("import sys\nsys.exit(3)\n");
    EXPECT_EQ(result.status, ExecutionStatus::RUNTIME_ERROR);
    EXPECT_EQ(result.exit_code.value_or(-1), 3);
    EXPECT_FALSE(result.exception_trace.has_value());
}

TEST_F(SandboxExecutorTest, EntryPointIsInvoked) {
    SourceFragment fragment("def main():\n    print('from main')\n", std::string("main"));
    auto result = executor.execute(fragment, limits);
    EXPECT_EQ(result.status, ExecutionStatus::SUCCESS);
    EXPECT_EQ(result.stdout_data, "from main\n");
}

TEST_F(SandboxExecutorTest, InfiniteLoopTimesOutAndIsTornDown) {
    limits.max_wall_time = std::chrono::milliseconds(1000);
    auto result = run("print('x')\nwhile True:\n    pass\n");

    EXPECT_EQ(result.status, ExecutionStatus::TIMEOUT);
    EXPECT_EQ(result.stdout_data, "x\n");
    EXPECT_GE(result.wall_time.count(), 1000);
    EXPECT_LT(result.wall_time.count(), 3000);

    // No process of the group survives and the scratch area is gone.
    ASSERT_GT(result.diagnostics.pid, 0);
    EXPECT_EQ(::killpg(result.diagnostics.pid, 0), -1);
    EXPECT_EQ(errno, ESRCH);
    EXPECT_FALSE(result.diagnostics.scratch_path.empty());
    EXPECT_FALSE(std::filesystem::exists(result.diagnostics.scratch_path));
}

TEST_F(SandboxExecutorTest, ScratchAreaRemovedAfterSuccess) {
    auto result = run("print(1)\n");
    EXPECT_FALSE(result.diagnostics.scratch_path.empty());
    EXPECT_FALSE(std::filesystem::exists(result.diagnostics.scratch_path));
}

TEST_F(SandboxExecutorTest, ReadingHostFileIsViolation) {
    auto result = run("print(open('/etc/passwd').read())\n");
    EXPECT_EQ(result.status, ExecutionStatus::SANDBOX_VIOLATION);
    EXPECT_NE(result.violation.find("/etc/passwd"), std::string::npos);
    EXPECT_EQ(result.stdout_data.find("root:"), std::string::npos);
}

TEST_F(SandboxExecutorTest, TamperingWithPolicyStateDoesNotExposeHostFiles) {
    std::string tmpl = (std::filesystem::temp_directory_path() / "pyguard-secret-XXXXXX").string();
    ASSERT_NE(mkdtemp(tmpl.data()), nullptr);
    std::filesystem::path secret = std::filesystem::path(tmpl) / "secret.txt";
    std::ofstream(secret) << "hunter2-on-host";

    // Rewrites every list and flag reachable from the caller frames, swaps
    // builtins the policy could lean on, then reads the host file.
    auto result = run(
        "import sys, builtins\n"
        "frame = sys._getframe()\n"
        "while frame is not None:\n"
        "    for name, value in list(frame.f_locals.items()):\n"
        "        if isinstance(value, list):\n"
        "            value[:] = [True] * max(len(value), 1)\n"
        "        elif isinstance(value, bool):\n"
        "            frame.f_locals[name] = not value\n"
        "    frame = frame.f_back\n"
        "builtins.isinstance = lambda *a: False\n"
        "builtins.str = bytes\n"
        "builtins.len = lambda *a: 0\n"
        "print(open(" + std::string("'") + secret.string() + "'" + ").read())\n");

    std::filesystem::remove_all(tmpl);
    EXPECT_NE(result.status, ExecutionStatus::SUCCESS);
    EXPECT_EQ(result.stdout_data.find("hunter2-on-host"), std::string::npos);
    if (executor.filesystem_isolation()) {
        // Both layers refuse; whichever fires first decides the status.
        EXPECT_TRUE(result.status == ExecutionStatus::SANDBOX_VIOLATION ||
                    result.status == ExecutionStatus::RUNTIME_ERROR);
    } else {
        EXPECT_EQ(result.status, ExecutionStatus::SANDBOX_VIOLATION);
    }
}

TEST_F(SandboxExecutorTest, NetworkSocketIsViolation) {
    auto result = run("import socket\ns = socket.socket(socket.AF_INET, socket.SOCK_STREAM)\n");
    EXPECT_EQ(result.status, ExecutionStatus::SANDBOX_VIOLATION);
}

TEST_F(SandboxExecutorTest, SubprocessIsViolation) {
    auto result = run("import subprocess\nsubprocess.run(['echo', 'escaped'])\n");
    EXPECT_EQ(result.status, ExecutionStatus::SANDBOX_VIOLATION);
    EXPECT_EQ(result.stdout_data.find("escaped"), std::string::npos);
}

TEST_F(SandboxExecutorTest, ForkIsViolation) {
    auto result = run("import os\nos.fork()\nprint('forked')\n");
    EXPECT_EQ(result.status, ExecutionStatus::SANDBOX_VIOLATION);
    EXPECT_EQ(result.stdout_data.find("forked"), std::string::npos);
}

TEST_F(SandboxExecutorTest, OutputBeyondLimitIsTruncated) {
    limits.max_output_bytes = 1024;
    auto result = run("import sys\nsys.stdout.write('x' * 200000)\n");
    EXPECT_EQ(result.status, ExecutionStatus::RESOURCE_LIMIT_EXCEEDED);
    EXPECT_EQ(result.limit, "output");
    EXPECT_TRUE(result.stdout_truncated);
    EXPECT_LE(result.stdout_data.size(), 1024u);
    EXPECT_FALSE(result.stdout_data.empty());
    EXPECT_EQ(result.stdout_data, std::string(result.stdout_data.size(), 'x'));
}

TEST_F(SandboxExecutorTest, OutputBeforeRunawayWriterIsKept) {
    limits.max_output_bytes = 4096;
    auto result = run("import sys\nprint('started')\nwhile True:\n    sys.stdout.write('y' * 100)\n");
    EXPECT_EQ(result.status, ExecutionStatus::RESOURCE_LIMIT_EXCEEDED);
    EXPECT_EQ(result.limit, "output");
    EXPECT_EQ(result.stdout_data.rfind("started\n", 0), 0u);
}

TEST_F(SandboxExecutorTest, HugeAllocationIsMemoryLimit) {
    limits.max_memory = 128ull * 1024 * 1024;
    auto result = run("data = bytearray(1024 * 1024 * 1024)\n");
    EXPECT_EQ(result.status, ExecutionStatus::RESOURCE_LIMIT_EXCEEDED);
    EXPECT_EQ(result.limit, "memory");
}

TEST_F(SandboxExecutorTest, HostEnvironmentIsNotVisible) {
    ::setenv("PYGUARD_TEST_SECRET", "hunter2", 1);
    auto result = run("import os\nprint(sorted(os.environ))\nprint(os.environ.get('PYGUARD_TEST_SECRET'))\n");
    ::unsetenv("PYGUARD_TEST_SECRET");
    EXPECT_EQ(result.status, ExecutionStatus::SUCCESS);
    EXPECT_EQ(result.stdout_data.find("hunter2"), std::string::npos);
    EXPECT_NE(result.stdout_data.find("None"), std::string::npos);
}

TEST_F(SandboxExecutorTest, RepeatedRunsAreIndependent) {
    const std::string code = "import sys\ncounter = getattr(sys, 'pyguard_counter', 0) + 1\n"
                             "sys.pyguard_counter = counter\nprint(counter)\n";
    auto first = run(code);
    auto second = run(code);
    EXPECT_EQ(first.status, ExecutionStatus::SUCCESS);
    EXPECT_EQ(first.stdout_data, "1\n");
    EXPECT_EQ(second.stdout_data, first.stdout_data);
    EXPECT_NE(first.diagnostics.scratch_path, second.diagnostics.scratch_path);
}

TEST_F(SandboxExecutorTest, ScratchWritesNeedFilesystemPermission) {
    const std::string code =
        "with open('notes.txt', 'w') as fh:\n"
        "    fh.write('kept')\n"
        "print(open('notes.txt').read())\n";

    auto denied = run(code);
    EXPECT_EQ(denied.status, ExecutionStatus::SANDBOX_VIOLATION);

    limits.filesystem_allowed = true;
    auto allowed = run(code);
    EXPECT_EQ(allowed.status, ExecutionStatus::SUCCESS);
    EXPECT_EQ(allowed.stdout_data, "kept\n");
}

TEST_F(SandboxExecutorTest, InvalidLimitsThrowConfigError) {
    limits.max_wall_time = std::chrono::milliseconds(0);
    EXPECT_THROW(run("print(1)\n"), ConfigError);
}

TEST(SandboxExecutorSetupTest, RequiredIsolationWithoutKernelSupportRefusesToRun) {
    SandboxExecutor executor("python3", true);
    if (!executor.available()) GTEST_SKIP() << "python3 >= 3.8 not available";
    if (executor.filesystem_isolation()) {
        auto result = executor.execute(SourceFragment("print(1)\n"), ResourceLimits{});
        EXPECT_EQ(result.status, ExecutionStatus::SUCCESS);
        EXPECT_EQ(result.stdout_data, "1\n");
    } else {
        EXPECT_THROW(executor.execute(SourceFragment("print(1)\n"), ResourceLimits{}), InfrastructureError);
    }
}

TEST(SandboxExecutorSetupTest, MissingInterpreterIsInfrastructureError) {
    SandboxExecutor executor("/nonexistent/python-for-pyguard-tests");
    EXPECT_FALSE(executor.available());
    EXPECT_THROW(executor.execute(SourceFragment("print(1)\n"), ResourceLimits{}), InfrastructureError);
}
