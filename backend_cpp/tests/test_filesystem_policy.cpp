#include <gtest/gtest.h>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <string>
#include <fcntl.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <unistd.h>
#include "sandbox/FilesystemPolicy.hpp"

using namespace pyguard::sandbox;
namespace fs = std::filesystem;

namespace {

fs::path make_temp_dir(const char* prefix) {
    std::string tmpl = (fs::temp_directory_path() / (std::string(prefix) + "XXXXXX")).string();
    char* made = mkdtemp(tmpl.data());
    return made ? fs::path(made) : fs::path();
}

// 0 when the open succeeds, errno otherwise.
int try_open(const fs::path& path, int flags) {
    int fd = open(path.c_str(), flags | O_CLOEXEC, 0600);
    if (fd < 0) return errno;
    close(fd);
    return 0;
}

}

// Each case restricts a forked child and reads the verdict from its exit status.
class FilesystemPolicyTest : public ::testing::Test {
protected:
    int abi = 0;
    fs::path host_dir;
    fs::path scratch_dir;

    void SetUp() override {
        abi = FilesystemPolicy::kernel_abi();
        if (abi == 0) GTEST_SKIP() << "Landlock not available on this kernel";

        host_dir = make_temp_dir("pyguard-host-");
        scratch_dir = make_temp_dir("pyguard-scratch-");
        ASSERT_FALSE(host_dir.empty());
        ASSERT_FALSE(scratch_dir.empty());
        std::ofstream(host_dir / "secret.txt") << "host-data";
        std::ofstream(scratch_dir / "fragment.py") << "print(1)\n";
    }

    void TearDown() override {
        std::error_code ec;
        if (!host_dir.empty()) fs::remove_all(host_dir, ec);
        if (!scratch_dir.empty()) fs::remove_all(scratch_dir, ec);
    }

    int run_restricted(const FilesystemPolicy& policy, const std::function<int()>& body) {
        pid_t pid = fork();
        if (pid == 0) {
            if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) _exit(100);
            if (FilesystemPolicy::restrict_self(policy.ruleset_fd()) != 0) _exit(101);
            _exit(body());
        }
        int status = 0;
        waitpid(pid, &status, 0);
        return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    }
};

TEST_F(FilesystemPolicyTest, HostFileOutsideRootsIsDenied) {
    auto policy = FilesystemPolicy::compile(abi, {}, scratch_dir.string(), false);
    ASSERT_TRUE(policy.active());

    fs::path secret = host_dir / "secret.txt";
    fs::path fragment = scratch_dir / "fragment.py";
    int verdict = run_restricted(policy, [&]() {
        if (try_open(secret, O_RDONLY) != EACCES) return 1;
        if (try_open(fragment, O_RDONLY) != 0) return 2;
        if (try_open("/dev/null", O_WRONLY | O_TRUNC) != 0) return 3;
        return 0;
    });
    EXPECT_EQ(verdict, 0);
}

TEST_F(FilesystemPolicyTest, ScratchWritesFollowTheFilesystemFlag) {
    fs::path output = scratch_dir / "out.txt";

    auto read_only = FilesystemPolicy::compile(abi, {}, scratch_dir.string(), false);
    EXPECT_EQ(run_restricted(read_only, [&]() {
        return try_open(output, O_WRONLY | O_CREAT) == EACCES ? 0 : 1;
    }), 0);

    auto writable = FilesystemPolicy::compile(abi, {}, scratch_dir.string(), true);
    fs::path host_output = host_dir / "planted.txt";
    EXPECT_EQ(run_restricted(writable, [&]() {
        if (try_open(output, O_WRONLY | O_CREAT) != 0) return 1;
        if (try_open(host_output, O_WRONLY | O_CREAT) != EACCES) return 2;
        return 0;
    }), 0);
    EXPECT_FALSE(fs::exists(host_output));
}

TEST_F(FilesystemPolicyTest, ReadRootsAreNeverWritable) {
    auto policy = FilesystemPolicy::compile(abi, {host_dir.string(), "/nonexistent/pyguard-root"},
                                            scratch_dir.string(), true);
    fs::path secret = host_dir / "secret.txt";
    const bool mediates_truncate = abi >= 3;
    EXPECT_EQ(run_restricted(policy, [&]() {
        if (try_open(secret, O_RDONLY) != 0) return 1;
        if (try_open(secret, O_WRONLY) != EACCES) return 2;
        if (mediates_truncate && try_open(secret, O_RDONLY | O_TRUNC) != EACCES) return 3;
        if (mediates_truncate && truncate(secret.c_str(), 0) == 0) return 4;
        return 0;
    }), 0);

    std::ifstream kept(secret);
    std::string content((std::istreambuf_iterator<char>(kept)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "host-data");
}

TEST(FilesystemPolicySetupTest, NoKernelSupportGivesInactivePolicy) {
    auto policy = FilesystemPolicy::compile(0, {"/usr"}, "/tmp", false);
    EXPECT_FALSE(policy.active());
    EXPECT_EQ(policy.ruleset_fd(), -1);
}
