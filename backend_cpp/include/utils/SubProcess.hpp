#pragma once
#include <string>
#include <array>
#include <cstdio>
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <sys/wait.h>

namespace pyguard {

struct ProcessResult {
    std::string output;
    int exit_code = -1;
    bool success = false;
};

class SubProcess {
public:
    // Trusted host-side helper commands only (interpreter probing). Never used
    // for fragment code. Output beyond `max_output` bytes is dropped.
    static ProcessResult run(const std::string& cmd, size_t max_output = 4096) {
        std::array<char, 256> buffer;
        ProcessResult result;

        FILE* pipe = popen((cmd + " 2>&1").c_str(), "r");
        if (!pipe) {
            result.output = std::string("popen failed: ") + std::strerror(errno);
            return result;
        }

        while (fgets(buffer.data(), buffer.size(), pipe) != nullptr) {
            if (result.output.size() < max_output) result.output += buffer.data();
        }

        int rc = pclose(pipe);
        if (rc != -1 && WIFEXITED(rc)) result.exit_code = WEXITSTATUS(rc);
        result.success = result.exit_code == 0;
        return result;
    }
};

// Owns one file descriptor.
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd(UniqueFd&& o) noexcept : fd_(o.release()) {}
    UniqueFd& operator=(UniqueFd&& o) noexcept {
        if (this != &o) reset(o.release());
        return *this;
    }

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    int release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(int fd = -1) {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

}
