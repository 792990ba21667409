#include "sandbox/FilesystemPolicy.hpp"
#include "model/Errors.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <linux/landlock.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <unistd.h>

// ABI 3 right, missing from older UAPI headers. The bit is fixed by the kernel ABI.
#ifndef LANDLOCK_ACCESS_FS_TRUNCATE
#define LANDLOCK_ACCESS_FS_TRUNCATE (1ULL << 14)
#endif

namespace pyguard::sandbox {

namespace {

// glibc ships no wrappers for the Landlock syscalls.
int create_ruleset(const landlock_ruleset_attr* attr, size_t size, uint32_t flags) {
    return static_cast<int>(syscall(SYS_landlock_create_ruleset, attr, size, flags));
}

int add_rule(int ruleset_fd, landlock_rule_type type, const void* attr) {
    return static_cast<int>(syscall(SYS_landlock_add_rule, ruleset_fd, type, attr, 0));
}

const uint64_t READ_ACCESS =
    LANDLOCK_ACCESS_FS_EXECUTE | LANDLOCK_ACCESS_FS_READ_FILE | LANDLOCK_ACCESS_FS_READ_DIR;

const uint64_t WRITE_ACCESS =
    LANDLOCK_ACCESS_FS_WRITE_FILE | LANDLOCK_ACCESS_FS_REMOVE_DIR | LANDLOCK_ACCESS_FS_REMOVE_FILE |
    LANDLOCK_ACCESS_FS_MAKE_DIR | LANDLOCK_ACCESS_FS_MAKE_REG | LANDLOCK_ACCESS_FS_REFER |
    LANDLOCK_ACCESS_FS_TRUNCATE;

// Rights the kernel accepts on a rule for a non-directory.
const uint64_t FILE_ACCESS =
    LANDLOCK_ACCESS_FS_EXECUTE | LANDLOCK_ACCESS_FS_WRITE_FILE | LANDLOCK_ACCESS_FS_READ_FILE |
    LANDLOCK_ACCESS_FS_TRUNCATE;

// Devices every interpreter touches, with their rights.
const struct {
    const char* path;
    uint64_t access;
} DEVICE_RULES[] = {
    {"/dev/null", LANDLOCK_ACCESS_FS_READ_FILE | LANDLOCK_ACCESS_FS_WRITE_FILE | LANDLOCK_ACCESS_FS_TRUNCATE},
    {"/dev/urandom", LANDLOCK_ACCESS_FS_READ_FILE},
    {"/dev/random", LANDLOCK_ACCESS_FS_READ_FILE},
};

uint64_t handled_access(int abi) {
    uint64_t handled =
        LANDLOCK_ACCESS_FS_EXECUTE | LANDLOCK_ACCESS_FS_WRITE_FILE | LANDLOCK_ACCESS_FS_READ_FILE |
        LANDLOCK_ACCESS_FS_READ_DIR | LANDLOCK_ACCESS_FS_REMOVE_DIR | LANDLOCK_ACCESS_FS_REMOVE_FILE |
        LANDLOCK_ACCESS_FS_MAKE_CHAR | LANDLOCK_ACCESS_FS_MAKE_DIR | LANDLOCK_ACCESS_FS_MAKE_REG |
        LANDLOCK_ACCESS_FS_MAKE_SOCK | LANDLOCK_ACCESS_FS_MAKE_FIFO | LANDLOCK_ACCESS_FS_MAKE_BLOCK |
        LANDLOCK_ACCESS_FS_MAKE_SYM;
    // REFER (cross-directory link/rename) arrived with ABI 2.
    if (abi >= 2) handled |= LANDLOCK_ACCESS_FS_REFER;
    // TRUNCATE (truncate(2), O_TRUNC) with ABI 3. Older kernels leave it to seccomp.
    if (abi >= 3) handled |= LANDLOCK_ACCESS_FS_TRUNCATE;
    return handled;
}

void allow_beneath(int ruleset_fd, const std::string& path, uint64_t access, uint64_t handled) {
    UniqueFd target(open(path.c_str(), O_PATH | O_CLOEXEC));
    if (!target.valid()) {
        if (errno == ENOENT || errno == ENOTDIR) return;
        throw InfrastructureError("landlock: cannot open " + path + ": " + std::strerror(errno));
    }

    struct stat st {};
    if (fstat(target.get(), &st) != 0) {
        throw InfrastructureError("landlock: cannot stat " + path + ": " + std::strerror(errno));
    }
    if (!S_ISDIR(st.st_mode)) access &= FILE_ACCESS;

    landlock_path_beneath_attr rule{};
    rule.allowed_access = access & handled;
    rule.parent_fd = target.get();
    if (rule.allowed_access == 0) return;

    if (add_rule(ruleset_fd, LANDLOCK_RULE_PATH_BENEATH, &rule) != 0) {
        throw InfrastructureError("landlock: rule for " + path + " rejected: " + std::strerror(errno));
    }
}

}

int FilesystemPolicy::kernel_abi() {
    int abi = create_ruleset(nullptr, 0, LANDLOCK_CREATE_RULESET_VERSION);
    return abi > 0 ? abi : 0;
}

FilesystemPolicy FilesystemPolicy::compile(int abi,
                                           const std::vector<std::string>& read_roots,
                                           const std::string& scratch,
                                           bool scratch_writable) {
    if (abi <= 0) return FilesystemPolicy(UniqueFd());

    const uint64_t handled = handled_access(abi);
    landlock_ruleset_attr attr{};
    attr.handled_access_fs = handled;

    UniqueFd ruleset(create_ruleset(&attr, sizeof(attr), 0));
    if (!ruleset.valid()) {
        throw InfrastructureError(std::string("landlock: create_ruleset failed: ") + std::strerror(errno));
    }

    for (const auto& root : read_roots) {
        allow_beneath(ruleset.get(), root, READ_ACCESS, handled);
    }
    for (const auto& device : DEVICE_RULES) {
        allow_beneath(ruleset.get(), device.path, device.access, handled);
    }

    uint64_t scratch_access = LANDLOCK_ACCESS_FS_READ_FILE | LANDLOCK_ACCESS_FS_READ_DIR;
    if (scratch_writable) scratch_access |= WRITE_ACCESS;
    allow_beneath(ruleset.get(), scratch, scratch_access, handled);

    spdlog::debug("🛡️ Landlock ruleset (ABI {}): {} read roots, scratch {}",
                  abi, read_roots.size(), scratch_writable ? "read-write" : "read-only");
    return FilesystemPolicy(std::move(ruleset));
}

int FilesystemPolicy::restrict_self(int ruleset_fd) {
    return static_cast<int>(syscall(SYS_landlock_restrict_self, ruleset_fd, 0));
}

}
