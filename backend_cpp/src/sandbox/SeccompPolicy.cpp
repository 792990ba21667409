#include "sandbox/SeccompPolicy.hpp"
#include "model/Errors.hpp"
#include "utils/SubProcess.hpp"
#include <seccomp.h>
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <sched.h>
#include <sys/mman.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <unistd.h>

namespace pyguard::sandbox {

namespace {

// Process creation, debugging, namespaces, mounts, kernel state.
const char* const KILLED_SYSCALLS[] = {
    "fork", "vfork", "ptrace", "process_vm_readv", "process_vm_writev",
    "mount", "umount", "umount2", "pivot_root", "chroot", "unshare", "setns",
    "kexec_load", "kexec_file_load", "reboot", "init_module", "finit_module",
    "delete_module", "bpf", "perf_event_open", "keyctl", "add_key", "request_key",
    "acct", "swapon", "swapoff", "settimeofday", "clock_settime", "adjtimex",
    "quotactl", "open_by_handle_at", "name_to_handle_at", "userfaultfd",
    "iopl", "ioperm", "fsopen", "fsmount", "fsconfig", "move_mount", "open_tree"
};

// Metadata changes Landlock cannot confine to the scratch area. Refused, not killed.
const char* const REFUSED_SYSCALLS[] = {
    "truncate", "chmod", "fchmod", "fchmodat", "fchmodat2", "chown", "fchown", "lchown", "fchownat",
    "setxattr", "lsetxattr", "fsetxattr", "removexattr", "lremovexattr", "fremovexattr",
    "utime", "utimes", "utimensat", "futimesat"
};

const int NETWORK_FAMILIES[] = { AF_INET, AF_INET6, AF_PACKET, AF_NETLINK };

// Releases the libseccomp context on every path.
struct FilterContext {
    scmp_filter_ctx ctx;
    explicit FilterContext(uint32_t def_action) : ctx(seccomp_init(def_action)) {}
    ~FilterContext() { if (ctx) seccomp_release(ctx); }
};

void check(int rc, const char* what) {
    if (rc < 0) {
        throw InfrastructureError(std::string("seccomp: ") + what + ": " + std::strerror(-rc));
    }
}

}

SeccompPolicy SeccompPolicy::compile(bool network_allowed) {
    FilterContext filter(SCMP_ACT_ALLOW);
    if (!filter.ctx) throw InfrastructureError("seccomp: seccomp_init failed");

    // Foreign-ABI syscalls would bypass the native rules.
    check(seccomp_attr_set(filter.ctx, SCMP_FLTATR_ACT_BADARCH, SCMP_ACT_KILL_PROCESS), "badarch action");

    for (const char* name : KILLED_SYSCALLS) {
        int nr = seccomp_syscall_resolve_name(name);
        if (nr == __NR_SCMP_ERROR || nr < 0) continue; // Not present on this architecture
        check(seccomp_rule_add(filter.ctx, SCMP_ACT_KILL_PROCESS, nr, 0), name);
    }

    for (const char* name : REFUSED_SYSCALLS) {
        int nr = seccomp_syscall_resolve_name(name);
        if (nr == __NR_SCMP_ERROR || nr < 0) continue;
        check(seccomp_rule_add(filter.ctx, SCMP_ACT_ERRNO(EPERM), nr, 0), name);
    }

    // Threads are fine, new processes are not.
    check(seccomp_rule_add(filter.ctx, SCMP_ACT_KILL_PROCESS, SCMP_SYS(clone), 1,
                           SCMP_A0(SCMP_CMP_MASKED_EQ, CLONE_THREAD, 0)), "clone");
    // clone3 flags live in user memory; ENOSYS makes glibc fall back to clone.
    int clone3 = seccomp_syscall_resolve_name("clone3");
    if (clone3 != __NR_SCMP_ERROR && clone3 >= 0) {
        check(seccomp_rule_add(filter.ctx, SCMP_ACT_ERRNO(ENOSYS), clone3, 0), "clone3");
    }

    if (!network_allowed) {
        for (int family : NETWORK_FAMILIES) {
            check(seccomp_rule_add(filter.ctx, SCMP_ACT_KILL_PROCESS, SCMP_SYS(socket), 1,
                                   SCMP_A0(SCMP_CMP_EQ, static_cast<scmp_datum_t>(family))), "socket");
        }
    }

    UniqueFd memfd(memfd_create("pyguard-seccomp", MFD_CLOEXEC));
    if (!memfd.valid()) {
        throw InfrastructureError(std::string("seccomp: memfd_create failed: ") + std::strerror(errno));
    }
    check(seccomp_export_bpf(filter.ctx, memfd.get()), "export");

    struct stat st {};
    if (fstat(memfd.get(), &st) != 0 || st.st_size <= 0 || st.st_size % sizeof(sock_filter) != 0) {
        throw InfrastructureError("seccomp: exported filter has an unexpected size");
    }

    std::vector<sock_filter> program(static_cast<size_t>(st.st_size) / sizeof(sock_filter));
    ssize_t got = pread(memfd.get(), program.data(), static_cast<size_t>(st.st_size), 0);
    if (got != st.st_size) {
        throw InfrastructureError("seccomp: short read of exported filter");
    }

    spdlog::debug("🛡️ seccomp filter compiled: {} instructions (network {})",
                  program.size(), network_allowed ? "allowed" : "blocked");
    return SeccompPolicy(std::move(program));
}

}
