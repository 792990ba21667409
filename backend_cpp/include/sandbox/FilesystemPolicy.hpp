#pragma once
#include <string>
#include <vector>
#include "utils/SubProcess.hpp"

namespace pyguard::sandbox {

// Kernel-enforced filesystem allowlist (Landlock LSM). The ruleset is built in
// the parent; the child only hands the descriptor to landlock_restrict_self.
// Holds no matter what the interpreter does to its own audit hook.
class FilesystemPolicy {
public:
    // Landlock ABI of the running kernel, 0 when the LSM is absent or disabled.
    static int kernel_abi();

    // Read and execute beneath `read_roots`, read inside `scratch`, and create,
    // write and delete inside it when `scratch_writable`. Everything else is denied.
    // Missing roots are skipped. An `abi` of 0 yields an inactive policy.
    // Throws InfrastructureError when the kernel rejects the ruleset.
    static FilesystemPolicy compile(int abi,
                                    const std::vector<std::string>& read_roots,
                                    const std::string& scratch,
                                    bool scratch_writable);

    bool active() const { return ruleset_.valid(); }
    int ruleset_fd() const { return ruleset_.get(); }

    // Async-signal-safe. The caller must already have set no_new_privs.
    static int restrict_self(int ruleset_fd);

    FilesystemPolicy(FilesystemPolicy&&) = default;
    FilesystemPolicy& operator=(FilesystemPolicy&&) = default;

private:
    explicit FilesystemPolicy(UniqueFd ruleset) : ruleset_(std::move(ruleset)) {}

    UniqueFd ruleset_;
};

}
