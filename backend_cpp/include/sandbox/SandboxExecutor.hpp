#pragma once
#include <string>
#include <vector>
#include "model/ReviewTypes.hpp"

namespace pyguard::sandbox {

/**
 * Runs one fragment in a fresh, resource-limited CPython process.
 *
 * Isolation layers, outermost first:
 *   - separate process group, PDEATHSIG, clean environment, stdin from /dev/null
 *   - rlimits (address space, CPU, file size, descriptors, no core dumps)
 *   - Landlock ruleset: interpreter roots read-only, scratch area only otherwise
 *   - seccomp denylist (process creation, ptrace, namespaces, raw network sockets,
 *     path metadata changes)
 *   - audit-hook harness inside the interpreter (turns most escapes into a
 *     reported violation instead of an error)
 *
 * The supervisor enforces the wall-clock deadline and output caps, and tears
 * down the process group and scratch area on every exit path.
 * execute() is const and keeps no state between calls.
 */
class SandboxExecutor {
public:
    // Resolves the real interpreter binary once (shims and symlinks followed).
    // With `require_filesystem_isolation`, execute() refuses to run on kernels
    // without Landlock.
    explicit SandboxExecutor(const std::string& interpreter = "python3",
                             bool require_filesystem_isolation = false);

    // Execution faults come back as statuses. Throws InfrastructureError when the
    // isolated context cannot be created, ConfigError for invalid limits.
    ExecutionResult execute(const SourceFragment& source, const ResourceLimits& limits) const;

    bool available() const { return !interpreter_path_.empty(); }
    const std::string& interpreter_path() const { return interpreter_path_; }

    // True when the kernel, not only the harness, confines file access.
    bool filesystem_isolation() const { return landlock_abi_ > 0; }

private:
    std::string interpreter_path_;
    std::string resolve_error_;
    std::vector<std::string> read_roots_;
    int landlock_abi_ = 0;
    bool require_filesystem_isolation_;
};

}
