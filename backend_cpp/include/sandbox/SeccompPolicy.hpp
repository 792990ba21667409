#pragma once
#include <vector>
#include <linux/filter.h>

namespace pyguard::sandbox {

// Syscall denylist for the sandboxed interpreter, compiled with libseccomp.
// Compilation allocates, so it runs in the parent; the child only installs
// the finished program (prctl is async-signal-safe).
class SeccompPolicy {
public:
    // Throws InfrastructureError when libseccomp cannot build the filter.
    static SeccompPolicy compile(bool network_allowed);

    // Valid while this policy is alive.
    const sock_fprog* program() const { return &program_; }
    size_t instruction_count() const { return filter_.size(); }

    SeccompPolicy(const SeccompPolicy&) = delete;
    SeccompPolicy& operator=(const SeccompPolicy&) = delete;
    SeccompPolicy(SeccompPolicy&& o) noexcept : filter_(std::move(o.filter_)) { refresh(); }

private:
    explicit SeccompPolicy(std::vector<sock_filter> filter) : filter_(std::move(filter)) { refresh(); }

    void refresh() {
        program_.len = static_cast<unsigned short>(filter_.size());
        program_.filter = filter_.data();
    }

    std::vector<sock_filter> filter_;
    sock_fprog program_{};
};

}
