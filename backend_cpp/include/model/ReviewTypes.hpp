#pragma once
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace pyguard {

enum class FindingKind {
    SYNTAX,   // Parser rejected the fragment
    RUNTIME,  // Derived from an ExecutionResult
    LINT,     // Style / hygiene (unused names, unreachable code)
    LOGICAL   // Will misbehave when run (undefined names, type mismatches)
};

enum class Severity { INFO, WARNING, ERROR, CRITICAL };

enum class ExecutionStatus {
    SUCCESS,
    RUNTIME_ERROR,
    TIMEOUT,
    RESOURCE_LIMIT_EXCEEDED,
    SANDBOX_VIOLATION
};

inline std::string finding_kind_to_string(FindingKind k) {
    switch (k) {
        case FindingKind::SYNTAX: return "Syntax";
        case FindingKind::RUNTIME: return "Runtime";
        case FindingKind::LINT: return "Lint";
        case FindingKind::LOGICAL: return "Logical";
    }
    return "Lint";
}

inline std::string severity_to_string(Severity s) {
    switch (s) {
        case Severity::INFO: return "info";
        case Severity::WARNING: return "warning";
        case Severity::ERROR: return "error";
        case Severity::CRITICAL: return "critical";
    }
    return "info";
}

inline std::string execution_status_to_string(ExecutionStatus s) {
    switch (s) {
        case ExecutionStatus::SUCCESS: return "Success";
        case ExecutionStatus::RUNTIME_ERROR: return "RuntimeError";
        case ExecutionStatus::TIMEOUT: return "Timeout";
        case ExecutionStatus::RESOURCE_LIMIT_EXCEEDED: return "ResourceLimitExceeded";
        case ExecutionStatus::SANDBOX_VIOLATION: return "SandboxViolation";
    }
    return "RuntimeError";
}

// Lower is healthier. Used to break ties between candidates with equal finding counts.
inline int status_anomaly_rank(ExecutionStatus s) {
    switch (s) {
        case ExecutionStatus::SUCCESS: return 0;
        case ExecutionStatus::RUNTIME_ERROR: return 1;
        default: return 2;
    }
}

// 1-based line. Column is 1-based, 0 when unknown (tracebacks only carry lines).
struct SourceLocation {
    int line = 0;
    int column = 0;

    bool operator==(const SourceLocation& o) const { return line == o.line && column == o.column; }
    bool operator<(const SourceLocation& o) const {
        return line != o.line ? line < o.line : column < o.column;
    }
};

// One immutable version of the code under analysis.
class SourceFragment {
public:
    explicit SourceFragment(std::string text,
                            std::optional<std::string> entry_point = std::nullopt,
                            uint32_t version = 0,
                            std::optional<uint32_t> parent_version = std::nullopt)
        : text_(std::move(text)), entry_point_(std::move(entry_point)),
          version_(version), parent_version_(parent_version) {}

    const std::string& text() const { return text_; }
    const std::optional<std::string>& entry_point() const { return entry_point_; }
    uint32_t version() const { return version_; }
    std::optional<uint32_t> parent_version() const { return parent_version_; }

    // New version carrying the same entry point; this fragment is left untouched.
    SourceFragment derive(std::string text, uint32_t version) const {
        return SourceFragment(std::move(text), entry_point_, version, version_);
    }

    nlohmann::json to_json() const;

private:
    std::string text_;
    std::optional<std::string> entry_point_;
    uint32_t version_;
    std::optional<uint32_t> parent_version_;
};

using FragmentPtr = std::shared_ptr<const SourceFragment>;

struct Finding {
    std::string id;       // Deterministic fingerprint, stable across iterations
    FindingKind kind = FindingKind::LINT;
    std::string code;     // e.g. "undefined-name", "timeout"
    std::optional<SourceLocation> location;
    std::string message;
    Severity severity = Severity::WARNING;

    nlohmann::json to_json() const;
};

Finding make_finding(FindingKind kind,
                     std::string code,
                     std::optional<SourceLocation> location,
                     std::string message,
                     Severity severity);

struct TraceFrame {
    int line = 0;
    std::string function;
};

struct ExceptionTrace {
    std::string type;       // e.g. "ZeroDivisionError"
    std::string message;
    std::optional<int> line; // Innermost line inside the fragment
    std::vector<TraceFrame> frames;
    std::string formatted;  // Traceback text restricted to fragment frames

    nlohmann::json to_json() const;
};

struct ResourceLimits {
    std::chrono::milliseconds max_wall_time{5000};
    uint64_t max_memory = 256ull * 1024 * 1024;
    size_t max_output_bytes = 64 * 1024;
    bool network_allowed = false;
    bool filesystem_allowed = false;

    ResourceLimits();

    // Throws ConfigError when a limit is out of range.
    void validate() const;

    nlohmann::json to_json() const;
    // Keys missing from `j` keep the value from `defaults`. Throws ConfigError.
    static ResourceLimits from_json(const nlohmann::json& j, const ResourceLimits& defaults = {});
};

inline ResourceLimits::ResourceLimits() = default;

struct ExecutionDiagnostics {
    int pid = -1;
    std::string scratch_path;
};

struct ExecutionResult {
    ExecutionStatus status = ExecutionStatus::SUCCESS;
    std::string stdout_data;
    std::string stderr_data;
    std::optional<ExceptionTrace> exception_trace;
    std::chrono::milliseconds wall_time{0};
    uint64_t peak_memory = 0;   // bytes

    std::optional<int> exit_code;
    std::optional<int> term_signal;
    std::string violation;      // detail for SANDBOX_VIOLATION
    std::string limit;          // "output", "memory", "cpu", "file-size"
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    uint32_t fragment_version = 0;
    ExecutionDiagnostics diagnostics;

    nlohmann::json to_json() const;
};

struct CorrectionCandidate {
    SourceFragment source;  // Untrusted, version unassigned until validated
    std::string rationale;
    std::vector<std::string> originating_finding_ids;

    nlohmann::json to_json() const;
};

nlohmann::json findings_to_json(const std::vector<Finding>& findings);

}
