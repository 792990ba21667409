#include "analysis/FindingAggregator.hpp"
#include <unordered_set>

namespace pyguard::analysis {

namespace {

std::optional<SourceLocation> trace_location(const ExecutionResult& result) {
    if (result.exception_trace && result.exception_trace->line) {
        return SourceLocation{*result.exception_trace->line, 0};
    }
    return std::nullopt;
}

bool same_line(const Finding& f, const SourceLocation& loc) {
    return f.location && f.location->line == loc.line;
}

// True when a static finding at the same line already explains the runtime fault.
bool explained_statically(const Finding& runtime, const ExecutionResult& result,
                          const std::vector<Finding>& static_findings) {
    if (!runtime.location) return false;
    const std::string type = result.exception_trace ? result.exception_trace->type : "";

    for (const auto& f : static_findings) {
        if (!same_line(f, *runtime.location)) continue;
        if (f.kind == FindingKind::SYNTAX) return true;
        if (f.code == "undefined-name" && (type == "NameError" || type == "UnboundLocalError")) return true;
        if (f.code == "type-mismatch" && type == "TypeError") return true;
    }
    return false;
}

}

std::optional<Finding> FindingAggregator::runtime_finding(const ExecutionResult& result) {
    switch (result.status) {
        case ExecutionStatus::SUCCESS:
            return std::nullopt;

        case ExecutionStatus::RUNTIME_ERROR: {
            std::string message;
            if (result.exception_trace) {
                const auto& trace = *result.exception_trace;
                message = trace.message.empty() ? trace.type : trace.type + ": " + trace.message;
            } else if (result.term_signal) {
                message = "process terminated by signal " + std::to_string(*result.term_signal);
            } else {
                message = "process exited with status " + std::to_string(result.exit_code.value_or(-1));
            }
            return make_finding(FindingKind::RUNTIME, "runtime-error", trace_location(result),
                                message, Severity::ERROR);
        }

        case ExecutionStatus::TIMEOUT:
            return make_finding(FindingKind::RUNTIME, "timeout", std::nullopt,
                                "execution timed out: possible infinite loop or performance issue",
                                Severity::ERROR);

        case ExecutionStatus::RESOURCE_LIMIT_EXCEEDED:
            return make_finding(FindingKind::RUNTIME, "resource-limit", trace_location(result),
                                "resource limit exceeded (" + (result.limit.empty() ? std::string("unknown") : result.limit) + ")",
                                Severity::ERROR);

        case ExecutionStatus::SANDBOX_VIOLATION:
            return make_finding(FindingKind::RUNTIME, "sandbox-violation", trace_location(result),
                                "sandbox violation: " + (result.violation.empty() ? std::string("forbidden operation") : result.violation),
                                Severity::CRITICAL);
    }
    return std::nullopt;
}

std::vector<Finding> FindingAggregator::aggregate(const std::vector<Finding>& static_findings,
                                                  const ExecutionResult& result) {
    std::vector<Finding> merged;
    std::unordered_set<std::string> seen;

    for (const auto& f : static_findings) {
        if (seen.insert(f.id).second) merged.push_back(f);
    }

    auto runtime = runtime_finding(result);
    if (runtime && !explained_statically(*runtime, result, static_findings) && seen.insert(runtime->id).second) {
        merged.push_back(std::move(*runtime));
    }
    return merged;
}

}
