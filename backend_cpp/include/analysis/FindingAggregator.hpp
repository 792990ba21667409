#pragma once
#include <optional>
#include <vector>
#include "model/ReviewTypes.hpp"

namespace pyguard::analysis {

// Merges static findings with the outcome of one execution. Pure functions.
class FindingAggregator {
public:
    // Zero or one RUNTIME finding describing a non-successful execution.
    static std::optional<Finding> runtime_finding(const ExecutionResult& result);

    // Static findings (already ordered) followed by the runtime finding, duplicates removed.
    // A runtime finding already explained by a static one at the same line is dropped.
    static std::vector<Finding> aggregate(const std::vector<Finding>& static_findings,
                                          const ExecutionResult& result);
};

}
