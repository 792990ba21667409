#pragma once
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>
#include "analysis/SyntaxTree.hpp"
#include "model/ReviewTypes.hpp"

namespace pyguard::analysis {

struct StructureSummary {
    int functions = 0;
    int classes = 0;

    nlohmann::json to_json() const {
        return {{"functions", functions}, {"classes", classes}};
    }
};

struct StaticReport {
    bool syntax_valid = true;
    std::vector<Finding> findings;
    StructureSummary structure;

    nlohmann::json to_json() const {
        return {
            {"syntax_valid", syntax_valid},
            {"findings", findings_to_json(findings)},
            {"structure", structure.to_json()}
        };
    }
};

// Deeper syntax trees are rejected as SYNTAX before any other pass runs.
const uint32_t MAX_NESTING_DEPTH = 1000;

/**
 * Parses a fragment and reports problems without running it.
 * Unparsable input yields exactly one SYNTAX finding and nothing else.
 * Not thread-safe (owns a tree-sitter parser); use one instance per session.
 */
class StaticAnalyzer {
public:
    StaticAnalyzer() = default;

    std::vector<Finding> analyze(const SourceFragment& source);
    StaticReport inspect(const SourceFragment& source);

    static bool has_syntax_finding(const std::vector<Finding>& findings);

private:
    PythonParser parser_;

    std::optional<Finding> find_parse_error(const SyntaxTree& tree) const;
    std::optional<Finding> find_nesting_error(const SyntaxTree& tree) const;
    std::optional<Finding> find_compile_error(const SyntaxTree& tree) const;
    void check_unreachable(TSNode root, std::vector<Finding>& out) const;
    void check_type_mismatch(TSNode root, std::vector<Finding>& out) const;
};

// Stable: equal locations keep discovery order, unlocated findings go last.
void sort_by_location(std::vector<Finding>& findings);

}
