#include "analysis/StaticAnalyzer.hpp"
#include "analysis/ScopeAnalysis.hpp"
#include "utils/Scrubber.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stack>

namespace pyguard::analysis {

namespace {

std::string first_line(const std::string& text) {
    std::string line = text.substr(0, text.find('\n'));
    size_t start = line.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    line = line.substr(start);
    line.erase(line.find_last_not_of(" \t\r") + 1);
    return line.size() > 40 ? utf8_safe_substr(line, 40) + "..." : line;
}

bool is_terminator(const std::string& type) {
    return type == "return_statement" || type == "raise_statement" ||
           type == "break_statement" || type == "continue_statement";
}

std::string terminator_keyword(const std::string& type) {
    return type.substr(0, type.find('_'));
}

// Literal type for the operand checks; empty when not a literal.
std::string literal_type(TSNode node) {
    const std::string type = node_type(node);
    if (type == "string" || type == "concatenated_string") return "str";
    if (type == "integer") return "int";
    if (type == "float") return "float";
    return "";
}

Finding syntax_error(TSNode node, const std::string& message) {
    return make_finding(FindingKind::SYNTAX, "syntax-error", node_location(node), message, Severity::ERROR);
}

// Context a node is compiled in.
struct CompileFrame {
    TSNode node;
    bool in_function;
    bool in_loop;
    bool at_module;
};

}

void sort_by_location(std::vector<Finding>& findings) {
    std::stable_sort(findings.begin(), findings.end(), [](const Finding& a, const Finding& b) {
        if (!a.location) return false;
        if (!b.location) return true;
        return *a.location < *b.location;
    });
}

bool StaticAnalyzer::has_syntax_finding(const std::vector<Finding>& findings) {
    return std::any_of(findings.begin(), findings.end(),
                       [](const Finding& f) { return f.kind == FindingKind::SYNTAX; });
}

std::vector<Finding> StaticAnalyzer::analyze(const SourceFragment& source) {
    return inspect(source).findings;
}

StaticReport StaticAnalyzer::inspect(const SourceFragment& source) {
    StaticReport report;
    SyntaxTree tree = parser_.parse(source.text());

    std::optional<Finding> syntax;
    if (tree.has_error()) {
        syntax = find_parse_error(tree);
    } else {
        syntax = find_nesting_error(tree);
        if (!syntax) syntax = find_compile_error(tree);
    }
    if (syntax) {
        report.syntax_valid = false;
        report.findings.push_back(std::move(*syntax));
        spdlog::debug("🧩 Fragment v{} rejected by parser: {}", source.version(), report.findings.back().message);
        return report;
    }

    ScopeAnalysis scopes(tree);
    scopes.run(report.findings);
    check_unreachable(tree.root(), report.findings);
    check_type_mismatch(tree.root(), report.findings);

    sort_by_location(report.findings);
    report.structure.functions = scopes.function_count();
    report.structure.classes = scopes.class_count();

    spdlog::debug("🧩 Fragment v{}: {} static findings", source.version(), report.findings.size());
    return report;
}

std::optional<Finding> StaticAnalyzer::find_parse_error(const SyntaxTree& tree) const {
    std::stack<TSNode> traversal_stack;
    traversal_stack.push(tree.root());

    while (!traversal_stack.empty()) {
        TSNode node = traversal_stack.top();
        traversal_stack.pop();

        if (ts_node_is_missing(node)) {
            return make_finding(FindingKind::SYNTAX, "syntax-error", node_location(node),
                                "expected '" + node_type(node) + "'", Severity::ERROR);
        }
        if (node_type(node) == "ERROR") {
            std::string near = first_line(tree.text(node));
            std::string message = near.empty() ? "invalid syntax" : "invalid syntax near '" + near + "'";
            return make_finding(FindingKind::SYNTAX, "syntax-error", node_location(node), message, Severity::ERROR);
        }

        // Reverse push keeps preorder.
        uint32_t count = ts_node_child_count(node);
        for (uint32_t i = count; i > 0; i--) {
            TSNode child = ts_node_child(node, i - 1);
            if (ts_node_has_error(child)) traversal_stack.push(child);
        }
    }

    // has_error() with no located node: report at the start of the fragment.
    return make_finding(FindingKind::SYNTAX, "syntax-error", SourceLocation{1, 1}, "invalid syntax", Severity::ERROR);
}

std::optional<Finding> StaticAnalyzer::find_nesting_error(const SyntaxTree& tree) const {
    std::stack<std::pair<TSNode, uint32_t>> traversal_stack;
    traversal_stack.push({tree.root(), 0});

    while (!traversal_stack.empty()) {
        auto [node, depth] = traversal_stack.top();
        traversal_stack.pop();

        if (depth > MAX_NESTING_DEPTH) {
            return syntax_error(node, "too many nested levels (limit " + std::to_string(MAX_NESTING_DEPTH) + ")");
        }
        uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = count; i > 0; i--) {
            traversal_stack.push({ts_node_named_child(node, i - 1), depth + 1});
        }
    }
    return std::nullopt;
}

std::optional<Finding> StaticAnalyzer::find_compile_error(const SyntaxTree& tree) const {
    std::stack<CompileFrame> traversal_stack;
    traversal_stack.push({tree.root(), false, false, true});

    while (!traversal_stack.empty()) {
        CompileFrame frame = traversal_stack.top();
        traversal_stack.pop();
        TSNode node = frame.node;
        if (ts_node_is_null(node)) continue;
        const std::string type = node_type(node);

        if (type == "return_statement" && !frame.in_function) return syntax_error(node, "'return' outside function");
        if (type == "yield" && !frame.in_function) return syntax_error(node, "'yield' outside function");
        if (type == "break_statement" && !frame.in_loop) return syntax_error(node, "'break' outside loop");
        if (type == "continue_statement" && !frame.in_loop) return syntax_error(node, "'continue' not properly in loop");
        if (type == "nonlocal_statement" && frame.at_module) {
            return syntax_error(node, "nonlocal declaration not allowed at module level");
        }
        if (type == "print_statement") return syntax_error(node, "Missing parentheses in call to 'print'. Did you mean print(...)?");
        if (type == "exec_statement") return syntax_error(node, "Missing parentheses in call to 'exec'");

        // Children go on in reverse so the first error in source order wins.
        if (type == "function_definition") {
            traversal_stack.push({field(node, "body"), true, false, false});
            traversal_stack.push({field(node, "parameters"), frame.in_function, frame.in_loop, frame.at_module});
            continue;
        }
        if (type == "class_definition") {
            traversal_stack.push({field(node, "body"), false, false, false});
            traversal_stack.push({field(node, "superclasses"), frame.in_function, frame.in_loop, frame.at_module});
            continue;
        }
        if (type == "lambda") {
            traversal_stack.push({field(node, "body"), true, false, false});
            continue;
        }

        uint32_t count = ts_node_named_child_count(node);
        bool loop = type == "for_statement" || type == "while_statement";
        TSNode body = loop ? field(node, "body") : TSNode{};
        for (uint32_t i = count; i > 0; i--) {
            TSNode child = ts_node_named_child(node, i - 1);
            // The else clause is not part of the loop.
            bool in_loop = (loop && ts_node_eq(child, body)) ? true : frame.in_loop;
            traversal_stack.push({child, frame.in_function, in_loop, frame.at_module});
        }
    }
    return std::nullopt;
}

void StaticAnalyzer::check_unreachable(TSNode root, std::vector<Finding>& out) const {
    std::stack<TSNode> traversal_stack;
    traversal_stack.push(root);

    while (!traversal_stack.empty()) {
        TSNode node = traversal_stack.top();
        traversal_stack.pop();
        const std::string type = node_type(node);
        uint32_t count = ts_node_named_child_count(node);

        if (type == "block" || type == "module") {
            std::string terminated_by;
            for (uint32_t i = 0; i < count; i++) {
                TSNode child = ts_node_named_child(node, i);
                const std::string child_type = node_type(child);
                if (child_type == "comment") continue;

                if (!terminated_by.empty()) {
                    out.push_back(make_finding(FindingKind::LINT, "unreachable-code", node_location(child),
                                               "unreachable code after '" + terminated_by + "'", Severity::WARNING));
                    break;
                }
                if (is_terminator(child_type)) terminated_by = terminator_keyword(child_type);
            }
        }

        for (uint32_t i = count; i > 0; i--) {
            traversal_stack.push(ts_node_named_child(node, i - 1));
        }
    }
}

void StaticAnalyzer::check_type_mismatch(TSNode root, std::vector<Finding>& out) const {
    std::stack<TSNode> traversal_stack;
    traversal_stack.push(root);

    while (!traversal_stack.empty()) {
        TSNode node = traversal_stack.top();
        traversal_stack.pop();

        if (node_type(node) == "binary_operator") {
            TSNode op = field(node, "operator");
            std::string op_text = ts_node_is_null(op) ? "" : node_type(op);
            std::string left = literal_type(field(node, "left"));
            std::string right = literal_type(field(node, "right"));

            bool mismatch = false;
            if (op_text == "+") {
                mismatch = (left == "str" && (right == "int" || right == "float")) ||
                           (right == "str" && (left == "int" || left == "float"));
            } else if (op_text == "-") {
                mismatch = left == "str" || right == "str";
            }

            if (mismatch) {
                std::string message = "unsupported operand type(s) for " + op_text + ": '" +
                                      (left.empty() ? "object" : left) + "' and '" +
                                      (right.empty() ? "object" : right) + "'";
                out.push_back(make_finding(FindingKind::LOGICAL, "type-mismatch", node_location(node),
                                           message, Severity::ERROR));
            }
        }

        uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = count; i > 0; i--) {
            traversal_stack.push(ts_node_named_child(node, i - 1));
        }
    }
}

}
