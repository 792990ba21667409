#pragma once
#include <string>
#include <tree_sitter/api.h>
#include "model/ReviewTypes.hpp"

namespace pyguard::analysis {

// Owns one parsed tree plus a copy of the text it was parsed from.
class SyntaxTree {
public:
    SyntaxTree(TSTree* tree, std::string source) : tree_(tree), source_(std::move(source)) {}
    ~SyntaxTree() {
        if (tree_) ts_tree_delete(tree_);
    }

    SyntaxTree(const SyntaxTree&) = delete;
    SyntaxTree& operator=(const SyntaxTree&) = delete;
    SyntaxTree(SyntaxTree&& o) noexcept : tree_(o.tree_), source_(std::move(o.source_)) { o.tree_ = nullptr; }

    TSNode root() const { return ts_tree_root_node(tree_); }
    bool has_error() const { return ts_node_has_error(root()); }

    std::string text(TSNode node) const {
        uint32_t start = ts_node_start_byte(node);
        uint32_t end = ts_node_end_byte(node);
        if (start >= source_.size() || end <= start) return "";
        return source_.substr(start, end - start);
    }

    const std::string& source() const { return source_; }

private:
    TSTree* tree_;
    std::string source_;
};

// Not thread-safe: one parser per analyzer instance.
class PythonParser {
public:
    PythonParser();
    ~PythonParser();

    PythonParser(const PythonParser&) = delete;
    PythonParser& operator=(const PythonParser&) = delete;

    SyntaxTree parse(const std::string& source);

private:
    TSParser* parser_;
};

inline std::string node_type(TSNode node) { return ts_node_type(node); }

inline SourceLocation node_location(TSNode node) {
    TSPoint p = ts_node_start_point(node);
    return {static_cast<int>(p.row) + 1, static_cast<int>(p.column) + 1};
}

inline TSNode field(TSNode node, const char* name) {
    return ts_node_child_by_field_name(node, name, static_cast<uint32_t>(std::char_traits<char>::length(name)));
}

}
