#include "analysis/SyntaxTree.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

// 🚀 EXTERNAL SYMBOL LINKING (tree-sitter-python grammar)
extern "C" {
    TSLanguage* tree_sitter_python();
}

namespace pyguard::analysis {

PythonParser::PythonParser() {
    parser_ = ts_parser_new();
    if (!ts_parser_set_language(parser_, tree_sitter_python())) {
        ts_parser_delete(parser_);
        spdlog::critical("💥 tree-sitter-python grammar ABI does not match the tree-sitter runtime");
        throw std::runtime_error("incompatible tree-sitter-python grammar");
    }
}

PythonParser::~PythonParser() {
    if (parser_) ts_parser_delete(parser_);
}

SyntaxTree PythonParser::parse(const std::string& source) {
    TSTree* tree = ts_parser_parse_string(parser_, nullptr, source.c_str(), (uint32_t)source.length());
    if (!tree) throw std::runtime_error("tree-sitter failed to produce a syntax tree");
    return SyntaxTree(tree, source);
}

}
