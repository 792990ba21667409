#pragma once
#include <string>
#include <vector>
#include <memory>
#include <unordered_map>
#include <unordered_set>
#include "analysis/SyntaxTree.hpp"
#include "model/ReviewTypes.hpp"

namespace pyguard::analysis {

enum class ScopeKind { MODULE, FUNCTION, CLASS, COMPREHENSION };

enum class BindingKind {
    ASSIGNMENT,
    PATTERN,      // Unpacking target: never reported as unused
    PARAMETER,
    IMPORT,
    DEFINITION,   // def / class
    LOOP_VAR,
    ALIAS         // with ... as x, except ... as e
};

struct Binding {
    std::string name;
    BindingKind kind;
    SourceLocation location;
    bool used = false;
};

struct Scope {
    ScopeKind kind;
    Scope* parent = nullptr;
    std::vector<Binding> bindings;
    std::unordered_map<std::string, size_t> index;
    std::unordered_set<std::string> globals;
    std::unordered_set<std::string> nonlocals;
    bool star_import = false;
    bool uses_locals = false;
};

struct NameReference {
    std::string name;
    SourceLocation location;
    Scope* scope;
};

// Binding/reference pass over a syntactically valid tree. Recursive: callers
// must have rejected trees deeper than MAX_NESTING_DEPTH first.
class ScopeAnalysis {
public:
    explicit ScopeAnalysis(const SyntaxTree& tree);

    // Walks the tree, resolves references and appends findings in discovery order.
    void run(std::vector<Finding>& out);

    int function_count() const { return functions_; }
    int class_count() const { return classes_; }

private:
    const SyntaxTree& tree_;
    std::vector<std::unique_ptr<Scope>> scopes_;
    std::vector<NameReference> references_;
    std::vector<Finding> binding_findings_;
    int functions_ = 0;
    int classes_ = 0;

    Scope* new_scope(ScopeKind kind, Scope* parent);
    Scope* module() const { return scopes_.front().get(); }

    void visit(TSNode node, Scope* scope);
    void visit_children(TSNode node, Scope* scope);
    void visit_function(TSNode node, Scope* scope);
    void visit_lambda(TSNode node, Scope* scope);
    void visit_class(TSNode node, Scope* scope);
    void visit_comprehension(TSNode node, Scope* scope);
    void visit_parameters(TSNode params, Scope* fn_scope, Scope* enclosing);
    void visit_import(TSNode node, Scope* scope);
    void visit_import_from(TSNode node, Scope* scope);
    void visit_except(TSNode node, Scope* scope);
    void bind_target(TSNode node, Scope* scope, BindingKind kind);
    void bind_all_identifiers(TSNode node, Scope* scope, BindingKind kind);

    void add_binding(Scope* scope, const std::string& name, BindingKind kind, SourceLocation loc);
    void add_reference(Scope* scope, const std::string& name, SourceLocation loc);

    void resolve(std::vector<Finding>& out);
    void report_unused(std::vector<Finding>& out) const;
};

bool is_python_builtin(const std::string& name);

}
