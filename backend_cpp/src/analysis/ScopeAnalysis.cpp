#include "analysis/ScopeAnalysis.hpp"
#include <spdlog/spdlog.h>

namespace pyguard::analysis {

namespace {

const std::unordered_set<std::string>& builtin_names() {
    static const std::unordered_set<std::string> names = {
        "abs", "aiter", "all", "anext", "any", "ascii", "bin", "bool", "breakpoint", "bytearray",
        "bytes", "callable", "chr", "classmethod", "compile", "complex", "copyright", "credits",
        "delattr", "dict", "dir", "divmod", "enumerate", "eval", "exec", "exit", "filter", "float",
        "format", "frozenset", "getattr", "globals", "hasattr", "hash", "help", "hex", "id", "input",
        "int", "isinstance", "issubclass", "iter", "len", "license", "list", "locals", "map", "max",
        "memoryview", "min", "next", "object", "oct", "open", "ord", "pow", "print", "property",
        "quit", "range", "repr", "reversed", "round", "set", "setattr", "slice", "sorted",
        "staticmethod", "str", "sum", "super", "tuple", "type", "vars", "zip", "NotImplemented",
        "Ellipsis", "__import__", "__build_class__", "__debug__", "__doc__", "__name__",
        "__package__", "__loader__", "__spec__", "__file__", "__builtins__", "__annotations__",
        "__class__", "__module__", "__qualname__", "__dict__",
        "BaseException", "BaseExceptionGroup", "Exception", "ExceptionGroup", "ArithmeticError",
        "AssertionError", "AttributeError", "BlockingIOError", "BrokenPipeError", "BufferError",
        "BytesWarning", "ChildProcessError", "ConnectionAbortedError", "ConnectionError",
        "ConnectionRefusedError", "ConnectionResetError", "DeprecationWarning", "EOFError",
        "EncodingWarning", "EnvironmentError", "FileExistsError", "FileNotFoundError",
        "FloatingPointError", "FutureWarning", "GeneratorExit", "IOError", "ImportError",
        "ImportWarning", "IndentationError", "IndexError", "InterruptedError", "IsADirectoryError",
        "KeyError", "KeyboardInterrupt", "LookupError", "MemoryError", "ModuleNotFoundError",
        "NameError", "NotADirectoryError", "NotImplementedError", "OSError", "OverflowError",
        "PendingDeprecationWarning", "PermissionError", "ProcessLookupError", "RecursionError",
        "ReferenceError", "ResourceWarning", "RuntimeError", "RuntimeWarning",
        "StopAsyncIteration", "StopIteration", "SyntaxError", "SyntaxWarning", "SystemError",
        "SystemExit", "TabError", "TimeoutError", "TypeError", "UnboundLocalError",
        "UnicodeDecodeError", "UnicodeEncodeError", "UnicodeError", "UnicodeTranslateError",
        "UnicodeWarning", "UserWarning", "ValueError", "Warning", "ZeroDivisionError"
    };
    return names;
}

// Builtins people commonly clobber with a local name.
const std::unordered_set<std::string>& shadow_watchlist() {
    static const std::unordered_set<std::string> names = {
        "sum", "list", "dict", "set", "tuple", "str", "int", "float",
        "max", "min", "len", "id", "type", "input", "filter", "map", "open", "range"
    };
    return names;
}

bool reportable_shadow(BindingKind kind) {
    return kind != BindingKind::IMPORT;
}

}

bool is_python_builtin(const std::string& name) {
    return builtin_names().count(name) > 0;
}

ScopeAnalysis::ScopeAnalysis(const SyntaxTree& tree) : tree_(tree) {
    new_scope(ScopeKind::MODULE, nullptr);
}

Scope* ScopeAnalysis::new_scope(ScopeKind kind, Scope* parent) {
    auto scope = std::make_unique<Scope>();
    scope->kind = kind;
    scope->parent = parent;
    scopes_.push_back(std::move(scope));
    return scopes_.back().get();
}

void ScopeAnalysis::run(std::vector<Finding>& out) {
    visit_children(tree_.root(), module());

    for (auto& f : binding_findings_) out.push_back(std::move(f));
    binding_findings_.clear();

    resolve(out);
    report_unused(out);
}

void ScopeAnalysis::add_binding(Scope* scope, const std::string& name, BindingKind kind, SourceLocation loc) {
    if (name.empty()) return;

    if (scope->nonlocals.count(name)) return; // Lives in an enclosing function
    if (scope != module() && scope->globals.count(name)) scope = module();

    if (scope->index.count(name)) return; // Rebinding keeps the first location

    if (reportable_shadow(kind) && shadow_watchlist().count(name)) {
        binding_findings_.push_back(make_finding(
            FindingKind::LINT, "shadowed-builtin", loc,
            "'" + name + "' shadows a built-in", Severity::WARNING));
    }

    scope->index[name] = scope->bindings.size();
    scope->bindings.push_back({name, kind, loc, false});
}

void ScopeAnalysis::add_reference(Scope* scope, const std::string& name, SourceLocation loc) {
    if (name.empty()) return;
    if (name == "locals" || name == "vars") scope->uses_locals = true;
    references_.push_back({name, loc, scope});
}

void ScopeAnalysis::visit_children(TSNode node, Scope* scope) {
    uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; i++) {
        visit(ts_node_named_child(node, i), scope);
    }
}

void ScopeAnalysis::visit(TSNode node, Scope* scope) {
    if (ts_node_is_null(node)) return;
    const std::string type = node_type(node);

    if (type == "identifier") {
        add_reference(scope, tree_.text(node), node_location(node));
    } else if (type == "comment") {
        return;
    } else if (type == "function_definition") {
        visit_function(node, scope);
    } else if (type == "class_definition") {
        visit_class(node, scope);
    } else if (type == "lambda") {
        visit_lambda(node, scope);
    } else if (type == "list_comprehension" || type == "set_comprehension" ||
               type == "dictionary_comprehension" || type == "generator_expression") {
        visit_comprehension(node, scope);
    } else if (type == "assignment") {
        visit(field(node, "right"), scope);
        visit(field(node, "type"), scope);
        bind_target(field(node, "left"), scope, BindingKind::ASSIGNMENT);
    } else if (type == "augmented_assignment") {
        TSNode left = field(node, "left");
        visit(left, scope); // x += 1 reads x first
        visit(field(node, "right"), scope);
        bind_target(left, scope, BindingKind::PATTERN);
    } else if (type == "for_statement") {
        visit(field(node, "right"), scope);
        bind_target(field(node, "left"), scope, BindingKind::LOOP_VAR);
        visit(field(node, "body"), scope);
        visit(field(node, "alternative"), scope);
    } else if (type == "named_expression") {
        visit(field(node, "value"), scope);
        Scope* target = scope;
        while (target->kind == ScopeKind::COMPREHENSION && target->parent) target = target->parent;
        TSNode name = field(node, "name");
        if (!ts_node_is_null(name)) add_binding(target, tree_.text(name), BindingKind::ASSIGNMENT, node_location(name));
    } else if (type == "import_statement") {
        visit_import(node, scope);
    } else if (type == "import_from_statement") {
        visit_import_from(node, scope);
    } else if (type == "future_import_statement") {
        return;
    } else if (type == "global_statement" || type == "nonlocal_statement") {
        auto& target = (type == "global_statement") ? scope->globals : scope->nonlocals;
        uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = 0; i < count; i++) {
            TSNode child = ts_node_named_child(node, i);
            if (node_type(child) == "identifier") target.insert(tree_.text(child));
        }
    } else if (type == "attribute") {
        visit(field(node, "object"), scope);
    } else if (type == "keyword_argument") {
        visit(field(node, "value"), scope);
    } else if (type == "with_item" && !ts_node_is_null(field(node, "alias"))) {
        visit(field(node, "value"), scope);
        bind_target(field(node, "alias"), scope, BindingKind::ALIAS);
    } else if (type == "as_pattern") {
        TSNode alias = field(node, "alias");
        uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = 0; i < count; i++) {
            TSNode child = ts_node_named_child(node, i);
            if (!ts_node_is_null(alias) && ts_node_eq(child, alias)) continue;
            visit(child, scope);
        }
        if (!ts_node_is_null(alias)) bind_target(alias, scope, BindingKind::ALIAS);
    } else if (type == "except_clause") {
        visit_except(node, scope);
    } else if (type == "case_clause") {
        uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = 0; i < count; i++) {
            TSNode child = ts_node_named_child(node, i);
            if (node_type(child) == "case_pattern") bind_all_identifiers(child, scope, BindingKind::PATTERN);
            else visit(child, scope);
        }
    } else if (type == "dotted_name") {
        return; // Only appears in imports and match patterns
    } else {
        visit_children(node, scope);
    }
}

void ScopeAnalysis::visit_function(TSNode node, Scope* scope) {
    functions_++;
    TSNode name = field(node, "name");
    if (!ts_node_is_null(name)) add_binding(scope, tree_.text(name), BindingKind::DEFINITION, node_location(name));

    Scope* fn = new_scope(ScopeKind::FUNCTION, scope);
    visit_parameters(field(node, "parameters"), fn, scope);
    visit(field(node, "return_type"), scope);
    visit(field(node, "body"), fn);
}

void ScopeAnalysis::visit_lambda(TSNode node, Scope* scope) {
    Scope* fn = new_scope(ScopeKind::FUNCTION, scope);
    visit_parameters(field(node, "parameters"), fn, scope);
    visit(field(node, "body"), fn);
}

void ScopeAnalysis::visit_class(TSNode node, Scope* scope) {
    classes_++;
    TSNode name = field(node, "name");
    if (!ts_node_is_null(name)) add_binding(scope, tree_.text(name), BindingKind::DEFINITION, node_location(name));

    visit(field(node, "superclasses"), scope);
    Scope* cls = new_scope(ScopeKind::CLASS, scope);
    visit(field(node, "body"), cls);
}

void ScopeAnalysis::visit_comprehension(TSNode node, Scope* scope) {
    Scope* comp = new_scope(ScopeKind::COMPREHENSION, scope);
    bool first_clause = true;

    uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; i++) {
        TSNode child = ts_node_named_child(node, i);
        if (node_type(child) == "for_in_clause") {
            // The outermost iterable is evaluated in the enclosing scope.
            visit(field(child, "right"), first_clause ? scope : comp);
            bind_target(field(child, "left"), comp, BindingKind::LOOP_VAR);
            first_clause = false;
        } else {
            visit(child, comp);
        }
    }
}

void ScopeAnalysis::visit_parameters(TSNode params, Scope* fn_scope, Scope* enclosing) {
    if (ts_node_is_null(params)) return;

    uint32_t count = ts_node_named_child_count(params);
    for (uint32_t i = 0; i < count; i++) {
        TSNode p = ts_node_named_child(params, i);
        const std::string type = node_type(p);

        if (type == "identifier") {
            add_binding(fn_scope, tree_.text(p), BindingKind::PARAMETER, node_location(p));
        } else if (type == "default_parameter" || type == "typed_default_parameter") {
            TSNode name = field(p, "name");
            if (!ts_node_is_null(name)) bind_target(name, fn_scope, BindingKind::PARAMETER);
            visit(field(p, "type"), enclosing);
            visit(field(p, "value"), enclosing);
        } else if (type == "typed_parameter") {
            TSNode type_node = field(p, "type");
            uint32_t n = ts_node_named_child_count(p);
            for (uint32_t k = 0; k < n; k++) {
                TSNode child = ts_node_named_child(p, k);
                if (!ts_node_is_null(type_node) && ts_node_eq(child, type_node)) continue;
                bind_all_identifiers(child, fn_scope, BindingKind::PARAMETER);
                break;
            }
            visit(type_node, enclosing);
        } else if (type == "list_splat_pattern" || type == "dictionary_splat_pattern" || type == "tuple_pattern") {
            bind_all_identifiers(p, fn_scope, BindingKind::PARAMETER);
        }
        // keyword_separator / positional_separator bind nothing
    }
}

void ScopeAnalysis::visit_import(TSNode node, Scope* scope) {
    uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; i++) {
        TSNode child = ts_node_named_child(node, i);
        const std::string type = node_type(child);
        if (type == "aliased_import") {
            TSNode alias = field(child, "alias");
            if (!ts_node_is_null(alias)) add_binding(scope, tree_.text(alias), BindingKind::IMPORT, node_location(alias));
        } else if (type == "dotted_name" && ts_node_named_child_count(child) > 0) {
            // import os.path binds "os"
            TSNode head = ts_node_named_child(child, 0);
            add_binding(scope, tree_.text(head), BindingKind::IMPORT, node_location(head));
        }
    }
}

void ScopeAnalysis::visit_import_from(TSNode node, Scope* scope) {
    TSNode module_name = field(node, "module_name");

    uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; i++) {
        TSNode child = ts_node_named_child(node, i);
        if (!ts_node_is_null(module_name) && ts_node_eq(child, module_name)) continue;

        const std::string type = node_type(child);
        if (type == "wildcard_import") {
            scope->star_import = true;
        } else if (type == "aliased_import") {
            TSNode alias = field(child, "alias");
            if (!ts_node_is_null(alias)) add_binding(scope, tree_.text(alias), BindingKind::IMPORT, node_location(alias));
        } else if (type == "dotted_name" && ts_node_named_child_count(child) > 0) {
            TSNode name = ts_node_named_child(child, ts_node_named_child_count(child) - 1);
            add_binding(scope, tree_.text(name), BindingKind::IMPORT, node_location(name));
        }
    }
}

void ScopeAnalysis::visit_except(TSNode node, Scope* scope) {
    TSNode alias = field(node, "alias");
    if (!ts_node_is_null(alias)) {
        visit(field(node, "value"), scope);
        bind_target(alias, scope, BindingKind::ALIAS);
        uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = 0; i < count; i++) {
            TSNode child = ts_node_named_child(node, i);
            if (node_type(child) == "block") visit(child, scope);
        }
        return;
    }

    // Older grammars: except E as name  ->  children [expr, "as", identifier, block]
    bool after_as = false;
    uint32_t count = ts_node_child_count(node);
    for (uint32_t i = 0; i < count; i++) {
        TSNode child = ts_node_child(node, i);
        if (!ts_node_is_named(child)) {
            after_as = (node_type(child) == "as");
            continue;
        }
        if (after_as && node_type(child) == "identifier") {
            add_binding(scope, tree_.text(child), BindingKind::ALIAS, node_location(child));
        } else {
            visit(child, scope);
        }
        after_as = false;
    }
}

void ScopeAnalysis::bind_target(TSNode node, Scope* scope, BindingKind kind) {
    if (ts_node_is_null(node)) return;
    const std::string type = node_type(node);

    if (type == "identifier") {
        add_binding(scope, tree_.text(node), kind, node_location(node));
    } else if (type == "attribute" || type == "subscript") {
        visit(node, scope); // a.b = 1 reads a
    } else if (type == "pattern_list" || type == "tuple_pattern" || type == "list_pattern" ||
               type == "tuple" || type == "list" || type == "expression_list" ||
               type == "parenthesized_expression" || type == "list_splat_pattern" ||
               type == "list_splat" || type == "as_pattern_target") {
        uint32_t count = ts_node_named_child_count(node);
        if (count == 0 && type == "as_pattern_target") {
            add_binding(scope, tree_.text(node), kind, node_location(node));
            return;
        }
        BindingKind inner = (kind == BindingKind::ASSIGNMENT && type != "as_pattern_target" &&
                             type != "parenthesized_expression") ? BindingKind::PATTERN : kind;
        for (uint32_t i = 0; i < count; i++) {
            bind_target(ts_node_named_child(node, i), scope, inner);
        }
    } else {
        visit(node, scope);
    }
}

void ScopeAnalysis::bind_all_identifiers(TSNode node, Scope* scope, BindingKind kind) {
    if (ts_node_is_null(node)) return;
    if (node_type(node) == "identifier") {
        add_binding(scope, tree_.text(node), kind, node_location(node));
        return;
    }
    uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; i++) {
        bind_all_identifiers(ts_node_named_child(node, i), scope, kind);
    }
}

void ScopeAnalysis::resolve(std::vector<Finding>& out) {
    for (const auto& ref : references_) {
        Binding* found = nullptr;
        bool star_import = false;
        bool first = true;

        for (Scope* cur = ref.scope; cur; cur = cur->parent) {
            star_import = star_import || cur->star_import;
            // Class bodies are invisible to the functions nested inside them.
            if (cur->kind == ScopeKind::CLASS && !first) continue;
            first = false;

            if (cur != module() && cur->globals.count(ref.name)) {
                auto it = module()->index.find(ref.name);
                if (it != module()->index.end()) found = &module()->bindings[it->second];
                star_import = star_import || module()->star_import;
                break;
            }

            auto it = cur->index.find(ref.name);
            if (it != cur->index.end()) {
                found = &cur->bindings[it->second];
                break;
            }
        }

        if (found) {
            found->used = true;
            continue;
        }
        if (star_import || is_python_builtin(ref.name)) continue;

        out.push_back(make_finding(FindingKind::LOGICAL, "undefined-name", ref.location,
                                   "undefined name '" + ref.name + "'", Severity::ERROR));
    }
}

void ScopeAnalysis::report_unused(std::vector<Finding>& out) const {
    for (const auto& scope : scopes_) {
        if (scope->uses_locals) continue;
        for (const auto& b : scope->bindings) {
            if (b.used || b.name.empty() || b.name[0] == '_') continue;

            if (b.kind == BindingKind::IMPORT && scope->kind != ScopeKind::CLASS) {
                out.push_back(make_finding(FindingKind::LINT, "unused-import", b.location,
                                           "'" + b.name + "' imported but unused", Severity::WARNING));
            } else if (b.kind == BindingKind::ASSIGNMENT && scope->kind == ScopeKind::FUNCTION) {
                out.push_back(make_finding(FindingKind::LINT, "unused-variable", b.location,
                                           "local variable '" + b.name + "' is assigned to but never used",
                                           Severity::WARNING));
            }
        }
    }
}

}
