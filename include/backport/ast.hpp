// Schema-checked syntax tree: closed node kinds, named fields, source positions.
#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "backport/errors.hpp"

namespace backport
{

    enum class node_kind : uint8_t
    {
        Module,
        // statements
        FunctionDef,
        AsyncFunctionDef,
        ClassDef,
        Return,
        Delete,
        Assign,
        AugAssign,
        AnnAssign,
        For,
        AsyncFor,
        While,
        If,
        With,
        AsyncWith,
        Raise,
        Try,
        Assert,
        Import,
        ImportFrom,
        Global,
        Nonlocal,
        Expr,
        Pass,
        Break,
        Continue,
        // auxiliary
        arguments,
        arg,
        keyword,
        alias,
        withitem,
        ExceptHandler,
        comprehension,
        // expressions
        BoolOp,
        BinOp,
        UnaryOp,
        Lambda,
        IfExp,
        Dict,
        Set,
        ListComp,
        SetComp,
        DictComp,
        GeneratorExp,
        Await,
        Yield,
        YieldFrom,
        Compare,
        Call,
        Num,
        Str,
        Bytes,
        FormattedValue,
        JoinedStr,
        NameConstant,
        Ellipsis,
        Attribute,
        Subscript,
        Starred,
        Name,
        List,
        Tuple,
        Index,
        Slice,
        ExtSlice,
    };

    enum class node_category : uint8_t
    {
        module,
        stmt,
        expr,
        aux
    };

    enum class field_class : uint8_t
    {
        node,               // required child
        optional_node,      // child or null
        node_list,          // children, never null
        optional_node_list, // children, null entries allowed (Dict keys, kw_defaults)
        stmt_list,          // block body
        string,
        optional_string,
        constant, // none, bool, int or float
        string_list,
        integer
    };

    struct field_spec
    {
        const char *name;
        field_class cls;
        // Required kind of the children; unset means "any expression" (or "any
        // statement" for stmt_list fields).
        std::optional<node_kind> element;
    };

    struct kind_schema
    {
        node_kind kind;
        const char *name;
        node_category category;
        std::vector<field_spec> fields;
    };

    struct node;
    using node_ptr = std::shared_ptr<node>;
    using node_list = std::vector<node_ptr>;
    using string_list = std::vector<std::string>;

    using field_value = std::variant<std::monostate, bool, int64_t, double, std::string, string_list, node_ptr, node_list>;

    struct node
    {
        node_kind kind;
        std::map<std::string, field_value> fields;
        int line = -1;
        int col = -1;
    };

    // ---- schema ----
    const kind_schema &schema_of(node_kind kind);
    const char *kind_name(node_kind kind);
    std::optional<node_kind> kind_from_name(std::string_view name);
    node_category category_of(node_kind kind);
    const field_spec *find_field(node_kind kind, std::string_view name);
    bool is_statement_list_field(node_kind kind, std::string_view name);
    inline bool is_statement(node_kind k) { return category_of(k) == node_category::stmt; }
    inline bool is_expression(node_kind k) { return category_of(k) == node_category::expr; }

    // Field names of n in traversal order: every non-statement-list field
    // first, then the statement-list fields; each group sorted by name.
    std::vector<std::string> ordered_field_names(const node &n);

    // ---- whole-tree operations ----
    // New node of the given kind with every schema field at its default
    // (null child, empty list, empty string, none; -1 for FormattedValue.conversion).
    node_ptr make_node(node_kind kind);
    node_ptr clone(const node_ptr &n);
    // Throws structural_assumption_error at the first node that breaks its schema.
    void validate(const node_ptr &root);
    bool equal(const node_ptr &a, const node_ptr &b, bool ignore_positions = true);
    std::string to_string(const node_ptr &n);
    std::string to_pretty_string(const node_ptr &n, int indentWidth = 2);

    // ---- field access ----
    // Typed lookups throw structural_assumption_error when the field is absent
    // or holds a different alternative.
    field_value &field(node &n, std::string_view name);
    const field_value &field(const node &n, std::string_view name);

    inline node_ptr &child(node &n, std::string_view name)
    {
        auto &v = field(n, name);
        if (auto *p = std::get_if<node_ptr>(&v))
            return *p;
        throw structural_assumption_error(std::string(kind_name(n.kind)) + "." + std::string(name) + " is not a single node", n);
    }
    inline node_list &children(node &n, std::string_view name)
    {
        auto &v = field(n, name);
        if (auto *p = std::get_if<node_list>(&v))
            return *p;
        throw structural_assumption_error(std::string(kind_name(n.kind)) + "." + std::string(name) + " is not a node list", n);
    }
    inline const std::string &str(const node &n, std::string_view name)
    {
        auto &v = field(n, name);
        if (auto *p = std::get_if<std::string>(&v))
            return *p;
        throw structural_assumption_error(std::string(kind_name(n.kind)) + "." + std::string(name) + " is not a string", n);
    }
    inline const std::string *str_if(const node &n, std::string_view name)
    {
        return std::get_if<std::string>(&field(n, name));
    }

    inline bool is(const node_ptr &n, node_kind k) { return n && n->kind == k; }
    inline bool is_name(const node_ptr &n, std::string_view id) { return is(n, node_kind::Name) && str(*n, "id") == id; }

    // ---- factories ----
    inline node_ptr with_fields(node_kind kind, std::initializer_list<std::pair<const char *, field_value>> fs)
    {
        auto n = make_node(kind);
        for (auto &kv : fs)
            n->fields[kv.first] = kv.second;
        return n;
    }

    inline node_ptr n_module(node_list body) { return with_fields(node_kind::Module, {{"body", std::move(body)}}); }
    inline node_ptr n_name(std::string id, std::string ctx = "Load")
    {
        return with_fields(node_kind::Name, {{"id", std::move(id)}, {"ctx", std::move(ctx)}});
    }
    inline node_ptr n_str(std::string s) { return with_fields(node_kind::Str, {{"s", std::move(s)}}); }
    inline node_ptr n_num(int64_t v) { return with_fields(node_kind::Num, {{"n", v}}); }
    inline node_ptr n_float(double v) { return with_fields(node_kind::Num, {{"n", v}}); }
    inline node_ptr n_bool(bool b) { return with_fields(node_kind::NameConstant, {{"value", b}}); }
    inline node_ptr n_none() { return make_node(node_kind::NameConstant); }
    inline node_ptr n_attr(node_ptr value, std::string attr, std::string ctx = "Load")
    {
        return with_fields(node_kind::Attribute, {{"value", std::move(value)}, {"attr", std::move(attr)}, {"ctx", std::move(ctx)}});
    }
    inline node_ptr n_call(node_ptr func, node_list args = {}, node_list keywords = {})
    {
        return with_fields(node_kind::Call, {{"func", std::move(func)}, {"args", std::move(args)}, {"keywords", std::move(keywords)}});
    }
    inline node_ptr n_starred(node_ptr value, std::string ctx = "Load")
    {
        return with_fields(node_kind::Starred, {{"value", std::move(value)}, {"ctx", std::move(ctx)}});
    }
    inline node_ptr n_keyword(std::string arg, node_ptr value)
    {
        return with_fields(node_kind::keyword, {{"arg", std::move(arg)}, {"value", std::move(value)}});
    }
    // The `**value` entry of a call.
    inline node_ptr n_kwsplat(node_ptr value) { return with_fields(node_kind::keyword, {{"value", std::move(value)}}); }
    inline node_ptr n_list(node_list elts, std::string ctx = "Load")
    {
        return with_fields(node_kind::List, {{"elts", std::move(elts)}, {"ctx", std::move(ctx)}});
    }
    inline node_ptr n_tuple(node_list elts, std::string ctx = "Load")
    {
        return with_fields(node_kind::Tuple, {{"elts", std::move(elts)}, {"ctx", std::move(ctx)}});
    }
    inline node_ptr n_set(node_list elts) { return with_fields(node_kind::Set, {{"elts", std::move(elts)}}); }
    // A null key marks a `**value` entry.
    inline node_ptr n_dict(node_list keys, node_list values)
    {
        return with_fields(node_kind::Dict, {{"keys", std::move(keys)}, {"values", std::move(values)}});
    }
    inline node_ptr n_index(node_ptr value) { return with_fields(node_kind::Index, {{"value", std::move(value)}}); }
    inline node_ptr n_subscript(node_ptr value, node_ptr slice, std::string ctx = "Load")
    {
        return with_fields(node_kind::Subscript, {{"value", std::move(value)}, {"slice", std::move(slice)}, {"ctx", std::move(ctx)}});
    }
    inline node_ptr n_binop(node_ptr left, std::string op, node_ptr right)
    {
        return with_fields(node_kind::BinOp, {{"left", std::move(left)}, {"op", std::move(op)}, {"right", std::move(right)}});
    }
    inline node_ptr n_formatted_value(node_ptr value, int64_t conversion = -1, node_ptr format_spec = nullptr)
    {
        return with_fields(node_kind::FormattedValue, {{"value", std::move(value)}, {"conversion", conversion}, {"format_spec", std::move(format_spec)}});
    }
    inline node_ptr n_joined_str(node_list values) { return with_fields(node_kind::JoinedStr, {{"values", std::move(values)}}); }
    inline node_ptr n_lambda(node_ptr args, node_ptr body)
    {
        return with_fields(node_kind::Lambda, {{"args", std::move(args)}, {"body", std::move(body)}});
    }

    inline node_ptr n_arg(std::string name, node_ptr annotation = nullptr)
    {
        return with_fields(node_kind::arg, {{"arg", std::move(name)}, {"annotation", std::move(annotation)}});
    }
    inline node_ptr n_arguments(node_list args = {}, node_ptr vararg = nullptr, node_list kwonlyargs = {},
                                node_list kw_defaults = {}, node_ptr kwarg = nullptr, node_list defaults = {})
    {
        return with_fields(node_kind::arguments, {{"args", std::move(args)}, {"vararg", std::move(vararg)}, {"kwonlyargs", std::move(kwonlyargs)}, {"kw_defaults", std::move(kw_defaults)}, {"kwarg", std::move(kwarg)}, {"defaults", std::move(defaults)}});
    }
    inline node_ptr n_alias(std::string name) { return with_fields(node_kind::alias, {{"name", std::move(name)}}); }
    inline node_ptr n_alias(std::string name, std::string asname)
    {
        return with_fields(node_kind::alias, {{"name", std::move(name)}, {"asname", std::move(asname)}});
    }

    inline node_ptr n_expr(node_ptr value) { return with_fields(node_kind::Expr, {{"value", std::move(value)}}); }
    inline node_ptr n_assign(node_list targets, node_ptr value)
    {
        return with_fields(node_kind::Assign, {{"targets", std::move(targets)}, {"value", std::move(value)}});
    }
    inline node_ptr n_ann_assign(node_ptr target, node_ptr annotation, node_ptr value = nullptr)
    {
        return with_fields(node_kind::AnnAssign, {{"target", std::move(target)}, {"annotation", std::move(annotation)}, {"value", std::move(value)}, {"simple", int64_t{1}}});
    }
    inline node_ptr n_delete(node_list targets) { return with_fields(node_kind::Delete, {{"targets", std::move(targets)}}); }
    inline node_ptr n_return(node_ptr value = nullptr) { return with_fields(node_kind::Return, {{"value", std::move(value)}}); }
    inline node_ptr n_pass() { return make_node(node_kind::Pass); }
    inline node_ptr n_if(node_ptr test, node_list body, node_list orelse = {})
    {
        return with_fields(node_kind::If, {{"test", std::move(test)}, {"body", std::move(body)}, {"orelse", std::move(orelse)}});
    }
    inline node_ptr n_while(node_ptr test, node_list body)
    {
        return with_fields(node_kind::While, {{"test", std::move(test)}, {"body", std::move(body)}});
    }
    inline node_ptr n_for(node_ptr target, node_ptr iter, node_list body)
    {
        return with_fields(node_kind::For, {{"target", std::move(target)}, {"iter", std::move(iter)}, {"body", std::move(body)}});
    }
    inline node_ptr n_function_def(std::string name, node_ptr args, node_list body, node_list decorators = {}, node_ptr returns = nullptr)
    {
        return with_fields(node_kind::FunctionDef, {{"name", std::move(name)}, {"args", std::move(args)}, {"body", std::move(body)}, {"decorator_list", std::move(decorators)}, {"returns", std::move(returns)}});
    }
    inline node_ptr n_class_def(std::string name, node_list bases, node_list body)
    {
        return with_fields(node_kind::ClassDef, {{"name", std::move(name)}, {"bases", std::move(bases)}, {"body", std::move(body)}});
    }
    inline node_ptr n_import(node_list names) { return with_fields(node_kind::Import, {{"names", std::move(names)}}); }
    inline node_ptr n_import_from(std::string module, node_list names, int64_t level = 0)
    {
        return with_fields(node_kind::ImportFrom, {{"module", std::move(module)}, {"names", std::move(names)}, {"level", level}});
    }

} // namespace backport
