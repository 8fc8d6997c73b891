// Node schemas, construction, validation and deep copy.
#include "backport/ast.hpp"

#include <algorithm>
#include <type_traits>
#include <unordered_map>

namespace backport
{

    structural_assumption_error::structural_assumption_error(const std::string &message, const node &at)
        : error("B200", message, at.line, at.col) {}

    check_error::check_error(const std::string &message, const node &at)
        : error("B500", message, at.line, at.col) {}

    namespace
    {
        using fc = field_class;
        using nk = node_kind;
        using cat = node_category;

        std::vector<kind_schema> build_schemas()
        {
            return {
                {nk::Module, "Module", cat::module, {{"body", fc::stmt_list, {}}}},

                {nk::FunctionDef, "FunctionDef", cat::stmt, {{"name", fc::string, {}}, {"args", fc::node, nk::arguments}, {"body", fc::stmt_list, {}}, {"decorator_list", fc::node_list, {}}, {"returns", fc::optional_node, {}}}},
                {nk::AsyncFunctionDef, "AsyncFunctionDef", cat::stmt, {{"name", fc::string, {}}, {"args", fc::node, nk::arguments}, {"body", fc::stmt_list, {}}, {"decorator_list", fc::node_list, {}}, {"returns", fc::optional_node, {}}}},
                {nk::ClassDef, "ClassDef", cat::stmt, {{"name", fc::string, {}}, {"bases", fc::node_list, {}}, {"keywords", fc::node_list, nk::keyword}, {"body", fc::stmt_list, {}}, {"decorator_list", fc::node_list, {}}}},
                {nk::Return, "Return", cat::stmt, {{"value", fc::optional_node, {}}}},
                {nk::Delete, "Delete", cat::stmt, {{"targets", fc::node_list, {}}}},
                {nk::Assign, "Assign", cat::stmt, {{"targets", fc::node_list, {}}, {"value", fc::node, {}}}},
                {nk::AugAssign, "AugAssign", cat::stmt, {{"target", fc::node, {}}, {"op", fc::string, {}}, {"value", fc::node, {}}}},
                {nk::AnnAssign, "AnnAssign", cat::stmt, {{"target", fc::node, {}}, {"annotation", fc::node, {}}, {"value", fc::optional_node, {}}, {"simple", fc::integer, {}}}},
                {nk::For, "For", cat::stmt, {{"target", fc::node, {}}, {"iter", fc::node, {}}, {"body", fc::stmt_list, {}}, {"orelse", fc::stmt_list, {}}}},
                {nk::AsyncFor, "AsyncFor", cat::stmt, {{"target", fc::node, {}}, {"iter", fc::node, {}}, {"body", fc::stmt_list, {}}, {"orelse", fc::stmt_list, {}}}},
                {nk::While, "While", cat::stmt, {{"test", fc::node, {}}, {"body", fc::stmt_list, {}}, {"orelse", fc::stmt_list, {}}}},
                {nk::If, "If", cat::stmt, {{"test", fc::node, {}}, {"body", fc::stmt_list, {}}, {"orelse", fc::stmt_list, {}}}},
                {nk::With, "With", cat::stmt, {{"items", fc::node_list, nk::withitem}, {"body", fc::stmt_list, {}}}},
                {nk::AsyncWith, "AsyncWith", cat::stmt, {{"items", fc::node_list, nk::withitem}, {"body", fc::stmt_list, {}}}},
                {nk::Raise, "Raise", cat::stmt, {{"exc", fc::optional_node, {}}, {"cause", fc::optional_node, {}}}},
                {nk::Try, "Try", cat::stmt, {{"body", fc::stmt_list, {}}, {"handlers", fc::node_list, nk::ExceptHandler}, {"orelse", fc::stmt_list, {}}, {"finalbody", fc::stmt_list, {}}}},
                {nk::Assert, "Assert", cat::stmt, {{"test", fc::node, {}}, {"msg", fc::optional_node, {}}}},
                {nk::Import, "Import", cat::stmt, {{"names", fc::node_list, nk::alias}}},
                {nk::ImportFrom, "ImportFrom", cat::stmt, {{"module", fc::optional_string, {}}, {"names", fc::node_list, nk::alias}, {"level", fc::integer, {}}}},
                {nk::Global, "Global", cat::stmt, {{"names", fc::string_list, {}}}},
                {nk::Nonlocal, "Nonlocal", cat::stmt, {{"names", fc::string_list, {}}}},
                {nk::Expr, "Expr", cat::stmt, {{"value", fc::node, {}}}},
                {nk::Pass, "Pass", cat::stmt, {}},
                {nk::Break, "Break", cat::stmt, {}},
                {nk::Continue, "Continue", cat::stmt, {}},

                {nk::arguments, "arguments", cat::aux, {{"args", fc::node_list, nk::arg}, {"vararg", fc::optional_node, nk::arg}, {"kwonlyargs", fc::node_list, nk::arg}, {"kw_defaults", fc::optional_node_list, {}}, {"kwarg", fc::optional_node, nk::arg}, {"defaults", fc::node_list, {}}}},
                {nk::arg, "arg", cat::aux, {{"arg", fc::string, {}}, {"annotation", fc::optional_node, {}}}},
                {nk::keyword, "keyword", cat::aux, {{"arg", fc::optional_string, {}}, {"value", fc::node, {}}}},
                {nk::alias, "alias", cat::aux, {{"name", fc::string, {}}, {"asname", fc::optional_string, {}}}},
                {nk::withitem, "withitem", cat::aux, {{"context_expr", fc::node, {}}, {"optional_vars", fc::optional_node, {}}}},
                {nk::ExceptHandler, "ExceptHandler", cat::aux, {{"type", fc::optional_node, {}}, {"name", fc::optional_string, {}}, {"body", fc::stmt_list, {}}}},
                {nk::comprehension, "comprehension", cat::aux, {{"target", fc::node, {}}, {"iter", fc::node, {}}, {"ifs", fc::node_list, {}}, {"is_async", fc::integer, {}}}},

                {nk::BoolOp, "BoolOp", cat::expr, {{"op", fc::string, {}}, {"values", fc::node_list, {}}}},
                {nk::BinOp, "BinOp", cat::expr, {{"left", fc::node, {}}, {"op", fc::string, {}}, {"right", fc::node, {}}}},
                {nk::UnaryOp, "UnaryOp", cat::expr, {{"op", fc::string, {}}, {"operand", fc::node, {}}}},
                {nk::Lambda, "Lambda", cat::expr, {{"args", fc::node, nk::arguments}, {"body", fc::node, {}}}},
                {nk::IfExp, "IfExp", cat::expr, {{"test", fc::node, {}}, {"body", fc::node, {}}, {"orelse", fc::node, {}}}},
                {nk::Dict, "Dict", cat::expr, {{"keys", fc::optional_node_list, {}}, {"values", fc::node_list, {}}}},
                {nk::Set, "Set", cat::expr, {{"elts", fc::node_list, {}}}},
                {nk::ListComp, "ListComp", cat::expr, {{"elt", fc::node, {}}, {"generators", fc::node_list, nk::comprehension}}},
                {nk::SetComp, "SetComp", cat::expr, {{"elt", fc::node, {}}, {"generators", fc::node_list, nk::comprehension}}},
                {nk::DictComp, "DictComp", cat::expr, {{"key", fc::node, {}}, {"value", fc::node, {}}, {"generators", fc::node_list, nk::comprehension}}},
                {nk::GeneratorExp, "GeneratorExp", cat::expr, {{"elt", fc::node, {}}, {"generators", fc::node_list, nk::comprehension}}},
                {nk::Await, "Await", cat::expr, {{"value", fc::node, {}}}},
                {nk::Yield, "Yield", cat::expr, {{"value", fc::optional_node, {}}}},
                {nk::YieldFrom, "YieldFrom", cat::expr, {{"value", fc::node, {}}}},
                {nk::Compare, "Compare", cat::expr, {{"left", fc::node, {}}, {"ops", fc::string_list, {}}, {"comparators", fc::node_list, {}}}},
                {nk::Call, "Call", cat::expr, {{"func", fc::node, {}}, {"args", fc::node_list, {}}, {"keywords", fc::node_list, nk::keyword}}},
                {nk::Num, "Num", cat::expr, {{"n", fc::constant, {}}}},
                {nk::Str, "Str", cat::expr, {{"s", fc::string, {}}}},
                {nk::Bytes, "Bytes", cat::expr, {{"s", fc::string, {}}}},
                {nk::FormattedValue, "FormattedValue", cat::expr, {{"value", fc::node, {}}, {"conversion", fc::integer, {}}, {"format_spec", fc::optional_node, nk::JoinedStr}}},
                {nk::JoinedStr, "JoinedStr", cat::expr, {{"values", fc::node_list, {}}}},
                {nk::NameConstant, "NameConstant", cat::expr, {{"value", fc::constant, {}}}},
                {nk::Ellipsis, "Ellipsis", cat::expr, {}},
                {nk::Attribute, "Attribute", cat::expr, {{"value", fc::node, {}}, {"attr", fc::string, {}}, {"ctx", fc::string, {}}}},
                {nk::Subscript, "Subscript", cat::expr, {{"value", fc::node, {}}, {"slice", fc::node, {}}, {"ctx", fc::string, {}}}},
                {nk::Starred, "Starred", cat::expr, {{"value", fc::node, {}}, {"ctx", fc::string, {}}}},
                {nk::Name, "Name", cat::expr, {{"id", fc::string, {}}, {"ctx", fc::string, {}}}},
                {nk::List, "List", cat::expr, {{"elts", fc::node_list, {}}, {"ctx", fc::string, {}}}},
                {nk::Tuple, "Tuple", cat::expr, {{"elts", fc::node_list, {}}, {"ctx", fc::string, {}}}},
                {nk::Index, "Index", cat::expr, {{"value", fc::node, {}}}},
                {nk::Slice, "Slice", cat::expr, {{"lower", fc::optional_node, {}}, {"upper", fc::optional_node, {}}, {"step", fc::optional_node, {}}}},
                {nk::ExtSlice, "ExtSlice", cat::expr, {{"dims", fc::node_list, {}}}},
            };
        }

        const std::vector<kind_schema> &schemas()
        {
            static const std::vector<kind_schema> table = []
            {
                auto t = build_schemas();
                std::sort(t.begin(), t.end(), [](const kind_schema &a, const kind_schema &b)
                          { return a.kind < b.kind; });
                return t;
            }();
            return table;
        }

        field_value default_value(field_class cls)
        {
            switch (cls)
            {
            case fc::node:
            case fc::optional_node:
                return node_ptr{};
            case fc::node_list:
            case fc::optional_node_list:
            case fc::stmt_list:
                return node_list{};
            case fc::string:
                return std::string{};
            case fc::string_list:
                return string_list{};
            case fc::integer:
                return int64_t{0};
            case fc::optional_string:
            case fc::constant:
                break;
            }
            return std::monostate{};
        }

        std::string where(const node &n, const char *field_name)
        {
            return std::string(kind_name(n.kind)) + "." + field_name;
        }

        void check_child(const node &owner, const field_spec &fs, const node_ptr &c)
        {
            if (fs.element)
            {
                if (c->kind != *fs.element)
                    throw structural_assumption_error(where(owner, fs.name) + " expects " + kind_name(*fs.element) + ", got " + kind_name(c->kind), *c);
                return;
            }
            auto want = fs.cls == fc::stmt_list ? node_category::stmt : node_category::expr;
            if (category_of(c->kind) != want)
                throw structural_assumption_error(where(owner, fs.name) + (want == node_category::stmt ? " expects a statement, got " : " expects an expression, got ") + kind_name(c->kind), *c);
        }

        void validate_node(const node_ptr &n)
        {
            const auto &schema = schema_of(n->kind);
            for (auto &kv : n->fields)
            {
                if (!find_field(n->kind, kv.first))
                    throw structural_assumption_error(std::string("unknown field ") + kind_name(n->kind) + "." + kv.first, *n);
            }
            for (const auto &fs : schema.fields)
            {
                auto it = n->fields.find(fs.name);
                if (it == n->fields.end())
                    throw structural_assumption_error("missing field " + where(*n, fs.name), *n);
                const auto &v = it->second;
                bool ok = false;
                switch (fs.cls)
                {
                case fc::node:
                case fc::optional_node:
                    if (auto *p = std::get_if<node_ptr>(&v))
                    {
                        ok = true;
                        if (*p)
                        {
                            check_child(*n, fs, *p);
                            validate_node(*p);
                        }
                        else if (fs.cls == fc::node)
                            throw structural_assumption_error("required field " + where(*n, fs.name) + " is empty", *n);
                    }
                    break;
                case fc::node_list:
                case fc::optional_node_list:
                case fc::stmt_list:
                    if (auto *p = std::get_if<node_list>(&v))
                    {
                        ok = true;
                        for (const auto &c : *p)
                        {
                            if (!c)
                            {
                                if (fs.cls != fc::optional_node_list)
                                    throw structural_assumption_error("null entry in " + where(*n, fs.name), *n);
                                continue;
                            }
                            check_child(*n, fs, c);
                            validate_node(c);
                        }
                    }
                    break;
                case fc::string:
                    ok = std::holds_alternative<std::string>(v);
                    break;
                case fc::optional_string:
                    ok = std::holds_alternative<std::string>(v) || std::holds_alternative<std::monostate>(v);
                    break;
                case fc::constant:
                    ok = !std::holds_alternative<node_ptr>(v) && !std::holds_alternative<node_list>(v) && !std::holds_alternative<string_list>(v);
                    break;
                case fc::string_list:
                    ok = std::holds_alternative<string_list>(v);
                    break;
                case fc::integer:
                    ok = std::holds_alternative<int64_t>(v);
                    break;
                }
                if (!ok)
                    throw structural_assumption_error("field " + where(*n, fs.name) + " holds a value of the wrong type", *n);
            }
        }
    } // namespace

    const kind_schema &schema_of(node_kind kind)
    {
        return schemas()[static_cast<size_t>(kind)];
    }

    const char *kind_name(node_kind kind) { return schema_of(kind).name; }

    node_category category_of(node_kind kind) { return schema_of(kind).category; }

    std::optional<node_kind> kind_from_name(std::string_view name)
    {
        static const std::unordered_map<std::string, node_kind> by_name = []
        {
            std::unordered_map<std::string, node_kind> m;
            for (const auto &s : schemas())
                m.emplace(s.name, s.kind);
            return m;
        }();
        auto it = by_name.find(std::string(name));
        if (it == by_name.end())
            return std::nullopt;
        return it->second;
    }

    const field_spec *find_field(node_kind kind, std::string_view name)
    {
        for (const auto &fs : schema_of(kind).fields)
            if (name == fs.name)
                return &fs;
        return nullptr;
    }

    bool is_statement_list_field(node_kind kind, std::string_view name)
    {
        const auto *fs = find_field(kind, name);
        return fs && fs->cls == fc::stmt_list;
    }

    std::vector<std::string> ordered_field_names(const node &n)
    {
        std::vector<std::string> out;
        out.reserve(n.fields.size());
        // std::map already iterates by name
        for (const auto &kv : n.fields)
            if (!is_statement_list_field(n.kind, kv.first))
                out.push_back(kv.first);
        for (const auto &kv : n.fields)
            if (is_statement_list_field(n.kind, kv.first))
                out.push_back(kv.first);
        return out;
    }

    node_ptr make_node(node_kind kind)
    {
        auto n = std::make_shared<node>();
        n->kind = kind;
        for (const auto &fs : schema_of(kind).fields)
            n->fields.emplace(fs.name, default_value(fs.cls));
        // no conversion
        if (kind == node_kind::FormattedValue)
            n->fields["conversion"] = int64_t{-1};
        return n;
    }

    node_ptr clone(const node_ptr &n)
    {
        if (!n)
            return nullptr;
        auto out = std::make_shared<node>();
        out->kind = n->kind;
        out->line = n->line;
        out->col = n->col;
        for (const auto &kv : n->fields)
        {
            std::visit([&](auto &&arg)
                       {
                using T = std::decay_t<decltype(arg)>;
                if constexpr (std::is_same_v<T, node_ptr>) out->fields[kv.first] = clone(arg);
                else if constexpr (std::is_same_v<T, node_list>) {
                    node_list l; l.reserve(arg.size());
                    for (const auto &c : arg) l.push_back(clone(c));
                    out->fields[kv.first] = std::move(l);
                }
                else out->fields[kv.first] = arg; },
                       kv.second);
        }
        return out;
    }

    void validate(const node_ptr &root)
    {
        if (!root)
            throw structural_assumption_error("tree is empty");
        validate_node(root);
    }

    field_value &field(node &n, std::string_view name)
    {
        auto it = n.fields.find(std::string(name));
        if (it == n.fields.end())
            throw structural_assumption_error("missing field " + std::string(kind_name(n.kind)) + "." + std::string(name), n);
        return it->second;
    }

    const field_value &field(const node &n, std::string_view name)
    {
        auto it = n.fields.find(std::string(name));
        if (it == n.fields.end())
            throw structural_assumption_error("missing field " + std::string(kind_name(n.kind)) + "." + std::string(name), n);
        return it->second;
    }

} // namespace backport
