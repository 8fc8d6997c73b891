#include "backport/fixers.hpp"

namespace backport {

namespace {

// Literals whose evaluation at call time instead of definition time is
// unobservable.
bool is_immutable_literal(const node_ptr& n){
    if(!n) return false;
    switch(n->kind){
        case node_kind::Num:
        case node_kind::Str:
        case node_kind::Bytes:
        case node_kind::NameConstant:
            return true;
        case node_kind::UnaryOp: {
            const auto& op = str(*n, "op");
            return (op=="USub" || op=="UAdd") && is(child(*n, "operand"), node_kind::Num);
        }
        case node_kind::Tuple:
            for(auto& e : children(*n, "elts")) if(!is_immutable_literal(e)) return false;
            return true;
        default:
            return false;
    }
}

bool is_docstring(const node_ptr& stmt){
    return is(stmt, node_kind::Expr) && is(child(*stmt, "value"), node_kind::Str);
}

} // namespace

InlineKwOnlyArgsFixer::InlineKwOnlyArgsFixer()
    : TransformerFixer("inline_kw_only_args", VersionInfo("1.0", "3.5"))
{
    auto inline_kw_only = [](const node_ptr& fn){
        auto& args = *child(*fn, "args");
        auto& kwonly = children(args, "kwonlyargs");
        if(kwonly.empty()) return rewrite_result::keep();
        auto& defaults = children(args, "kw_defaults");
        if(defaults.size()!=kwonly.size())
            throw structural_assumption_error("keyword-only parameters of '" + str(*fn, "name") + "' and their defaults differ in length", *fn);

        auto& kwarg = child(args, "kwarg");
        if(!kwarg) kwarg = n_arg("kwargs");
        const std::string kw_name = str(*kwarg, "arg");

        auto& body = children(*fn, "body");
        auto at = body.begin() + (!body.empty() && is_docstring(body.front()) ? 1 : 0);
        node_list lookups;
        for(size_t i=0;i<kwonly.size();++i){
            const auto& name = str(*kwonly[i], "arg");
            const auto& def = defaults[i];
            node_ptr value;
            if(!def){
                value = n_subscript(n_name(kw_name), n_index(n_str(name)));
            } else {
                if(!is_immutable_literal(def))
                    throw structural_assumption_error("default of keyword-only parameter '" + name + "' must be a literal, found " +
                                                      kind_name(def->kind), *def);
                value = n_call(n_attr(n_name(kw_name), "get"), {n_str(name), def});
            }
            auto stmt = n_assign({n_name(name, "Store")}, value);
            stmt->line = kwonly[i]->line; stmt->col = kwonly[i]->col;
            lookups.push_back(stmt);
        }
        body.insert(at, lookups.begin(), lookups.end());
        kwonly.clear();
        defaults.clear();
        return rewrite_result::keep();
    };
    transformer_.on(node_kind::FunctionDef, inline_kw_only).on(node_kind::AsyncFunctionDef, inline_kw_only);
    transformer_.on(node_kind::Lambda, [](const node_ptr& lam){
        if(!children(*child(*lam, "args"), "kwonlyargs").empty())
            throw structural_assumption_error("keyword-only parameters on a lambda cannot be inlined", *lam);
        return rewrite_result::keep();
    });
}

} // namespace backport
