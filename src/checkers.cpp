#include "backport/checkers.hpp"

namespace backport {

namespace {

bool is_guarded_builtin(const std::string& name){
    return name=="map" || name=="zip" || name=="filter" || name=="range";
}

[[noreturn]] void reject_rebinding(const std::string& name, const node& at){
    throw check_error("rebinding the builtin '" + name + "' is not supported when targeting Python 2", at);
}

} // namespace

NoOverriddenBuiltinsChecker::NoOverriddenBuiltinsChecker()
    : Checker("no_overridden_builtins", VersionInfo("2.0", "2.7")) {}

void NoOverriddenBuiltinsChecker::check(const node_ptr& tree) const {
    walk(tree, [](const node_ptr& n){
        switch(n->kind){
            case node_kind::Name:
                if(str(*n, "ctx")!="Load" && is_guarded_builtin(str(*n, "id"))) reject_rebinding(str(*n, "id"), *n);
                break;
            case node_kind::FunctionDef:
            case node_kind::AsyncFunctionDef:
            case node_kind::ClassDef:
                if(is_guarded_builtin(str(*n, "name"))) reject_rebinding(str(*n, "name"), *n);
                break;
            case node_kind::arg:
                if(is_guarded_builtin(str(*n, "arg"))) reject_rebinding(str(*n, "arg"), *n);
                break;
            case node_kind::alias: {
                // `import a.b` binds `a`
                std::string bound = str_if(*n, "asname") ? *str_if(*n, "asname") : str(*n, "name");
                bound = bound.substr(0, bound.find('.'));
                if(is_guarded_builtin(bound)) reject_rebinding(bound, *n);
                break;
            }
            case node_kind::ExceptHandler:
                if(auto* name = str_if(*n, "name"); name && is_guarded_builtin(*name)) reject_rebinding(*name, *n);
                break;
            case node_kind::Global:
            case node_kind::Nonlocal:
                for(auto& name : std::get<string_list>(field(*n, "names")))
                    if(is_guarded_builtin(name)) reject_rebinding(name, *n);
                break;
            default:
                break;
        }
    });
}

NoYieldFromChecker::NoYieldFromChecker()
    : Checker("no_yield_from", VersionInfo("1.0", "3.2")) {}

void NoYieldFromChecker::check(const node_ptr& tree) const {
    walk(tree, node_kind::YieldFrom, [](const node_ptr& n){
        throw check_error("'yield from' is not supported when targeting versions before 3.3", *n);
    });
}

NoMatMultOperatorChecker::NoMatMultOperatorChecker()
    : Checker("no_matmult_operator", VersionInfo("1.0", "3.4")) {}

void NoMatMultOperatorChecker::check(const node_ptr& tree) const {
    walk(tree, [](const node_ptr& n){
        if((is(n, node_kind::BinOp) || is(n, node_kind::AugAssign)) && str(*n, "op")=="MatMult")
            throw check_error("the '@' operator is not supported when targeting versions before 3.5", *n);
    });
}

CheckerRegistry default_checker_registry(){
    CheckerRegistry r;
    r.add<NoOverriddenBuiltinsChecker>({"itertools_builtins", "range_to_xrange"})
     .add<NoYieldFromChecker>()
     .add<NoMatMultOperatorChecker>();
    return r;
}

} // namespace backport
