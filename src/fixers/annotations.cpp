// Annotation removal: variable annotations and function signatures.
#include "backport/fixers.hpp"

namespace backport {

RemoveAnnAssignFixer::RemoveAnnAssignFixer()
    : TransformerFixer("remove_ann_assign", VersionInfo("1.0", "3.5"))
{
    transformer_.on(node_kind::AnnAssign, [](const node_ptr& n){
        auto target = child(*n, "target");
        if(!is(target, node_kind::Name))
            throw structural_assumption_error(std::string("annotated assignment to ") + kind_name(target->kind) +
                                              " is not supported, only plain names", *n);
        node_ptr value = child(*n, "value");
        if(!value) value = n_none();
        auto out = n_assign({target}, value);
        out->line = n->line; out->col = n->col;
        return rewrite_result::replace(out);
    });
}

RemoveFunctionDefAnnotationsFixer::RemoveFunctionDefAnnotationsFixer()
    : Fixer("remove_function_def_annotations", VersionInfo("1.0", "2.7")) {}

node_ptr RemoveFunctionDefAnnotationsFixer::apply(const node_ptr& tree){
    walk(tree, [](const node_ptr& fn){
        if(!is(fn, node_kind::FunctionDef) && !is(fn, node_kind::AsyncFunctionDef)) return;
        child(*fn, "returns") = nullptr;
        auto& args = *child(*fn, "args");
        for(auto& a : children(args, "args")) child(*a, "annotation") = nullptr;
        for(auto& a : children(args, "kwonlyargs")) child(*a, "annotation") = nullptr;
        if(auto& v = child(args, "vararg")) child(*v, "annotation") = nullptr;
        if(auto& k = child(args, "kwarg")) child(*k, "annotation") = nullptr;
    });
    return tree;
}

} // namespace backport
