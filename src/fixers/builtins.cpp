// Builtin renames for Python 2 targets.
#include "backport/fixers.hpp"

namespace backport {

ItertoolsBuiltinsFixer::ItertoolsBuiltinsFixer()
    : TransformerFixer("itertools_builtins", VersionInfo("2.0", "2.7"))
{
    // Only sound together with the no_overridden_builtins checker.
    transformer_.on(node_kind::Name, [this](const node_ptr& n){
        const auto& id = str(*n, "id");
        if(id!="map" && id!="zip" && id!="filter") return rewrite_result::keep();
        if(str(*n, "ctx")!="Load") return rewrite_result::keep();
        require_import("itertools");
        auto out = n_attr(n_name("itertools"), "i" + id);
        out->line = n->line; out->col = n->col;
        return rewrite_result::replace(out);
    });
}

RangeToXrangeFixer::RangeToXrangeFixer()
    : Fixer("range_to_xrange", VersionInfo("1.0", "2.7")) {}

node_ptr RangeToXrangeFixer::apply(const node_ptr& tree){
    walk(tree, node_kind::Name, [](const node_ptr& n){
        if(str(*n, "id")=="range" && str(*n, "ctx")=="Load") n->fields["id"] = std::string("xrange");
    });
    return tree;
}

} // namespace backport
