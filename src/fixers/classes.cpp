// Class rewrites: explicit object base and two-argument super().
#include "backport/fixers.hpp"

#include <functional>

namespace backport {

namespace {

// Pre-order walk that does not enter nested class bodies; those get their
// own visit with their own class name.
void walk_method(const node_ptr& n, const std::function<void(const node_ptr&)>& fn){
    if(!n) return;
    fn(n);
    for(auto& name : ordered_field_names(*n)){
        auto& v = n->fields.at(name);
        if(auto* p = std::get_if<node_ptr>(&v)){
            if(!is(*p, node_kind::ClassDef)) walk_method(*p, fn);
        } else if(auto* l = std::get_if<node_list>(&v)){
            for(auto& c : *l) if(!is(c, node_kind::ClassDef)) walk_method(c, fn);
        }
    }
}

} // namespace

ShortToLongFormSuperFixer::ShortToLongFormSuperFixer()
    : TransformerFixer("short_to_long_form_super", VersionInfo("2.2", "2.7"))
{
    transformer_.on(node_kind::ClassDef, [](const node_ptr& cls){
        const auto& class_name = str(*cls, "name");
        for(auto& method : children(*cls, "body")){
            if(!is(method, node_kind::FunctionDef) && !is(method, node_kind::AsyncFunctionDef)) continue;
            auto& params = children(*child(*method, "args"), "args");
            if(params.empty()) continue;
            const auto self_name = str(*params.front(), "arg");
            walk_method(method, [&](const node_ptr& n){
                if(!is(n, node_kind::Call)) return;
                if(!is_name(child(*n, "func"), "super")) return;
                auto& args = children(*n, "args");
                if(!args.empty() || !children(*n, "keywords").empty()) return;
                args.push_back(n_name(class_name));
                args.push_back(n_name(self_name));
            });
        }
        return rewrite_result::keep();
    });
}

NewStyleClassesFixer::NewStyleClassesFixer()
    : TransformerFixer("new_style_classes", VersionInfo("2.0", "2.7"))
{
    transformer_.on(node_kind::ClassDef, [](const node_ptr& cls){
        auto& bases = children(*cls, "bases");
        if(bases.empty()) bases.push_back(n_name("object"));
        return rewrite_result::keep();
    });
}

} // namespace backport
