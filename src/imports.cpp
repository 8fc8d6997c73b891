#include "backport/imports.hpp"

#include <algorithm>

namespace backport {

namespace {

const char* const kFutureOrder[] = {
    "absolute_import", "division", "print_function", "unicode_literals",
    "generator_stop", "with_statement", "generators", "nested_scopes",
};

bool is_future(const ImportDecl& d){ return d.module=="__future__" && d.member; }

// True when `stmt` already brings `decl` into scope.
bool provides(const node_ptr& stmt, const ImportDecl& decl){
    if(decl.member){
        if(!is(stmt, node_kind::ImportFrom)) return false;
        auto* mod = str_if(*stmt, "module");
        if(!mod || *mod!=decl.module) return false;
        if(std::get<int64_t>(field(*stmt, "level"))!=0) return false;
        for(auto& a : children(*stmt, "names"))
            if(str(*a, "name")==*decl.member && !str_if(*a, "asname")) return true;
        return false;
    }
    if(!is(stmt, node_kind::Import)) return false;
    for(auto& a : children(*stmt, "names"))
        if(str(*a, "name")==decl.module && !str_if(*a, "asname")) return true;
    return false;
}

} // namespace

std::string ImportDecl::to_string() const {
    if(member) return "from " + module + " import " + *member;
    return "import " + module;
}

bool ImportAccumulator::add(const ImportDecl& decl){
    if(contains(decl)) return false;
    imports_.push_back(decl);
    return true;
}

bool ImportAccumulator::contains(const ImportDecl& decl) const {
    return std::find(imports_.begin(), imports_.end(), decl)!=imports_.end();
}

int future_feature_rank(const std::string& feature){
    int i = 0;
    for(auto* f : kFutureOrder){
        if(feature==f) return i;
        ++i;
    }
    return i;
}

std::vector<ImportDecl> ImportAccumulator::ordered() const {
    std::vector<ImportDecl> futures, rest;
    for(auto& d : imports_) (is_future(d) ? futures : rest).push_back(d);
    std::stable_sort(futures.begin(), futures.end(), [](const ImportDecl& a, const ImportDecl& b){
        return future_feature_rank(*a.member) < future_feature_rank(*b.member);
    });
    futures.insert(futures.end(), rest.begin(), rest.end());
    return futures;
}

size_t prepend_imports(const node_ptr& module, const std::vector<ImportDecl>& imports){
    if(!is(module, node_kind::Module))
        throw structural_assumption_error("imports can only be added to a Module");
    auto& body = children(*module, "body");
    size_t at = 0;
    if(!body.empty() && is(body[0], node_kind::Expr) && is(child(*body[0], "value"), node_kind::Str)) at = 1;
    // existing __future__ imports must stay first, so new ones go right after them
    size_t future_end = at;
    while(future_end<body.size() && is(body[future_end], node_kind::ImportFrom)){
        auto* mod = str_if(*body[future_end], "module");
        if(!mod || *mod!="__future__") break;
        ++future_end;
    }

    node_list futures, others;
    for(auto& d : imports){
        bool present = std::any_of(body.begin(), body.end(), [&](const node_ptr& s){ return provides(s, d); });
        if(present) continue;
        if(d.member){
            auto s = n_import_from(d.module, {n_alias(*d.member)});
            (is_future(d) ? futures : others).push_back(s);
        } else {
            others.push_back(n_import({n_alias(d.module)}));
        }
    }
    body.insert(body.begin() + static_cast<std::ptrdiff_t>(future_end), others.begin(), others.end());
    body.insert(body.begin() + static_cast<std::ptrdiff_t>(future_end), futures.begin(), futures.end());
    return futures.size() + others.size();
}

} // namespace backport
