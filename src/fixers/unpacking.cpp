// Unpacking generalizations: calls and literals with elements after `*x` or
// entries after `**m` are rebuilt from a temporary filled statement by
// statement, in the original evaluation order.
#include "backport/fixers.hpp"
#include "backport/features.hpp"

#include <algorithm>
#include <cstdio>
#include <limits>

namespace backport {

namespace {

const node_list* positional_elements(const node_ptr& n){
    if(is(n, node_kind::Call)) return &children(*n, "args");
    if(is(n, node_kind::List) || is(n, node_kind::Tuple)){
        // assignment targets such as `a, *b = x` stay as they are
        if(str(*n, "ctx")!="Load") return nullptr;
        return &children(*n, "elts");
    }
    if(is(n, node_kind::Set)) return &children(*n, "elts");
    return nullptr;
}

// A `*x` followed by anything at all.
bool has_args_unpacking(const node_ptr& n){
    auto* elts = positional_elements(n);
    if(!elts) return false;
    bool seen_star = false;
    for(auto& e : *elts){
        if(seen_star) return true;
        seen_star = is(e, node_kind::Starred);
    }
    return false;
}

// A `**m` followed by anything at all.
bool has_kwargs_unpacking(const node_ptr& n){
    bool seen_splat = false;
    if(is(n, node_kind::Call)){
        for(auto& kw : children(*n, "keywords")){
            if(seen_splat) return true;
            seen_splat = str_if(*kw, "arg")==nullptr;
        }
        return false;
    }
    if(is(n, node_kind::Dict)){
        for(auto& k : children(*n, "keys")){
            if(seen_splat) return true;
            seen_splat = !k;
        }
    }
    return false;
}

node_ptr positioned(node_ptr n, const node& src){
    n->line = src.line;
    n->col = src.col;
    return n;
}

node_ptr method_call(const std::string& target, const char* method, node_ptr arg){
    return n_expr(n_call(n_attr(n_name(target), method), {std::move(arg)}));
}

const char* literal_constructor(node_kind kind){
    switch(kind){
        case node_kind::List: return "list";
        case node_kind::Tuple: return "tuple";
        default: return "set";
    }
}

// Positions evaluated conditionally or more than once; statements hoisted in
// front of the enclosing statement would run at the wrong time.
bool is_deferred_slot(const node& parent, const std::string& field_name, size_t index){
    switch(parent.kind){
        case node_kind::While: return field_name=="test";
        case node_kind::IfExp: return field_name!="test";
        case node_kind::BoolOp: return index>0;
        case node_kind::ListComp:
        case node_kind::SetComp:
        case node_kind::GeneratorExp: return field_name=="elt" || index>0;
        case node_kind::DictComp: return field_name=="key" || field_name=="value" || index>0;
        case node_kind::comprehension: return field_name!="iter";
        case node_kind::ExceptHandler: return field_name=="type";
        default: return false;
    }
}

// Names and attribute chains over a name are looked up again in the rewritten
// call; anything else could run code and is evaluated into a temporary first.
bool is_plain_callee(const node_ptr& func){
    if(is(func, node_kind::Name)) return true;
    return is(func, node_kind::Attribute) && is_plain_callee(child(*func, "value"));
}

[[noreturn]] void throw_deferred(const node& parent, const std::string& field_name, const node& at){
    throw structural_assumption_error(std::string("cannot expand unpacking inside ") + kind_name(parent.kind) + "." + field_name +
                                      ": it is not evaluated exactly once before the enclosing statement", at);
}

} // namespace

UnpackingGeneralizationsFixer::UnpackingGeneralizationsFixer()
    : Fixer("unpacking_generalizations", VersionInfo("2.0", "3.4")) {}

std::string UnpackingGeneralizationsFixer::temp_name(const char* base){
    return std::string(base) + "_" + std::to_string(next_index_++);
}

node_ptr UnpackingGeneralizationsFixer::hoist_callee(const node_ptr& call, val_update& u){
    auto func = child(*call, "func");
    if(is_plain_callee(func)) return func;
    const auto tmp = temp_name("upg_func");
    u.prefix.push_back(positioned(n_assign({n_name(tmp, "Store")}, func), *func));
    u.cleanup.push_back(positioned(n_delete({n_name(tmp, "Del")}), *call));
    return positioned(n_name(tmp), *func);
}

UnpackingGeneralizationsFixer::val_update UnpackingGeneralizationsFixer::expand_args(const node_ptr& n){
    val_update u;
    node_ptr func = is(n, node_kind::Call) ? hoist_callee(n, u) : nullptr;
    const auto tmp = temp_name("upg_args");
    u.prefix.push_back(positioned(n_assign({n_name(tmp, "Store")}, n_list(node_list{})), *n));
    for(auto& e : *positional_elements(n)){
        if(is(e, node_kind::Starred)) u.prefix.push_back(positioned(method_call(tmp, "extend", child(*e, "value")), *e));
        else u.prefix.push_back(positioned(method_call(tmp, "append", e), *e));
    }
    if(is(n, node_kind::Call))
        u.value = n_call(func, {n_starred(n_name(tmp))}, children(*n, "keywords"));
    else
        u.value = n_call(n_name(literal_constructor(n->kind)), {n_name(tmp)});
    positioned(u.value, *n);
    u.cleanup.insert(u.cleanup.begin(), positioned(n_delete({n_name(tmp, "Del")}), *n));
    return u;
}

UnpackingGeneralizationsFixer::val_update UnpackingGeneralizationsFixer::expand_kwargs(const node_ptr& n){
    val_update u;
    node_ptr func = is(n, node_kind::Call) ? hoist_callee(n, u) : nullptr;
    const auto tmp = temp_name("upg_kwargs");
    u.prefix.push_back(positioned(n_assign({n_name(tmp, "Store")}, n_dict({}, {})), *n));
    auto add_item = [&](const node_ptr& key, const node_ptr& value, const node& at){
        if(!key){
            u.prefix.push_back(positioned(method_call(tmp, "update", value), at));
            return;
        }
        if(!is(key, node_kind::Str))
            throw structural_assumption_error(std::string("cannot expand a dictionary with a ") + kind_name(key->kind) +
                                              " key; only string literal keys are supported", *key);
        auto target = n_subscript(n_name(tmp), n_index(key), "Store");
        u.prefix.push_back(positioned(n_assign({target}, value), at));
    };

    if(is(n, node_kind::Call)){
        for(auto& kw : children(*n, "keywords")){
            auto* arg = str_if(*kw, "arg");
            add_item(arg ? n_str(*arg) : nullptr, child(*kw, "value"), *kw);
        }
        u.value = n_call(func, children(*n, "args"), {n_kwsplat(n_name(tmp))});
    } else {
        auto& keys = children(*n, "keys");
        auto& values = children(*n, "values");
        if(keys.size()!=values.size())
            throw structural_assumption_error("dictionary keys and values differ in length", *n);
        for(size_t i=0;i<keys.size();++i) add_item(keys[i], values[i], *values[i]);
        u.value = n_call(n_name("dict"), {}, {n_kwsplat(n_name(tmp))});
    }
    positioned(u.value, *n);
    u.cleanup.insert(u.cleanup.begin(), positioned(n_delete({n_name(tmp, "Del")}), *n));
    return u;
}

std::optional<UnpackingGeneralizationsFixer::val_update> UnpackingGeneralizationsFixer::make_val_update(const node_ptr& n){
    std::optional<val_update> out;
    if(has_args_unpacking(n)) out = expand_args(n);
    node_ptr current = out ? out->value : n;
    if(has_kwargs_unpacking(current)){
        auto kw = expand_kwargs(current);
        if(!out) out = val_update{};
        out->prefix.insert(out->prefix.end(), kw.prefix.begin(), kw.prefix.end());
        out->cleanup.insert(out->cleanup.end(), kw.cleanup.begin(), kw.cleanup.end());
        out->value = kw.value;
    }
    return out;
}

std::optional<UnpackingGeneralizationsFixer::val_update> UnpackingGeneralizationsFixer::single_update(const node_ptr& n){
    // a node that needs expansion itself is expanded at its own level; its
    // elements move into the hoisted statements and get their turn on the
    // next pass over the block
    if(auto u = make_val_update(n)) return u;

    hoist acc;
    if(is(n, node_kind::Lambda)){
        descend(child(*n, "args"), acc);
        auto body = single_update(child(*n, "body"));
        if(!body){
            if(acc.empty()) return std::nullopt;
            return val_update{std::move(acc.prefix), n, std::move(acc.cleanup)};
        }
        // the body's statements must stay inside the function, so the lambda
        // becomes a def; its own cleanup is unnecessary before the return
        const auto name = temp_name("upg_lambda");
        node_list def_body = std::move(body->prefix);
        def_body.push_back(positioned(n_return(body->value), *n));
        acc.prefix.push_back(positioned(n_function_def(name, child(*n, "args"), std::move(def_body)), *n));
        acc.cleanup.push_back(positioned(n_delete({n_name(name, "Del")}), *n));
        return val_update{std::move(acc.prefix), positioned(n_name(name), *n), std::move(acc.cleanup)};
    }

    descend(n, acc);
    if(acc.empty()) return std::nullopt;
    return val_update{std::move(acc.prefix), n, std::move(acc.cleanup)};
}

void UnpackingGeneralizationsFixer::hoist_field(const node_ptr& owner, const std::string& name, hoist& acc){
    auto take = [&](node_ptr& slot, size_t index){
        if(!slot) return;
        auto u = single_update(slot);
        if(!u) return;
        if(is_deferred_slot(*owner, name, index)) throw_deferred(*owner, name, *slot);
        slot = u->value;
        acc.prefix.insert(acc.prefix.end(), u->prefix.begin(), u->prefix.end());
        acc.cleanup.insert(acc.cleanup.end(), u->cleanup.begin(), u->cleanup.end());
    };
    auto& v = owner->fields.at(name);
    if(auto* p = std::get_if<node_ptr>(&v)) take(*p, 0);
    else if(auto* l = std::get_if<node_list>(&v))
        for(size_t i=0;i<l->size();++i) take((*l)[i], i);
}

void UnpackingGeneralizationsFixer::descend(const node_ptr& n, hoist& acc){
    for(auto& name : ordered_field_names(*n)){
        if(is_statement_list_field(n->kind, name))
            throw structural_assumption_error(std::string("unexpected statement block ") + kind_name(n->kind) + "." + name + " inside an expression", *n);
        hoist_field(n, name, acc);
    }
}

UnpackingGeneralizationsFixer::hoist UnpackingGeneralizationsFixer::process_statement(const node_ptr& stmt){
    hoist acc;
    auto names = ordered_field_names(*stmt);
    // decorators are evaluated before defaults, annotations and bases
    std::stable_partition(names.begin(), names.end(), [](const std::string& name){ return name=="decorator_list"; });
    for(auto& name : names){
        if(is_statement_list_field(stmt->kind, name)){
            apply_body_updates(children(*stmt, name));
            continue;
        }
        if(stmt->kind==node_kind::Try && name=="handlers"){
            for(auto& h : children(*stmt, "handlers")){
                hoist_field(h, "type", acc);
                apply_body_updates(children(*h, "body"));
            }
            continue;
        }
        hoist_field(stmt, name, acc);
    }
    return acc;
}

void UnpackingGeneralizationsFixer::apply_body_updates(node_list& body){
    const size_t initial = body.size();
    const size_t limit = initial * kMaxGrowthFactor;
    size_t previous = std::numeric_limits<size_t>::max();
    while(previous!=body.size()){
        if(body.size()>limit)
            throw expansion_overflow_error("statement block grew from " + std::to_string(initial) + " to " +
                                           std::to_string(body.size()) + " statements while expanding unpacking");
        previous = body.size();
        node_list out;
        out.reserve(body.size());
        for(auto& stmt : body){
            auto h = process_statement(stmt);
            out.insert(out.end(), h.prefix.begin(), h.prefix.end());
            out.push_back(stmt);
            // the temporaries die with the frame anyway
            if(!is(stmt, node_kind::Return)) out.insert(out.end(), h.cleanup.begin(), h.cleanup.end());
        }
        body = std::move(out);
        if(trace_enabled() && body.size()!=previous)
            std::fprintf(stderr, "[backport] unpacking_generalizations: block %zu -> %zu statements\n", previous, body.size());
    }
}

node_ptr UnpackingGeneralizationsFixer::apply(const node_ptr& tree){
    if(!is(tree, node_kind::Module))
        throw structural_assumption_error(std::string("unpacking_generalizations expects a Module, got ") +
                                          (tree ? kind_name(tree->kind) : "nothing"));
    apply_body_updates(children(*tree, "body"));
    return tree;
}

} // namespace backport
