#pragma once
#include "backport/ast.hpp"
#include <functional>
#include <unordered_map>
#include <unordered_set>

namespace backport {

// Outcome of a visitor for one node.
//   keep     leave the node where it is
//   replace  put exactly one node in its place
//   splice   put zero or more nodes in its place (list fields only, except a
//            single node which behaves like replace)
//   remove   drop the node (list fields and optional fields only)
struct rewrite_result {
    enum class action { keep, replace, splice, remove };
    action act = action::keep;
    node_list nodes;

    static rewrite_result keep() { return {}; }
    static rewrite_result replace(node_ptr n) { rewrite_result r; r.act = action::replace; r.nodes.push_back(std::move(n)); return r; }
    static rewrite_result splice(node_list ns) { rewrite_result r; r.act = action::splice; r.nodes = std::move(ns); return r; }
    static rewrite_result remove() { rewrite_result r; r.act = action::remove; return r; }
};

// Pre-order scan over every reachable node. Children are visited in
// ordered_field_names order; null children are skipped.
inline void walk(const node_ptr& root, const std::function<void(const node_ptr&)>& fn){
    if(!root) return;
    fn(root);
    for(auto& name : ordered_field_names(*root)){
        auto& v = root->fields.at(name);
        if(auto* p = std::get_if<node_ptr>(&v)){ walk(*p, fn); }
        else if(auto* l = std::get_if<node_list>(&v)){ for(auto& c : *l) walk(c, fn); }
    }
}

inline void walk(const node_ptr& root, node_kind kind, const std::function<void(const node_ptr&)>& fn){
    walk(root, [&](const node_ptr& n){ if(n->kind==kind) fn(n); });
}

// Structural rewriter. Visitors are registered per node kind and called in
// pre-order: the visitor sees a node first, its result is written into the
// parent's field, and the engine then descends into the children of whatever
// now occupies that position. The visited node itself and the nodes its
// visitor created are walked through but never visited again; only nodes
// carried over from below it are, so a replacement holding a node of its own
// kind, or wrapping the original, cannot loop.
class Transformer {
public:
    using VisitorFn = std::function<rewrite_result(const node_ptr&)>;

    // Register the visitor for a kind; a later registration for the same kind wins.
    Transformer& on(node_kind kind, VisitorFn fn){
        visitors_[kind] = std::move(fn); return *this;
    }

    bool empty() const { return visitors_.empty(); }

    // Rewrites the tree in place and returns the root, which differs from the
    // argument only when the root's own visitor replaced it.
    node_ptr transform(const node_ptr& root){
        if(!root) throw structural_assumption_error("cannot transform an empty tree");
        settled_.clear();
        auto r = visit(root);
        node_ptr out = root;
        switch(r.act){
            case rewrite_result::action::keep: break;
            case rewrite_result::action::replace: out = r.nodes.front(); break;
            case rewrite_result::action::splice:
                if(r.nodes.size()!=1) throw structural_assumption_error("cannot splice in place of the root node", *root);
                out = r.nodes.front(); break;
            case rewrite_result::action::remove:
                throw structural_assumption_error("cannot remove the root node", *root);
        }
        rewrite_children(out);
        settled_.clear();
        return out;
    }

private:
    std::unordered_map<node_kind, VisitorFn> visitors_;
    // Replaced nodes and nodes produced by visitors during the current
    // transform(). Holding the pointers keeps their addresses from being
    // reused by later allocations.
    std::unordered_set<node_ptr> settled_;

    rewrite_result visit(const node_ptr& n){
        if(settled_.count(n)) return rewrite_result::keep();
        auto it = visitors_.find(n->kind);
        if(it==visitors_.end()) return rewrite_result::keep();
        auto r = it->second(n);
        if(r.act==rewrite_result::action::replace && (r.nodes.size()!=1 || !r.nodes.front()))
            throw structural_assumption_error("replace must carry exactly one node", *n);
        for(auto& c : r.nodes)
            if(!c) throw structural_assumption_error("visitor returned an empty node", *n);
        if(r.act==rewrite_result::action::replace || r.act==rewrite_result::action::splice)
            mark_settled(n, r.nodes);
        return r;
    }

    // Everything reachable from the result but not from below the visited
    // node is new.
    void mark_settled(const node_ptr& visited, const node_list& result){
        std::unordered_set<const node*> carried;
        walk(visited, [&](const node_ptr& c){ if(c!=visited) carried.insert(c.get()); });
        settled_.insert(visited);
        for(auto& r : result)
            walk(r, [&](const node_ptr& c){ if(!carried.count(c.get())) settled_.insert(c); });
    }

    void rewrite_children(const node_ptr& n){
        for(auto& name : ordered_field_names(*n)){
            auto& v = n->fields.at(name);
            if(auto* p = std::get_if<node_ptr>(&v)){
                if(!*p) continue;
                node_ptr original = *p;
                auto r = visit(original);
                switch(r.act){
                    case rewrite_result::action::keep: break;
                    case rewrite_result::action::replace: *p = r.nodes.front(); break;
                    case rewrite_result::action::splice:
                        if(r.nodes.size()==1){ *p = r.nodes.front(); break; }
                        if(!r.nodes.empty())
                            throw structural_assumption_error("cannot splice " + std::to_string(r.nodes.size()) + " nodes into single field " + kind_name(n->kind) + "." + name, *original);
                        [[fallthrough]];
                    case rewrite_result::action::remove: {
                        const auto* fs = find_field(n->kind, name);
                        if(!fs || fs->cls!=field_class::optional_node)
                            throw structural_assumption_error(std::string("cannot remove required field ") + kind_name(n->kind) + "." + name, *original);
                        *p = nullptr; break;
                    }
                }
                if(*p) rewrite_children(*p);
            } else if(auto* l = std::get_if<node_list>(&v)){
                node_list out; out.reserve(l->size());
                for(auto& c : *l){
                    if(!c){ out.push_back(c); continue; }
                    auto r = visit(c);
                    switch(r.act){
                        case rewrite_result::action::keep: out.push_back(c); break;
                        case rewrite_result::action::replace:
                        case rewrite_result::action::splice:
                            for(auto& x : r.nodes) out.push_back(x);
                            break;
                        case rewrite_result::action::remove: break;
                    }
                }
                // descend after the list is settled so visitors see their final siblings
                *l = std::move(out);
                for(auto& c : *l) if(c) rewrite_children(c);
            }
        }
    }
};

} // namespace backport
