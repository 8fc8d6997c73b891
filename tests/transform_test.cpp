#include <cassert>
#include <iostream>
#include <string>
#include <vector>
#include "backport/transform.hpp"

using namespace backport;

static void test_walk_preorder(){
    // x = f(a, b)
    auto tree = n_module({n_assign({n_name("x", "Store")}, n_call(n_name("f"), {n_name("a"), n_name("b")}))});
    std::vector<std::string> seen;
    walk(tree, [&](const node_ptr& n){
        seen.push_back(is(n, node_kind::Name) ? str(*n, "id") : kind_name(n->kind));
    });
    std::vector<std::string> expected{"Module", "Assign", "x", "Call", "a", "b", "f"};
    assert(seen==expected);

    int names = 0;
    walk(tree, node_kind::Name, [&](const node_ptr&){ ++names; });
    assert(names==4);
}

static void test_replace_not_revisited(){
    auto tree = n_module({n_expr(n_name("a"))});
    int visits = 0;
    Transformer t;
    t.on(node_kind::Name, [&](const node_ptr& n){
        ++visits;
        // the replacement contains a Name, which must not be visited again
        return rewrite_result::replace(n_attr(n_name(str(*n, "id")), "b"));
    });
    auto out = t.transform(tree);
    assert(out==tree);
    assert(visits==1);
    auto value = child(*children(*tree, "body")[0], "value");
    assert(is(value, node_kind::Attribute));
    assert(is_name(child(*value, "value"), "a"));
}

static void test_wrapping_replacement_terminates(){
    // a -> f(a): the original is carried into its own replacement
    auto tree = n_module({n_expr(n_name("a"))});
    int visits = 0;
    Transformer t;
    t.on(node_kind::Name, [&](const node_ptr& n){
        ++visits;
        if(str(*n, "id")=="f") return rewrite_result::keep();
        return rewrite_result::replace(n_call(n_name("f"), {n}));
    });
    t.transform(tree);
    assert(visits==1);
    auto value = child(*children(*tree, "body")[0], "value");
    assert(is(value, node_kind::Call));
    assert(is_name(children(*value, "args")[0], "a"));

    // children of the wrapped original are still visited
    auto nested = n_module({n_expr(n_attr(n_name("x"), "y"))});
    std::vector<std::string> seen;
    Transformer wrap;
    wrap.on(node_kind::Attribute, [](const node_ptr& n){ return rewrite_result::replace(n_tuple({n})); });
    wrap.on(node_kind::Tuple, [&](const node_ptr&){ seen.push_back("Tuple"); return rewrite_result::keep(); });
    wrap.on(node_kind::Name, [&](const node_ptr& n){ seen.push_back(str(*n, "id")); return rewrite_result::keep(); });
    wrap.transform(nested);
    assert(seen==std::vector<std::string>{"x"});
}

static void test_splice_and_remove_in_lists(){
    auto tree = n_module({n_pass(), n_expr(n_num(1)), n_pass()});
    Transformer t;
    t.on(node_kind::Pass, [](const node_ptr&){ return rewrite_result::remove(); });
    t.on(node_kind::Expr, [](const node_ptr& n){
        return rewrite_result::splice({n_expr(n_num(0)), n});
    });
    t.transform(tree);
    auto& body = children(*tree, "body");
    assert(body.size()==2);
    assert(std::get<int64_t>(field(*child(*body[0], "value"), "n"))==0);
    assert(std::get<int64_t>(field(*child(*body[1], "value"), "n"))==1);

    // an empty splice drops the statement
    Transformer drop;
    drop.on(node_kind::Expr, [](const node_ptr&){ return rewrite_result::splice({}); });
    drop.transform(tree);
    assert(children(*tree, "body").empty());
}

static void test_children_of_replacement_visited(){
    // Expr(Call(g, [Name x])) -> Expr(Name x) ... then x is rewritten
    auto tree = n_module({n_expr(n_call(n_name("g"), {n_name("x")}))});
    Transformer t;
    t.on(node_kind::Call, [](const node_ptr& n){ return rewrite_result::replace(n_tuple(children(*n, "args"))); });
    t.on(node_kind::Name, [](const node_ptr& n){ return rewrite_result::replace(n_name(str(*n, "id") + "_")); });
    t.transform(tree);
    auto value = child(*children(*tree, "body")[0], "value");
    assert(is(value, node_kind::Tuple));
    assert(is_name(children(*value, "elts")[0], "x_"));
}

static void test_optional_fields(){
    auto fn = n_function_def("f", n_arguments(), {n_pass()}, {}, n_name("int"));
    Transformer t;
    t.on(node_kind::Name, [](const node_ptr&){ return rewrite_result::remove(); });
    t.transform(n_module({fn}));
    assert(!child(*fn, "returns"));
}

static void test_invalid_rewrites(){
    bool threw = false;
    Transformer root_remover;
    root_remover.on(node_kind::Module, [](const node_ptr&){ return rewrite_result::remove(); });
    try { root_remover.transform(n_module({})); } catch(const structural_assumption_error&){ threw = true; }
    assert(threw);

    threw = false;
    Transformer required;
    required.on(node_kind::Num, [](const node_ptr&){ return rewrite_result::remove(); });
    try { required.transform(n_module({n_expr(n_num(1))})); } catch(const structural_assumption_error& e){ threw = true; assert(e.code()=="B200"); }
    assert(threw);

    threw = false;
    Transformer multi;
    multi.on(node_kind::Num, [](const node_ptr&){ return rewrite_result::splice({n_num(1), n_num(2)}); });
    try { multi.transform(n_module({n_expr(n_num(1))})); } catch(const structural_assumption_error&){ threw = true; }
    assert(threw);

    threw = false;
    Transformer empty_replace;
    empty_replace.on(node_kind::Num, [](const node_ptr&){ return rewrite_result::replace(nullptr); });
    try { empty_replace.transform(n_module({n_expr(n_num(1))})); } catch(const structural_assumption_error&){ threw = true; }
    assert(threw);

    threw = false;
    try { Transformer().transform(nullptr); } catch(const structural_assumption_error&){ threw = true; }
    assert(threw);
}

void run_transform_tests(){
    std::cout << "[core] rewrite engine tests...\n";
    test_walk_preorder();
    test_replace_not_revisited();
    test_wrapping_replacement_terminates();
    test_splice_and_remove_in_lists();
    test_children_of_replacement_visited();
    test_optional_fields();
    test_invalid_rewrites();
}
