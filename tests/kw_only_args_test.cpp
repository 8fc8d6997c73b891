#include <cassert>
#include <iostream>
#include "backport/fixers.hpp"

using namespace backport;

// def f(a, *, x, y=2): return x + y
static node_ptr sample_def(node_ptr kwarg = nullptr){
    auto args = n_arguments({n_arg("a")}, nullptr, {n_arg("x"), n_arg("y")}, {nullptr, n_num(2)}, std::move(kwarg));
    return n_function_def("f", args, {n_return(n_binop(n_name("x"), "Add", n_name("y")))});
}

static void test_inline_lookups(){
    InlineKwOnlyArgsFixer f;
    auto fn = sample_def();
    auto tree = f.apply(n_module({fn}));
    validate(tree);

    auto& args = *child(*fn, "args");
    assert(children(args, "kwonlyargs").empty());
    assert(children(args, "kw_defaults").empty());
    assert(str(*child(args, "kwarg"), "arg")=="kwargs");

    auto& body = children(*fn, "body");
    assert(body.size()==3);
    // x = kwargs["x"]
    auto expected_x = n_assign({n_name("x", "Store")}, n_subscript(n_name("kwargs"), n_index(n_str("x"))));
    assert(equal(body[0], expected_x));
    // y = kwargs.get("y", 2)
    auto expected_y = n_assign({n_name("y", "Store")}, n_call(n_attr(n_name("kwargs"), "get"), {n_str("y"), n_num(2)}));
    assert(equal(body[1], expected_y));
    assert(is(body[2], node_kind::Return));
}

static void test_existing_kwarg_and_docstring(){
    InlineKwOnlyArgsFixer f;
    auto fn = sample_def(n_arg("options"));
    children(*fn, "body").insert(children(*fn, "body").begin(), n_expr(n_str("doc")));
    f.apply(n_module({fn}));
    auto& body = children(*fn, "body");
    assert(body.size()==4);
    assert(is(child(*body[0], "value"), node_kind::Str));
    assert(is_name(child(*child(*body[1], "value"), "value"), "options"));
}

static void test_literal_defaults(){
    InlineKwOnlyArgsFixer f;
    auto negative = with_fields(node_kind::UnaryOp, {{"op", std::string("USub")}, {"operand", n_num(1)}});
    auto args = n_arguments({}, nullptr, {n_arg("a"), n_arg("b"), n_arg("c")},
                            {negative, n_tuple({n_str("s"), n_none()}), n_bool(true)});
    auto fn = n_function_def("g", args, {n_pass()});
    f.apply(n_module({fn}));
    assert(children(*fn, "body").size()==4);
}

static void test_rejected_shapes(){
    bool threw = false;
    InlineKwOnlyArgsFixer f;
    auto args = n_arguments({}, nullptr, {n_arg("x")}, {n_list({})});
    try { f.apply(n_module({n_function_def("h", args, {n_pass()})})); }
    catch(const structural_assumption_error& e){ threw = true; assert(std::string(e.what()).find("'x'")!=std::string::npos); }
    assert(threw);

    threw = false;
    InlineKwOnlyArgsFixer g;
    auto mismatched = n_arguments({}, nullptr, {n_arg("x")}, {});
    try { g.apply(n_module({n_function_def("h", mismatched, {n_pass()})})); } catch(const structural_assumption_error&){ threw = true; }
    assert(threw);

    threw = false;
    InlineKwOnlyArgsFixer l;
    auto lam = n_lambda(n_arguments({}, nullptr, {n_arg("x")}, {nullptr}), n_name("x"));
    try { l.apply(n_module({n_expr(lam)})); } catch(const structural_assumption_error&){ threw = true; }
    assert(threw);
}

static void test_nested_defs(){
    InlineKwOnlyArgsFixer f;
    auto inner = sample_def();
    auto outer = n_function_def("outer", n_arguments(), {inner});
    f.apply(n_module({outer}));
    assert(children(*inner, "body").size()==3);

    // async def outer(): async def f(a, *, x, y=2)
    auto async_inner = sample_def();
    async_inner->kind = node_kind::AsyncFunctionDef;
    auto async_outer = n_function_def("outer", n_arguments(), {async_inner});
    async_outer->kind = node_kind::AsyncFunctionDef;
    validate(f.apply(n_module({async_outer})));
    assert(children(*async_inner, "body").size()==3);
    assert(children(*child(*async_inner, "args"), "kwonlyargs").empty());
}

void run_kw_only_args_tests(){
    std::cout << "[core] keyword-only parameter tests...\n";
    test_inline_lookups();
    test_existing_kwarg_and_docstring();
    test_literal_defaults();
    test_rejected_shapes();
    test_nested_defs();
}
