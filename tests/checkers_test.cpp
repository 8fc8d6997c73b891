#include <cassert>
#include <functional>
#include <iostream>
#include "backport/checkers.hpp"

using namespace backport;

static bool rejects(const Checker& c, const node_ptr& stmt){
    try { c.check(n_module({stmt})); }
    catch(const check_error& e){ assert(e.code()=="B500"); return true; }
    return false;
}

static void test_overridden_builtins(){
    NoOverriddenBuiltinsChecker c;
    assert(!rejects(c, n_expr(n_call(n_name("map"), {n_name("f"), n_name("xs")}))));
    assert(!rejects(c, n_assign({n_name("mapping", "Store")}, n_num(1))));

    assert(rejects(c, n_assign({n_name("map", "Store")}, n_num(1))));
    assert(rejects(c, n_delete({n_name("zip", "Del")})));
    assert(rejects(c, n_function_def("filter", n_arguments(), {n_pass()})));
    assert(rejects(c, n_class_def("range", {}, {n_pass()})));
    assert(rejects(c, n_function_def("f", n_arguments({n_arg("zip")}), {n_pass()})));
    assert(rejects(c, n_import({n_alias("range")})));
    assert(rejects(c, n_import({n_alias("map.sub")})));
    assert(rejects(c, n_import_from("itertools", {n_alias("imap", "map")})));
    assert(!rejects(c, n_import_from("m", {n_alias("map", "m2")})));
    assert(rejects(c, with_fields(node_kind::Global, {{"names", string_list{"x", "filter"}}})));
    assert(rejects(c, with_fields(node_kind::Nonlocal, {{"names", string_list{"map"}}})));
    auto async_def = n_function_def("zip", n_arguments(), {n_pass()});
    async_def->kind = node_kind::AsyncFunctionDef;
    assert(rejects(c, async_def));

    auto handler = with_fields(node_kind::ExceptHandler, {{"name", std::string("range")}, {"body", node_list{n_pass()}}});
    auto guarded = with_fields(node_kind::Try, {{"body", node_list{n_pass()}}, {"handlers", node_list{handler}}});
    assert(rejects(c, guarded));

    auto target = n_name("map", "Store");
    target->line = 4; target->col = 2;
    try { c.check(n_module({n_assign({target}, n_num(1))})); assert(false); }
    catch(const check_error& e){
        assert(e.line()==4 && e.col()==2);
        assert(std::string(e.what()).find("'map'")!=std::string::npos);
    }
}

static void test_yield_from(){
    NoYieldFromChecker c;
    auto gen = [](node_ptr value){
        return n_function_def("g", n_arguments(), {n_expr(std::move(value))});
    };
    assert(!rejects(c, gen(with_fields(node_kind::Yield, {{"value", n_num(1)}}))));
    assert(rejects(c, gen(with_fields(node_kind::YieldFrom, {{"value", n_name("it")}}))));
}

static void test_matmult(){
    NoMatMultOperatorChecker c;
    assert(!rejects(c, n_expr(n_binop(n_name("a"), "Mult", n_name("b")))));
    assert(rejects(c, n_expr(n_binop(n_name("a"), "MatMult", n_name("b")))));
    auto aug = with_fields(node_kind::AugAssign, {{"target", n_name("a", "Store")}, {"op", std::string("MatMult")}, {"value", n_name("b")}});
    assert(rejects(c, aug));
}

static void test_registry_pairs(){
    auto reg = default_checker_registry();
    assert(reg.size()==3);
    auto* e = reg.find("no_overridden_builtins");
    assert(e);
    assert(e->pairs.size()==2);
    assert(e->factory()->name()=="no_overridden_builtins");
}

void run_checkers_tests(){
    std::cout << "[core] checker tests...\n";
    test_overridden_builtins();
    test_yield_from();
    test_matmult();
    test_registry_pairs();
}
