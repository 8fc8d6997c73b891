#include <cassert>
#include <iostream>
#include "backport/pipeline.hpp"

using namespace backport;

// class A:
//     def f(self, *xs, key: int = 0) -> list:
//         return list(map(str, range(key)))
static node_ptr sample_module(){
    auto args = n_arguments({n_arg("self")}, n_arg("xs"), {n_arg("key", n_name("int"))}, {n_num(0)});
    auto body = n_return(n_call(n_name("list"), {n_call(n_name("map"), {n_name("str"), n_call(n_name("range"), {n_name("key")})})}));
    auto fn = n_function_def("f", args, {body}, {}, n_name("list"));
    return n_module({n_class_def("A", {}, {fn})});
}

static void test_apply_pipeline_clones(){
    auto tree = sample_module();
    auto before = clone(tree);
    std::vector<std::unique_ptr<Fixer>> fixers;
    fixers.emplace_back(new RangeToXrangeFixer());
    fixers.emplace_back(new ItertoolsBuiltinsFixer());
    fixers.emplace_back(new PrintFunctionFutureFixer());
    fixers.emplace_back(new DivisionFutureFixer());
    auto result = apply_pipeline(fixers, tree);
    assert(equal(tree, before));
    assert(result.tree!=tree);
    assert(!equal(result.tree, tree));
    assert(result.imports.size()==3);
    assert(result.imports[0].to_string()=="from __future__ import division");
    assert(result.imports[1].to_string()=="from __future__ import print_function");
    assert(result.imports[2].to_string()=="import itertools");

    bool threw = false;
    try { apply_pipeline(fixers, nullptr); } catch(const structural_assumption_error&){ threw = true; }
    assert(threw);
}

static void test_transpile_for_27(){
    BuildConfig cfg;
    auto result = transpile_module(cfg, default_fixer_registry(), default_checker_registry(), sample_module());
    auto cls = children(*result.tree, "body")[0];
    assert(is_name(children(*cls, "bases")[0], "object"));
    auto fn = children(*cls, "body")[0];
    assert(!child(*fn, "returns"));
    auto& args = *child(*fn, "args");
    assert(children(args, "kwonlyargs").empty());
    assert(str(*child(args, "kwarg"), "arg")=="kwargs");
    auto& body = children(*fn, "body");
    assert(body.size()==2);
    auto expected_lookup = n_assign({n_name("key", "Store")}, n_call(n_attr(n_name("kwargs"), "get"), {n_str("key"), n_num(0)}));
    assert(equal(body[0], expected_lookup));
    auto mapped = children(*child(*body[1], "value"), "args")[0];
    assert(str(*child(*mapped, "func"), "attr")=="imap");
    assert(is_name(child(*children(*mapped, "args")[1], "func"), "xrange"));

    assert(result.imports.size()==5);
    assert(result.imports[0].to_string()=="from __future__ import absolute_import");
    assert(result.imports[3].to_string()=="from __future__ import unicode_literals");
    assert(result.imports[4].to_string()=="import itertools");

    auto added = prepend_imports(result.tree, result.imports);
    assert(added==5);
    validate(result.tree);
}

static void test_transpile_for_36(){
    BuildConfig cfg;
    cfg.target_version = Version::parse("3.6");
    auto tree = sample_module();
    auto result = transpile_module(cfg, default_fixer_registry(), default_checker_registry(), tree);
    assert(equal(result.tree, tree));
    assert(result.imports.size()==1);
    assert(result.imports[0].to_string()=="from __future__ import generator_stop");
}

static void test_checker_stops_pipeline(){
    BuildConfig cfg;
    auto tree = n_module({n_assign({n_name("range", "Store")}, n_num(1))});
    bool threw = false;
    try { transpile_module(cfg, default_fixer_registry(), default_checker_registry(), tree); }
    catch(const check_error& e){ threw = true; assert(e.code()=="B500"); }
    assert(threw);

    // without the paired fixers the checker is not needed
    cfg.fixer_allowlist = {"division_future"};
    cfg.checker_allowlist = {"no_yield_from"};
    auto result = transpile_module(cfg, default_fixer_registry(), default_checker_registry(), tree);
    assert(result.imports.size()==1);
}

static void test_invalid_input_rejected(){
    bool threw = false;
    try { transpile_module(BuildConfig(), default_fixer_registry(), default_checker_registry(), n_module({n_name("x")})); }
    catch(const structural_assumption_error&){ threw = true; }
    assert(threw);
}

void run_pipeline_tests(){
    std::cout << "[core] pipeline tests...\n";
    test_apply_pipeline_clones();
    test_transpile_for_27();
    test_transpile_for_36();
    test_checker_stops_pipeline();
    test_invalid_input_rejected();
}
