#include <cassert>
#include <iostream>
#include "backport/fixers.hpp"

using namespace backport;

static node_ptr rewrite(const node_ptr& joined){
    FStringToStrFormatFixer f;
    auto tree = f.apply(n_module({n_expr(joined)}));
    return child(*children(*tree, "body")[0], "value");
}

static const std::string& format_string(const node_ptr& call){
    return str(*child(*child(*call, "func"), "value"), "s");
}

static void test_plain_fields(){
    // f"a{b}c"
    auto call = rewrite(n_joined_str({n_str("a"), n_formatted_value(n_name("b")), n_str("c")}));
    assert(is(call, node_kind::Call));
    assert(str(*child(*call, "func"), "attr")=="format");
    assert(format_string(call)=="a{0}c");
    assert(children(*call, "args").size()==1);
    assert(is_name(children(*call, "args")[0], "b"));
}

static void test_conversion_and_spec(){
    // f"{x!r:>{w}} {{y}}"
    auto spec = n_joined_str({n_str(">"), n_formatted_value(n_name("w"))});
    auto call = rewrite(n_joined_str({n_formatted_value(n_name("x"), 'r', spec), n_str(" {y}")}));
    assert(format_string(call)=="{0!r:>{1}} {{y}}");
    auto& args = children(*call, "args");
    assert(args.size()==2);
    assert(is_name(args[0], "x"));
    assert(is_name(args[1], "w"));

    auto s = rewrite(n_joined_str({n_formatted_value(n_name("v"), 's'), n_formatted_value(n_name("u"), 'a')}));
    assert(format_string(s)=="{0!s}{1!a}");
}

static void test_nested_fstring(){
    // f"{f'{a}'}"
    auto inner = n_joined_str({n_formatted_value(n_name("a"))});
    auto call = rewrite(n_joined_str({n_formatted_value(inner)}));
    auto arg = children(*call, "args")[0];
    assert(is(arg, node_kind::Call));
    assert(format_string(arg)=="{0}");
}

static void test_errors(){
    bool threw = false;
    try { rewrite(n_joined_str({n_formatted_value(n_name("x"), 'q')})); }
    catch(const structural_assumption_error& e){ threw = true; assert(e.code()=="B200"); }
    assert(threw);

    threw = false;
    try { rewrite(n_joined_str({n_name("x")})); } catch(const structural_assumption_error&){ threw = true; }
    assert(threw);
}

void run_fstring_tests(){
    std::cout << "[core] f-string tests...\n";
    test_plain_fields();
    test_conversion_and_spec();
    test_nested_fstring();
    test_errors();
}
