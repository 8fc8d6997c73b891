#include <gtest/gtest.h>
#include <string>
#include "backport/reader.hpp"

using namespace backport;

TEST(Reader, ParsesNodeForms){
    auto tree = read_tree(
        "; call with one argument\n"
        "(Module :body [(Expr :value (Call :func (Name :id \"f\" :ctx \"Load\")\n"
        "                                 :args [(Num :n 1), (Num :n -2.5)]\n"
        "                                 :keywords [(keyword :arg nil :value (Name :id \"m\" :ctx \"Load\"))]))])");
    auto expected = n_module({n_expr(n_call(n_name("f"), {n_num(1), n_float(-2.5)}, {n_kwsplat(n_name("m"))}))});
    EXPECT_TRUE(equal(tree, expected));
}

TEST(Reader, MissingFieldsTakeDefaults){
    auto tree = read_tree("(Module :body [(ClassDef :name \"A\")])");
    auto cls = children(*tree, "body")[0];
    EXPECT_TRUE(children(*cls, "bases").empty());
    EXPECT_TRUE(children(*cls, "body").empty());
}

TEST(Reader, ReadsPositions){
    auto tree = read_tree("(Module :body [(Pass :lineno 3 :col_offset 4)])");
    auto stmt = children(*tree, "body")[0];
    EXPECT_EQ(stmt->line, 3);
    EXPECT_EQ(stmt->col, 4);
    EXPECT_EQ(tree->line, -1);
}

TEST(Reader, RoundTripsPrintedTrees){
    auto global = with_fields(node_kind::Global, {{"names", string_list{"a", "b"}}});
    auto text = n_str("line\n\"quoted\"\t\\");
    text->line = 2; text->col = 8;
    auto tree = n_module({
        global,
        n_assign({n_name("x", "Store")}, n_binop(n_float(0.1), "Add", n_num(-7))),
        n_expr(text),
        n_expr(n_call(n_name("g"), {}, {n_keyword("k", n_none()), n_kwsplat(n_name("m"))})),
        n_expr(n_dict({nullptr, n_str("k")}, {n_name("m"), n_bool(false)})),
        n_function_def("f", n_arguments({n_arg("a", n_name("int"))}), {n_return()})});

    auto compact = read_tree(to_string(tree));
    EXPECT_TRUE(equal(compact, tree, false)) << to_string(compact);
    auto pretty = read_tree(to_pretty_string(tree));
    EXPECT_TRUE(equal(pretty, tree, false)) << to_pretty_string(pretty);
}

TEST(Reader, UnknownKindReportsPosition){
    try {
        read_tree("(Module :body [\n  (Print :values [])])", "sample.tree");
        FAIL() << "expected parse_error";
    } catch(const parse_error& e){
        EXPECT_EQ(e.code(), "B600");
        EXPECT_EQ(e.line(), 2);
        EXPECT_EQ(e.col(), 4);
        EXPECT_NE(std::string(e.what()).find("Print"), std::string::npos);
    }
}

TEST(Reader, RejectsMalformedText){
    EXPECT_THROW(read_tree(""), parse_error);
    EXPECT_THROW(read_tree("(Module :body ["), parse_error);
    EXPECT_THROW(read_tree("(Pass) (Pass)"), parse_error);
    EXPECT_THROW(read_tree("(Module :body [(Pass)] :extra 1)"), parse_error);
    EXPECT_THROW(read_tree("(Name :id 1 :ctx \"Load\")"), parse_error);
    EXPECT_THROW(read_tree("(Module :body)"), parse_error);
    EXPECT_THROW(read_tree("(Expr :value nil)"), parse_error);
    EXPECT_THROW(read_tree("\"just a string\""), parse_error);
}

TEST(Reader, UnterminatedFormReportsLine){
    try {
        read_tree("(Module :body [\n(Pass)\n", "broken.tree");
        FAIL() << "expected parse_error";
    } catch(const parse_error& e){
        EXPECT_EQ(e.line(), 3);
        EXPECT_NE(std::string(e.what()).find("broken.tree"), std::string::npos);
    }
}

TEST(Reader, ValidatesTheTree){
    try {
        read_tree("(Module :body [(Name :id \"x\" :ctx \"Load\")])");
        FAIL() << "expected structural_assumption_error";
    } catch(const structural_assumption_error& e){
        EXPECT_EQ(e.code(), "B200");
    }
}

TEST(Reader, RejectsOutOfRangeNumbers){
    EXPECT_THROW(read_tree("(Module :body [(Expr :value (Num :n 1e999))])"), parse_error);
    EXPECT_THROW(read_tree("(Module :body [(Expr :value (Num :n 99999999999999999999))])"), parse_error);
    EXPECT_THROW(read_tree("(Module :body [(Pass :lineno 4294967297 :col_offset 0)])"), parse_error);
    EXPECT_THROW(read_tree("(Module :body [(Pass :lineno 1 :col_offset -7)])"), parse_error);
}

TEST(Reader, ParsesNewerSyntax){
    auto tree = read_tree(
        "(Module :body [(Assert :test (Name :id \"x\" :ctx \"Load\") :msg (Ellipsis))\n"
        "               (Nonlocal :names [\"n\"])\n"
        "               (Expr :value (DictComp :key (Name :id \"k\" :ctx \"Load\")\n"
        "                                      :value (Await :value (Name :id \"v\" :ctx \"Load\"))\n"
        "                                      :generators [(comprehension :target (Name :id \"k\" :ctx \"Store\")\n"
        "                                                                  :iter (Name :id \"ks\" :ctx \"Load\"))]))])");
    auto& body = children(*tree, "body");
    ASSERT_EQ(body.size(), 3u);
    EXPECT_EQ(body[0]->kind, node_kind::Assert);
    EXPECT_TRUE(is(child(*body[0], "msg"), node_kind::Ellipsis));
    EXPECT_EQ(std::get<string_list>(field(*body[1], "names")), string_list{"n"});
    auto comp = child(*body[2], "value");
    EXPECT_EQ(comp->kind, node_kind::DictComp);
    EXPECT_TRUE(is(child(*comp, "value"), node_kind::Await));
}
