/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <gtest/gtest.h>

#include "type_expression.h"

using namespace peergen;

class type_expression_test : public ::testing::Test
{
protected:
    model::type_arena types_;

    type_expr compile(model::type_id id) { return type_expression::compile(types_, id); }
};

TEST_F(type_expression_test, base_scalars_map_to_primitives)
{
    EXPECT_EQ(compile(types_.base("string")), type_expr::make_primitive(primitive::string));
    EXPECT_EQ(compile(types_.base("integer")), type_expr::make_primitive(primitive::integer));
    EXPECT_EQ(compile(types_.base("uinteger")), type_expr::make_primitive(primitive::uinteger));
    EXPECT_EQ(compile(types_.base("decimal")), type_expr::make_primitive(primitive::decimal));
    EXPECT_EQ(compile(types_.base("boolean")), type_expr::make_primitive(primitive::boolean));
    EXPECT_EQ(compile(types_.base("null")), type_expr::make_primitive(primitive::null));
}

TEST_F(type_expression_test, unknown_base_names_pass_through)
{
    auto expr = compile(types_.base("DocumentUri"));
    EXPECT_EQ(expr.kind, expr_kind::name);
    EXPECT_EQ(expr.name, "DocumentUri");
}

TEST_F(type_expression_test, references_are_not_resolved)
{
    auto expr = compile(types_.reference("NeverDefined"));
    EXPECT_EQ(expr, type_expr::make_name("NeverDefined"));
}

TEST_F(type_expression_test, containers)
{
    auto list = compile(types_.array(types_.reference("Position")));
    EXPECT_EQ(to_string(list), "std::vector<Position>");

    auto map = compile(types_.map(types_.base("DocumentUri"), types_.array(types_.reference("TextEdit"))));
    EXPECT_EQ(to_string(map), "std::map<DocumentUri, std::vector<TextEdit>>");
}

TEST_F(type_expression_test, and_and_or_compile_to_the_same_union)
{
    auto left = types_.reference("A");
    auto right = types_.reference("B");
    auto both = compile(types_.and_of({left, right}));
    auto either = compile(types_.or_of({left, right}));
    EXPECT_EQ(both, either);
    EXPECT_EQ(to_string(either), "std::variant<A, B>");
}

TEST_F(type_expression_test, tuple_keeps_element_order)
{
    auto expr = compile(types_.tuple({types_.base("integer"), types_.base("string"), types_.reference("Range")}));
    EXPECT_EQ(expr.kind, expr_kind::product);
    EXPECT_EQ(to_string(expr), "std::tuple<std::int32_t, std::string, Range>");
}

TEST_F(type_expression_test, literals)
{
    EXPECT_EQ(to_string(compile(types_.string_literal("create"))), "peergen::string_literal<\"create\">");
    EXPECT_EQ(to_string(compile(types_.integer_literal(1))), "peergen::integer_literal<1>");
    EXPECT_EQ(to_string(compile(types_.boolean_literal(true))), "peergen::boolean_literal<true>");
}

TEST_F(type_expression_test, structure_literal_echoes_its_fields)
{
    model::structure_literal literal;
    model::property label;
    label.name = "label";
    label.type = types_.base("string");
    model::property detail;
    detail.name = "detail";
    detail.type = types_.reference("Detail");
    detail.optional = true;
    literal.properties = {label, detail};

    auto expr = compile(types_.structure(literal));
    EXPECT_EQ(expr.kind, expr_kind::inline_record);
    ASSERT_EQ(expr.labels.size(), 2u);
    EXPECT_EQ(expr.args[1].kind, expr_kind::optional_field);
    EXPECT_EQ(to_string(expr), "peergen::string_literal<\"std::string label; std::optional<Detail> detail;\">");
}

TEST_F(type_expression_test, identifiers_in_first_seen_order)
{
    auto expr = compile(types_.or_of({types_.reference("B"),
        types_.array(types_.reference("A")),
        types_.map(types_.base("string"), types_.reference("B")),
        types_.base("URI")}));
    EXPECT_EQ(identifiers(expr), (std::vector<std::string>{"B", "A", "URI"}));
}

TEST_F(type_expression_test, identifiers_skip_literal_text)
{
    model::structure_literal literal;
    model::property item;
    item.name = "kind";
    item.type = types_.reference("Hidden");
    literal.properties = {item};

    auto expr = compile(types_.or_of({types_.string_literal("Visible"), types_.structure(literal)}));
    EXPECT_TRUE(identifiers(expr).empty());
}

TEST_F(type_expression_test, forward_markers_are_optional_in_scans)
{
    auto expr = type_expr::make_union({type_expr::make_forward("LSPObject"), type_expr::make_name("Range")});

    std::vector<std::string> all;
    collect_identifiers(expr, all, true);
    EXPECT_EQ(all, (std::vector<std::string>{"LSPObject", "Range"}));

    std::vector<std::string> hard;
    collect_identifiers(expr, hard, false);
    EXPECT_EQ(hard, (std::vector<std::string>{"Range"}));

    EXPECT_EQ(to_string(expr), "std::variant<peergen::forward<LSPObject>, Range>");
}
