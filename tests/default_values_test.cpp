/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <gtest/gtest.h>

#include "default_values.h"
#include "generator_errors.h"

using namespace peergen;

namespace
{
    std::shared_ptr<definition> record(const std::string& name, std::vector<field> fields, std::vector<type_expr> parents = {})
    {
        auto def = std::make_shared<definition>();
        def->kind = definition_kind::record;
        def->name = name;
        def->fields = std::move(fields);
        def->parents = std::move(parents);
        return def;
    }

    field make_field(const std::string& name, type_expr type)
    {
        return field{name, std::move(type), {}, {}};
    }

    const payload& member(const payload& object, const std::string& name)
    {
        return object.struct_value().fields().at(name);
    }
}

class default_values_test : public ::testing::Test
{
protected:
    definition_list definitions_;

    void SetUp() override
    {
        auto kind = std::make_shared<definition>();
        kind->kind = definition_kind::enumeration;
        kind->name = "SymbolKind";
        kind->backing = model::enumeration_kind::integer;
        kind->entries = {enumerator{"File", int64_t{1}, {}, {}}, enumerator{"Module", int64_t{2}, {}, {}}};

        auto markup = std::make_shared<definition>();
        markup->kind = definition_kind::enumeration;
        markup->name = "MarkupKind";
        markup->entries = {enumerator{"PlainText", std::string("plaintext"), {}, {}}};

        auto uri = std::make_shared<definition>();
        uri->kind = definition_kind::alias;
        uri->name = "DocumentUri";
        uri->bound = type_expr::make_primitive(primitive::string);

        definitions_ = {uri,
            kind,
            markup,
            record("Position",
                {make_field("line", type_expr::make_primitive(primitive::uinteger)),
                    make_field("character", type_expr::make_primitive(primitive::uinteger))}),
            record("Base", {make_field("token", type_expr::make_primitive(primitive::string))}),
            record("Params",
                {make_field("uri", type_expr::make_name("DocumentUri")),
                    make_field("position", type_expr::make_name("Position")),
                    make_field("kind", type_expr::make_name("SymbolKind")),
                    make_field("format", type_expr::make_name("MarkupKind")),
                    make_field("flag", type_expr::make_primitive(primitive::boolean)),
                    make_field("nothing", type_expr::make_primitive(primitive::null)),
                    make_field("list", type_expr::make_sequence(type_expr::make_name("Position"))),
                    make_field("table", type_expr::make_associative(type_expr::make_primitive(primitive::string), type_expr::make_primitive(primitive::integer))),
                    make_field("pair", type_expr::make_product({type_expr::make_primitive(primitive::integer), type_expr::make_literal(std::string("x"))})),
                    make_field("choice", type_expr::make_union({type_expr::make_primitive(primitive::decimal), type_expr::make_primitive(primitive::string)})),
                    make_field("extra", type_expr::make_optional(type_expr::make_primitive(primitive::string)))},
                {type_expr::make_name("Base")}),
            record("Capabilities", {make_field("valueSet", type_expr::make_optional(type_expr::make_sequence(type_expr::make_name("SymbolKind"))))}),
            record("Node", {make_field("child", type_expr::make_forward("Node"))})};
    }
};

TEST_F(default_values_test, scalars_and_containers)
{
    auto result = default_values::synthesize(definitions_, "Params");
    const auto& value = result.value;

    EXPECT_EQ(member(value, "token").string_value(), "");
    EXPECT_EQ(member(value, "uri").string_value(), "");
    EXPECT_EQ(member(value, "kind").number_value(), 1);
    EXPECT_EQ(member(value, "format").string_value(), "plaintext");
    EXPECT_FALSE(member(value, "flag").bool_value());
    EXPECT_TRUE(is_null(member(value, "nothing")));
    EXPECT_EQ(member(value, "list").list_value().values_size(), 0);
    EXPECT_EQ(member(value, "table").struct_value().fields_size(), 0);
    ASSERT_EQ(member(value, "pair").list_value().values_size(), 2);
    EXPECT_EQ(member(value, "pair").list_value().values(1).string_value(), "x");
    EXPECT_EQ(member(value, "choice").number_value(), 0);
    EXPECT_EQ(member(value, "extra").string_value(), "");
}

TEST_F(default_values_test, records_are_missing_unless_recursive)
{
    auto shallow = default_values::synthesize(definitions_, "Params");
    EXPECT_TRUE(is_null(member(shallow.value, "position")));
    EXPECT_EQ(shallow.missing, (std::vector<std::string>{"Position"}));

    default_values::options opts;
    opts.recursive = true;
    auto deep = default_values::synthesize(definitions_, "Params", opts);
    EXPECT_TRUE(deep.missing.empty());
    EXPECT_EQ(member(member(deep.value, "position"), "line").number_value(), 0);
}

TEST_F(default_values_test, only_required_skips_optional_fields)
{
    default_values::options opts;
    opts.only_required = true;
    auto result = default_values::synthesize(definitions_, "Params", opts);
    EXPECT_EQ(result.value.struct_value().fields().count("extra"), 0u);
    EXPECT_EQ(result.value.struct_value().fields().count("flag"), 1u);
}

TEST_F(default_values_test, value_set_lists_every_entry)
{
    auto result = default_values::synthesize(definitions_, "Capabilities");
    const auto& values = member(result.value, "valueSet").list_value();
    ASSERT_EQ(values.values_size(), 2);
    EXPECT_EQ(values.values(0).number_value(), 1);
    EXPECT_EQ(values.values(1).number_value(), 2);
}

TEST_F(default_values_test, recursion_is_cut)
{
    default_values::options opts;
    opts.recursive = true;
    auto result = default_values::synthesize(definitions_, "Node", opts);
    EXPECT_TRUE(is_null(member(result.value, "child")));
    EXPECT_EQ(result.missing, (std::vector<std::string>{"Node"}));
}

TEST_F(default_values_test, unsupported_shapes)
{
    EXPECT_THROW(default_values::synthesize(definitions_, "Unknown"), unsupported_type_default);

    definitions_.push_back(record("BadUnion", {make_field("u", type_expr::make_union({type_expr::make_name("Ghost")}))}));
    EXPECT_THROW(default_values::synthesize(definitions_, "BadUnion"), unsupported_type_default);

    definitions_.push_back(record("Inline",
        {make_field("i", type_expr::make_inline_record({"a"}, {type_expr::make_primitive(primitive::string)}))}));
    EXPECT_THROW(default_values::synthesize(definitions_, "Inline"), unsupported_type_default);

    default_values::options opts;
    opts.recursive = true;
    auto expanded = default_values::synthesize(definitions_, "Inline", opts);
    EXPECT_EQ(member(member(expanded.value, "i"), "a").string_value(), "");

    definitions_.push_back(record("BadValueSet", {make_field("valueSet", type_expr::make_primitive(primitive::string))}));
    EXPECT_THROW(default_values::synthesize(definitions_, "BadValueSet"), unsupported_type_default);
}
