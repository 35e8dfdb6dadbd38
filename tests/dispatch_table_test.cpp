/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <gtest/gtest.h>

#include <peergen/dispatch_table.h>
#include <peergen/internal/errors.h>

using namespace peergen;

TEST(dispatch_table_test, builder_assigns_dense_slots)
{
    dispatch_table_builder builder;
    builder.add("initialize", "handle_initialize");
    builder.add("textDocument/hover", "handle_hover");
    EXPECT_TRUE(builder.contains("initialize"));
    EXPECT_FALSE(builder.contains("shutdown"));

    auto table = builder.build();
    ASSERT_EQ(table.size(), 2u);
    EXPECT_EQ(table.at("initialize").slot, ordinal{0});
    EXPECT_EQ(table.at("textDocument/hover").slot, ordinal{1});
    EXPECT_EQ(table.get_entries()[1].handler, "handle_hover");
}

TEST(dispatch_table_test, build_resets_the_builder)
{
    dispatch_table_builder builder;
    builder.add("exit", "handle_exit");
    auto first = builder.build();
    EXPECT_FALSE(builder.contains("exit"));
    auto second = builder.build();
    EXPECT_EQ(first.size(), 1u);
    EXPECT_TRUE(second.empty());
}

TEST(dispatch_table_test, duplicate_method_is_rejected)
{
    dispatch_table_builder builder;
    builder.add("exit", "handle_exit");
    EXPECT_THROW(builder.add("exit", "handle_other"), peergen::error);
}

TEST(dispatch_table_test, unknown_method_is_a_lookup_failure)
{
    dispatch_table_builder builder;
    builder.add("exit", "handle_exit");
    auto table = builder.build();

    EXPECT_EQ(table.find("missing"), nullptr);
    try
    {
        table.at("missing");
        FAIL() << "expected lookup_failure";
    }
    catch (const lookup_failure& e)
    {
        EXPECT_EQ(e.get_method(), "missing");
    }
}

TEST(dispatch_table_test, equality_follows_entries)
{
    dispatch_table_builder left;
    left.add("a", "handle_a");
    left.add("b", "handle_b");
    dispatch_table_builder right;
    right.add("b", "handle_b");
    right.add("a", "handle_a");
    dispatch_table_builder same;
    same.add("a", "handle_a");
    same.add("b", "handle_b");

    auto left_table = left.build();
    EXPECT_FALSE(left_table == right.build());
    EXPECT_TRUE(left_table == same.build());
}
