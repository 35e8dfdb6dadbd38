/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <gtest/gtest.h>

#include "helpers.h"

using namespace peergen;

TEST(helpers_test, snake_case)
{
    EXPECT_EQ(to_snake_case("Hover"), "hover");
    EXPECT_EQ(to_snake_case("TextDocumentHover"), "text_document_hover");
    EXPECT_EQ(to_snake_case("URI"), "uri");
    EXPECT_EQ(to_snake_case("already_snake"), "already_snake");
}

TEST(helpers_test, escape_keeps_bytes)
{
    EXPECT_EQ(escape_string("plain"), "plain");
    EXPECT_EQ(escape_string("a\"b"), "a\\\"b");
    EXPECT_EQ(escape_string("back\\slash"), "back\\\\slash");
    EXPECT_EQ(escape_string("\x1b"), "\\033");
    EXPECT_EQ(escape_string("\x1b" "1"), "\\0331");
    EXPECT_EQ(escape_string("line\n"), "line\\n");
}

TEST(helpers_test, keywords_get_an_underscore)
{
    EXPECT_TRUE(is_cpp_keyword("delete"));
    EXPECT_FALSE(is_cpp_keyword("range"));
    EXPECT_EQ(sanitize_identifier("namespace"), "namespace_");
    EXPECT_EQ(sanitize_identifier("uri"), "uri");
}
