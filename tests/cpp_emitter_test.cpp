/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <memory>
#include <sstream>

#include <gtest/gtest.h>

#include "cpp_emitter.h"

using namespace peergen;

namespace
{
    bool contains(const std::string& text, const std::string& fragment)
    {
        return text.find(fragment) != std::string::npos;
    }

    definition_ptr make_record()
    {
        auto def = std::make_shared<definition>();
        def->kind = definition_kind::record;
        def->name = "TextDocumentPositionParams";
        def->documentation = "A position inside a document.\n\nUsed by many requests.";
        def->parents = {type_expr::make_name("WorkDoneProgressParams")};
        def->fields.push_back(field{"textDocument", type_expr::make_name("TextDocumentIdentifier"), {}, {}});
        def->fields.push_back(field{"default", type_expr::make_primitive(primitive::boolean), {}, {}});
        def->fields.push_back(field{"rootPath",
            type_expr::make_optional(type_expr::make_primitive(primitive::string)),
            {},
            "use workspaceFolders"});
        return def;
    }

    definition_ptr make_integer_enumeration()
    {
        auto def = std::make_shared<definition>();
        def->kind = definition_kind::enumeration;
        def->name = "Priority";
        def->backing = model::enumeration_kind::uinteger;
        def->supports_custom_values = true;
        def->entries.push_back(enumerator{"Low", int64_t{1}, {}, "use High"});
        def->entries.push_back(enumerator{"High", int64_t{2}, {}, {}});
        return def;
    }

    definition_ptr make_deprecated_alias()
    {
        auto def = std::make_shared<definition>();
        def->kind = definition_kind::alias;
        def->name = "OldName";
        def->deprecated = "gone";
        def->bound = type_expr::make_sequence(type_expr::make_primitive(primitive::integer));
        return def;
    }

    generation_result make_result()
    {
        generation_result result;
        result.types.version = "1.2.3";
        result.types.definitions = {make_deprecated_alias(), make_integer_enumeration(), make_record()};
        result.types.forward_references.push_back({"Node", "Tree"});
        return result;
    }

    std::string render_types(const generation_result& result, const generator_options& options = {})
    {
        std::stringstream stream;
        cpp_emitter::write_types(result, options, stream);
        return stream.str();
    }

    std::string render_peer(const generation_result& result, const message_compiler::peer_artifact& artifact)
    {
        std::stringstream stream;
        cpp_emitter::write_peer(result, artifact, generator_options{}, stream);
        return stream.str();
    }
}

TEST(cpp_emitter_test, parameter_types)
{
    EXPECT_EQ(cpp_emitter::parameter_type(type_expr::make_primitive(primitive::integer)), "std::int32_t");
    EXPECT_EQ(cpp_emitter::parameter_type(type_expr::make_primitive(primitive::boolean)), "bool");
    EXPECT_EQ(cpp_emitter::parameter_type(type_expr::make_primitive(primitive::string)), "const std::string&");
    EXPECT_EQ(cpp_emitter::parameter_type(type_expr::make_name("HoverParams")), "const HoverParams&");
    EXPECT_EQ(cpp_emitter::parameter_type(type_expr::make_literal(true)), "peergen::boolean_literal<true>");
    EXPECT_EQ(cpp_emitter::parameter_type(type_expr::make_sequence(type_expr::make_name("Range"))),
        "const std::vector<Range>&");
}

TEST(cpp_emitter_test, types_header_uses_the_output_namespace)
{
    generator_options options;
    options.output_namespace = "lsp";
    auto code = render_types(make_result(), options);

    EXPECT_EQ(code.rfind("#pragma once", 0), 0u);
    EXPECT_TRUE(contains(code, "// Generated by peergen from protocol version 1.2.3, do not edit."));
    EXPECT_TRUE(contains(code, "#include <peergen/literal.h>"));
    EXPECT_TRUE(contains(code, "namespace lsp::types"));
    EXPECT_TRUE(contains(code, "// Node refers to Tree before it is complete"));
}

TEST(cpp_emitter_test, deprecated_alias)
{
    auto code = render_types(make_result());
    EXPECT_TRUE(contains(code, "using OldName [[deprecated(\"gone\")]] = std::vector<std::int32_t>;"));
}

TEST(cpp_emitter_test, integer_enumeration)
{
    auto code = render_types(make_result());
    EXPECT_TRUE(contains(code, "enum class Priority : std::uint32_t"));
    EXPECT_TRUE(contains(code, "Low [[deprecated(\"use High\")]] = 1,"));
    EXPECT_TRUE(contains(code, "High = 2,"));
    EXPECT_TRUE(contains(code, "// the protocol allows values beyond the ones listed here"));
    EXPECT_FALSE(contains(code, "to_wire(Priority"));
}

TEST(cpp_emitter_test, record_with_parents_and_documentation)
{
    auto code = render_types(make_result());
    EXPECT_TRUE(contains(code, "// A position inside a document.\n"));
    EXPECT_TRUE(contains(code, "//\n"));
    EXPECT_TRUE(contains(code, "// Used by many requests."));
    EXPECT_TRUE(contains(code, "struct TextDocumentPositionParams : public WorkDoneProgressParams"));
    EXPECT_TRUE(contains(code, "TextDocumentIdentifier textDocument;"));
    EXPECT_TRUE(contains(code, "bool default_;"));
    EXPECT_TRUE(contains(code, "[[deprecated(\"use workspaceFolders\")]] std::optional<std::string> rootPath;"));
}

TEST(cpp_emitter_test, definitions_keep_their_order)
{
    auto code = render_types(make_result());
    auto alias = code.find("using OldName");
    auto enumeration = code.find("enum class Priority");
    auto record = code.find("struct TextDocumentPositionParams");
    ASSERT_NE(alias, std::string::npos);
    EXPECT_LT(alias, enumeration);
    EXPECT_LT(enumeration, record);
}

TEST(cpp_emitter_test, peer_without_messages)
{
    message_compiler::peer_artifact artifact;
    artifact.peer_role = role::responder;
    auto code = render_peer(make_result(), artifact);

    EXPECT_TRUE(contains(code, "template<class Transport> class responder : public Transport"));
    EXPECT_TRUE(contains(code, "using Transport::Transport;"));
    EXPECT_TRUE(contains(code, "virtual ~responder() = default;"));
    EXPECT_TRUE(contains(code, "peergen::payload handle(const std::string& method, const peergen::payload& params)"));
    EXPECT_TRUE(contains(code, "void handle_result(const std::string& method, const peergen::payload& result)"));
    EXPECT_TRUE(contains(code, "static const std::map<std::string, thunk> table;"));
    EXPECT_FALSE(contains(code, "private:"));
    EXPECT_FALSE(contains(code, "using types::"));
}

TEST(cpp_emitter_test, sender_without_params_sends_null)
{
    message_compiler::peer_artifact artifact;
    artifact.peer_role = role::initiator;

    message_compiler::method_def shutdown;
    shutdown.kind = message_compiler::method_kind::request_sender;
    shutdown.name = "shutdown";
    shutdown.wire_method = "shutdown";
    artifact.methods.push_back(shutdown);

    message_compiler::method_def exit;
    exit.kind = message_compiler::method_kind::notification_sender;
    exit.name = "exit";
    exit.wire_method = "exit";
    exit.deprecated = "do not";
    artifact.methods.push_back(exit);

    auto code = render_peer(make_result(), artifact);
    EXPECT_TRUE(contains(code, "void shutdown()"));
    EXPECT_TRUE(contains(code, "this->request(\"shutdown\", peergen::make_null());"));
    EXPECT_TRUE(contains(code, "[[deprecated(\"do not\")]] void exit()"));
    EXPECT_TRUE(contains(code, "this->notify(\"exit\", peergen::make_null());"));
}

TEST(cpp_emitter_test, handler_stub_and_thunk)
{
    message_compiler::peer_artifact artifact;
    artifact.peer_role = role::responder;
    artifact.imports = {"DidOpenParams"};

    message_compiler::method_def handler;
    handler.kind = message_compiler::method_kind::notification_handler;
    handler.name = "handle_did_open";
    handler.wire_method = "textDocument/didOpen";
    handler.arguments.push_back({"context", type_expr::make_name("peergen::context")});
    handler.arguments.push_back({"params", type_expr::make_name("DidOpenParams")});
    artifact.methods.push_back(handler);

    dispatch_table_builder builder;
    builder.add("textDocument/didOpen", "handle_did_open");
    artifact.table = builder.build();

    auto code = render_peer(make_result(), artifact);
    EXPECT_TRUE(contains(code, "using types::DidOpenParams;"));
    EXPECT_TRUE(contains(code,
        "virtual void handle_did_open(const peergen::context& context, const DidOpenParams& params) = 0;"));
    EXPECT_TRUE(contains(code, "{\"textDocument/didOpen\", &responder::dispatch_handle_did_open},"));
    EXPECT_TRUE(contains(code, "private:"));
    EXPECT_TRUE(contains(code,
        "peergen::payload dispatch_handle_did_open(const peergen::context& context, const peergen::payload& params)"));
    EXPECT_TRUE(contains(code, "handle_did_open(context, this->template decode<DidOpenParams>(params));"));
    EXPECT_TRUE(contains(code, "return peergen::make_null();"));
    EXPECT_TRUE(contains(code,
        "return (this->*(it->second))(peergen::context{peergen::role::responder, method}, params);"));
}

TEST(cpp_emitter_test, trailing_backslash_does_not_swallow_the_next_line)
{
    auto def = std::make_shared<definition>();
    def->kind = definition_kind::record;
    def->name = "WorkspaceFolder";
    def->fields.push_back(field{"uri", type_expr::make_name("URI"), "A path such as C:\\work\\", {}});
    def->fields.push_back(field{"name", type_expr::make_primitive(primitive::string), "ends in a blank \\ ", {}});

    generation_result result;
    result.types.version = "3.17\\";
    result.types.definitions = {def};
    auto code = render_types(result);

    EXPECT_TRUE(contains(code, "// A path such as C:\\work\n"));
    EXPECT_TRUE(contains(code, "// ends in a blank\n"));
    EXPECT_TRUE(contains(code, "protocol version 3.17, do not edit."));
    EXPECT_TRUE(contains(code, "URI uri;"));
    EXPECT_TRUE(contains(code, "std::string name;"));
    EXPECT_FALSE(contains(code, "\\\n"));
}

TEST(cpp_emitter_test, forward_declared_record)
{
    auto def = std::make_shared<definition>();
    def->kind = definition_kind::record;
    def->name = "Node";
    def->forward_declared = true;

    generation_result result;
    result.types.definitions = {def};
    auto code = render_types(result);
    auto declaration = code.find("struct Node;");
    ASSERT_NE(declaration, std::string::npos);
    EXPECT_LT(declaration, code.find("struct Node\n"));
}
