/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <peergen/dispatch_table.h>
#include <peergen/internal/types.h>

#include "metamodel.h"
#include "type_expression.h"

namespace peergen
{
    namespace message_compiler
    {
        enum class method_kind
        {
            request_sender,
            notification_sender,
            result_handler,
            request_handler,
            notification_handler
        };

        struct argument
        {
            std::string name;
            type_expr type;
        };

        struct method_def
        {
            method_kind kind = method_kind::request_sender;
            std::string name;
            std::string wire_method;
            std::vector<argument> arguments;
            std::optional<type_expr> returns; // empty for anything that returns nothing
            std::string documentation;
            std::string deprecated;
        };

        // everything generated for one role
        struct peer_artifact
        {
            role peer_role = role::initiator;
            std::vector<method_def> methods;
            dispatch_table table;        // wire method -> request or notification handler
            dispatch_table result_table; // wire method -> result handler of a request this role sends
            std::vector<std::string> imports;
        };

        struct compiled_messages
        {
            peer_artifact initiator;
            peer_artifact responder;
        };

        // "TextDocumentHover" -> "text_document_hover". When the declared type name is empty the wire method is
        // used instead, so "$/cancelRequest" -> "cancel_request".
        std::string method_identifier(const std::string& type_name, const std::string& wire_method);

        std::string handler_identifier(const std::string& method_id);
        std::string result_handler_identifier(const std::string& method_id);

        // type of the first argument of every handler stub
        type_expr context_type();

        // Roles receive, in message declaration order (requests, then notifications), the senders and handler
        // stubs their direction calls for. Tables are only readable once every message has been compiled.
        compiled_messages compile(const model::metamodel& model);
    }
}
