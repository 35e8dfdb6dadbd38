/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <cctype>
#include <utility>

#include <peergen/internal/logger.h>

#include "helpers.h"
#include "message_compiler.h"

namespace peergen
{
    namespace message_compiler
    {
        namespace
        {
            // a role while its tables are still being filled in
            struct role_accumulator
            {
                role peer_role;
                std::vector<method_def> methods;
                dispatch_table_builder table;
                dispatch_table_builder result_table;

                peer_artifact freeze()
                {
                    peer_artifact artifact;
                    artifact.peer_role = peer_role;
                    artifact.methods = std::move(methods);
                    artifact.table = table.build();
                    artifact.result_table = result_table.build();
                    return artifact;
                }
            };

            struct message_info
            {
                std::string id;
                std::string wire_method;
                std::optional<type_expr> params;
                std::string documentation;
                std::string deprecated;
            };

            template<class Message> message_info describe(const model::type_arena& types, const Message& message)
            {
                message_info info;
                info.id = method_identifier(message.type_name, message.method);
                info.wire_method = message.method;
                if (message.params)
                    info.params = type_expression::compile(types, *message.params);
                info.documentation = message.documentation;
                info.deprecated = message.deprecated;
                return info;
            }

            method_def make_method(method_kind kind, const std::string& name, const message_info& info)
            {
                method_def def;
                def.kind = kind;
                def.name = name;
                def.wire_method = info.wire_method;
                def.documentation = info.documentation;
                def.deprecated = info.deprecated;
                return def;
            }

            void add_params(method_def& def, const message_info& info)
            {
                if (info.params)
                    def.arguments.push_back(argument{"params", *info.params});
            }

            bool sent_by(model::message_direction direction, role sender)
            {
                switch (direction)
                {
                case model::message_direction::initiator_to_responder:
                    return sender == role::initiator;
                case model::message_direction::responder_to_initiator:
                    return sender == role::responder;
                case model::message_direction::both:
                    return true;
                }
                return false;
            }

            void add_request(
                role_accumulator& sender, role_accumulator& receiver, const message_info& info, const type_expr& result)
            {
                auto send = make_method(method_kind::request_sender, info.id, info);
                add_params(send, info);
                sender.methods.push_back(std::move(send));

                auto on_result = make_method(method_kind::result_handler, result_handler_identifier(info.id), info);
                on_result.arguments.push_back(argument{"context", context_type()});
                on_result.arguments.push_back(argument{"result", result});
                sender.result_table.add(info.wire_method, on_result.name);
                sender.methods.push_back(std::move(on_result));

                auto handle = make_method(method_kind::request_handler, handler_identifier(info.id), info);
                handle.arguments.push_back(argument{"context", context_type()});
                add_params(handle, info);
                handle.returns = result;
                receiver.table.add(info.wire_method, handle.name);
                receiver.methods.push_back(std::move(handle));
            }

            void add_notification(role_accumulator& sender, role_accumulator& receiver, const message_info& info)
            {
                auto send = make_method(method_kind::notification_sender, info.id, info);
                add_params(send, info);
                sender.methods.push_back(std::move(send));

                auto handle = make_method(method_kind::notification_handler, handler_identifier(info.id), info);
                handle.arguments.push_back(argument{"context", context_type()});
                add_params(handle, info);
                receiver.table.add(info.wire_method, handle.name);
                receiver.methods.push_back(std::move(handle));
            }
        }

        std::string method_identifier(const std::string& type_name, const std::string& wire_method)
        {
            if (!type_name.empty())
                return to_snake_case(type_name);

            std::string snake = to_snake_case(wire_method);
            std::string result;
            bool pending_separator = false;
            for (char c : snake)
            {
                if (std::isalnum(static_cast<unsigned char>(c)) || c == '_')
                {
                    if (pending_separator && !result.empty())
                        result += '_';
                    pending_separator = false;
                    if (c == '_' && (result.empty() || result.back() == '_'))
                        continue;
                    result += c;
                }
                else
                {
                    pending_separator = true;
                }
            }
            while (!result.empty() && result.back() == '_')
                result.pop_back();
            return result;
        }

        std::string handler_identifier(const std::string& method_id)
        {
            return "handle_" + method_id;
        }

        std::string result_handler_identifier(const std::string& method_id)
        {
            return "handle_" + method_id + "_result";
        }

        type_expr context_type()
        {
            return type_expr::make_name("peergen::context");
        }

        compiled_messages compile(const model::metamodel& model)
        {
            role_accumulator initiator{role::initiator, {}, {}, {}};
            role_accumulator responder{role::responder, {}, {}, {}};

            for (const auto& item : model.requests)
            {
                auto info = describe(model.types, item);
                auto result = type_expression::compile(model.types, item.result);
                if (sent_by(item.direction, role::initiator))
                    add_request(initiator, responder, info, result);
                if (sent_by(item.direction, role::responder))
                    add_request(responder, initiator, info, result);
                PEERGEN_DEBUG("request {} -> {}", info.wire_method, info.id);
            }

            for (const auto& item : model.notifications)
            {
                auto info = describe(model.types, item);
                if (sent_by(item.direction, role::initiator))
                    add_notification(initiator, responder, info);
                if (sent_by(item.direction, role::responder))
                    add_notification(responder, initiator, info);
                PEERGEN_DEBUG("notification {} -> {}", info.wire_method, info.id);
            }

            compiled_messages result;
            result.initiator = initiator.freeze();
            result.responder = responder.freeze();
            return result;
        }
    }
}
