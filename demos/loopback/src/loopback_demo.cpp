/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

/*
 *   Loopback Transport Demo
 *   Two in-process peers talking through a transport that delivers synchronously
 *
 *   Concept: the dispatch tables compiled from a protocol description drive
 *   the runtime peers directly
 *   - Initiator: sends initialize and textDocument/hover, receives window/logMessage
 *   - Responder: handles both requests and logs through a notification back
 */

#include <iostream>
#include <memory>
#include <string>

#include <peergen/peergen.h>

#include "code_generator.h"
#include "loader.h"

namespace
{
    const char* demo_model = R"({
        "metaData": {"version": "demo-1"},
        "requests": [
            {
                "method": "initialize",
                "typeName": "InitializeRequest",
                "params": {"kind": "reference", "name": "InitializeParams"},
                "result": {"kind": "reference", "name": "InitializeResult"},
                "messageDirection": "clientToServer"
            },
            {
                "method": "textDocument/hover",
                "typeName": "HoverRequest",
                "params": {"kind": "reference", "name": "HoverParams"},
                "result": {"kind": "or", "items": [{"kind": "reference", "name": "Hover"}, {"kind": "base", "name": "null"}]},
                "messageDirection": "clientToServer"
            }
        ],
        "notifications": [
            {
                "method": "window/logMessage",
                "typeName": "LogMessageNotification",
                "params": {"kind": "reference", "name": "LogMessageParams"},
                "messageDirection": "serverToClient"
            }
        ],
        "structures": [
            {"name": "InitializeParams", "properties": [{"name": "processId", "type": {"kind": "base", "name": "integer"}}]},
            {"name": "InitializeResult", "properties": [{"name": "serverName", "type": {"kind": "base", "name": "string"}}]},
            {"name": "HoverParams", "properties": [{"name": "uri", "type": {"kind": "base", "name": "DocumentUri"}}]},
            {"name": "Hover", "properties": [{"name": "contents", "type": {"kind": "base", "name": "string"}}]},
            {"name": "LogMessageParams", "properties": [{"name": "message", "type": {"kind": "base", "name": "string"}}]}
        ],
        "enumerations": [],
        "typeAliases": []
    })";

    // delivers straight into the remote peer and hands request results back to the sender
    class loopback_transport : public peergen::transport
    {
        std::weak_ptr<peergen::peer> sender_;
        std::weak_ptr<peergen::peer> receiver_;

        std::shared_ptr<peergen::peer> lock(const std::weak_ptr<peergen::peer>& target) const
        {
            auto ptr = target.lock();
            if (!ptr)
                throw peergen::error("loopback peer has gone away");
            return ptr;
        }

    public:
        void connect(std::weak_ptr<peergen::peer> sender, std::weak_ptr<peergen::peer> receiver)
        {
            sender_ = std::move(sender);
            receiver_ = std::move(receiver);
        }

        void request(const std::string& method, const peergen::payload& params) override
        {
            PEERGEN_INFO("--> {} {}", method, peergen::to_json(params));
            auto result = lock(receiver_)->handle(method, params);
            lock(sender_)->handle_result(method, result);
        }

        void notify(const std::string& method, const peergen::payload& params) override
        {
            PEERGEN_INFO("--> {} {}", method, peergen::to_json(params));
            lock(receiver_)->handle(method, params);
        }
    };

    std::string field_of(const peergen::payload& value, const std::string& name)
    {
        const auto& fields = value.struct_value().fields();
        auto it = fields.find(name);
        if (it == fields.end())
            return {};
        return it->second.string_value();
    }
}

void print_separator(const std::string& title)
{
    PEERGEN_INFO("");
    PEERGEN_INFO("{}", std::string(60, '='));
    PEERGEN_INFO("  {}", title);
    PEERGEN_INFO("{}", std::string(60, '='));
}

int main()
{
    try
    {
        print_separator("COMPILING PROTOCOL");

        peergen::code_generator generator(peergen::loader::load_json(demo_model), peergen::generator_options{});
        const auto& result = generator.generate();

        for (const auto& entry : result.responder.table.get_entries())
        {
            PEERGEN_INFO("responder {} -> {} (slot {})", entry.method, entry.handler, std::to_string(entry.slot));
        }
        for (const auto& entry : result.initiator.table.get_entries())
        {
            PEERGEN_INFO("initiator {} -> {} (slot {})", entry.method, entry.handler, std::to_string(entry.slot));
        }

        print_separator("WIRING PEERS");

        auto to_responder = std::make_shared<loopback_transport>();
        auto to_initiator = std::make_shared<loopback_transport>();

        auto initiator = std::make_shared<peergen::peer>(
            peergen::role::initiator, result.initiator.table, result.initiator.result_table, to_responder);
        auto responder = std::make_shared<peergen::peer>(
            peergen::role::responder, result.responder.table, result.responder.result_table, to_initiator);

        to_responder->connect(initiator, responder);
        to_initiator->connect(responder, initiator);

        responder->bind("handle_initialize_request",
            [](const peergen::context&, const peergen::payload&)
            { return peergen::make_object({{"serverName", peergen::make_string("loopback")}}); });

        responder->bind("handle_hover_request",
            [responder_ptr = std::weak_ptr<peergen::peer>(responder)](
                const peergen::context& ctx, const peergen::payload& params)
            {
                auto uri = field_of(params, "uri");
                if (auto self = responder_ptr.lock())
                {
                    self->notify("window/logMessage",
                        peergen::make_object({{"message", peergen::make_string("hovering over " + uri)}}));
                }
                PEERGEN_INFO("{} handled {}", peergen::to_string(ctx.receiver), ctx.method);
                return peergen::make_object({{"contents", peergen::make_string("contents of " + uri)}});
            });

        initiator->bind("handle_initialize_request_result",
            [](const peergen::context&, const peergen::payload& value)
            {
                PEERGEN_INFO("<-- connected to {}", field_of(value, "serverName"));
                return peergen::make_null();
            });

        initiator->bind("handle_hover_request_result",
            [](const peergen::context&, const peergen::payload& value)
            {
                PEERGEN_INFO("<-- {}", field_of(value, "contents"));
                return peergen::make_null();
            });

        initiator->bind("handle_log_message_notification",
            [](const peergen::context&, const peergen::payload& params)
            {
                PEERGEN_INFO("<-- log: {}", field_of(params, "message"));
                return peergen::make_null();
            });

        print_separator("EXCHANGING MESSAGES");

        initiator->request("initialize", peergen::make_object({{"processId", peergen::make_number(42)}}));
        initiator->request(
            "textDocument/hover", peergen::make_object({{"uri", peergen::make_string("file:///demo.txt")}}));

        print_separator("UNKNOWN METHOD");
        try
        {
            responder->handle("textDocument/definition", peergen::make_null());
        }
        catch (const peergen::lookup_failure& e)
        {
            PEERGEN_INFO("rejected as expected: {}", e.what());
        }
    }
    catch (const std::exception& e)
    {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    return 0;
}
