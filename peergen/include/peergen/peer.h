/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <peergen/dispatch_table.h>
#include <peergen/internal/payload.h>
#include <peergen/internal/types.h>
#include <peergen/transport.h>

namespace peergen
{
    struct context
    {
        role receiver = role::initiator;
        std::string method;
    };

    using handler_function = std::function<payload(const context&, const payload&)>;

    // Runtime side of one generated role: resolves incoming wire methods through its dispatch table
    // and sends outgoing messages through its transport.
    class peer
    {
        role role_;
        dispatch_table table_;
        dispatch_table result_table_;
        std::vector<handler_function> handlers_;
        std::vector<handler_function> result_handlers_;
        std::shared_ptr<transport> transport_;

        payload invoke(const dispatch_table& table,
            const std::vector<handler_function>& handlers,
            const std::string& method,
            const payload& params_or_result) const;

    public:
        peer(role peer_role, dispatch_table table, dispatch_table result_table, std::shared_ptr<transport> channel = nullptr);

        role get_role() const { return role_; }
        const dispatch_table& get_table() const { return table_; }
        const dispatch_table& get_result_table() const { return result_table_; }

        void set_transport(std::shared_ptr<transport> channel) { transport_ = std::move(channel); }

        // binds every entry of either table that names this handler, throws lookup_failure if none does
        void bind(const std::string& handler, handler_function fn);

        // throws lookup_failure for an unknown method and unimplemented_handler for an unbound entry
        payload handle(const std::string& method, const payload& params) const;
        void handle_result(const std::string& method, const payload& result) const;

        void request(const std::string& method, const payload& params) const;
        void notify(const std::string& method, const payload& params) const;
    };
}
