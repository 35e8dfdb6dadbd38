/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <peergen/peer.h>
#include <peergen/internal/errors.h>
#include <peergen/internal/logger.h>

namespace peergen
{
    peer::peer(role peer_role, dispatch_table table, dispatch_table result_table, std::shared_ptr<transport> channel)
        : role_(peer_role)
        , table_(std::move(table))
        , result_table_(std::move(result_table))
        , handlers_(table_.size())
        , result_handlers_(result_table_.size())
        , transport_(std::move(channel))
    {
    }

    void peer::bind(const std::string& handler, handler_function fn)
    {
        bool found = false;
        for (const auto& entry : table_.get_entries())
        {
            if (entry.handler == handler)
            {
                handlers_[entry.slot.get_val()] = fn;
                found = true;
            }
        }
        for (const auto& entry : result_table_.get_entries())
        {
            if (entry.handler == handler)
            {
                result_handlers_[entry.slot.get_val()] = fn;
                found = true;
            }
        }
        if (!found)
            throw lookup_failure(handler);
    }

    payload peer::invoke(const dispatch_table& table,
        const std::vector<handler_function>& handlers,
        const std::string& method,
        const payload& params_or_result) const
    {
        const auto& entry = table.at(method);
        const auto& fn = handlers[entry.slot.get_val()];
        if (!fn)
            throw unimplemented_handler(entry.handler);

        PEERGEN_TRACE("{} dispatching {} to {}", to_string(role_), method, entry.handler);
        return fn(context{role_, method}, params_or_result);
    }

    payload peer::handle(const std::string& method, const payload& params) const
    {
        return invoke(table_, handlers_, method, params);
    }

    void peer::handle_result(const std::string& method, const payload& result) const
    {
        invoke(result_table_, result_handlers_, method, result);
    }

    void peer::request(const std::string& method, const payload& params) const
    {
        if (!transport_)
            throw error(std::string(to_string(role_)) + " has no transport to send '" + method + "'");
        transport_->request(method, params);
    }

    void peer::notify(const std::string& method, const payload& params) const
    {
        if (!transport_)
            throw error(std::string(to_string(role_)) + " has no transport to send '" + method + "'");
        transport_->notify(method, params);
    }
}
