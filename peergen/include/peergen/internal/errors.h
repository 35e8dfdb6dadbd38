/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <stdexcept>
#include <string>

namespace peergen
{
    class error : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // handle() was called with a wire method the dispatch table does not know
    class lookup_failure : public error
    {
        std::string method_;

    public:
        explicit lookup_failure(const std::string& method)
            : error("no handler registered for method '" + method + "'")
            , method_(method)
        {
        }

        const std::string& get_method() const { return method_; }
    };

    // the dispatch table names a handler that nobody supplied a body for
    class unimplemented_handler : public error
    {
        std::string handler_;

    public:
        explicit unimplemented_handler(const std::string& handler)
            : error("handler '" + handler + "' has no implementation")
            , handler_(handler)
        {
        }

        const std::string& get_handler() const { return handler_; }
    };
}
