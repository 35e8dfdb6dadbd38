/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <string>

#include <peergen/internal/payload.h>

namespace peergen
{
    // The wire boundary a peer sends through. Correlating a request with its eventual
    // result is the transport's business, it hands results back via peer::handle_result.
    class transport
    {
    public:
        virtual ~transport() = default;

        virtual void request(const std::string& method, const payload& params) = 0;
        virtual void notify(const std::string& method, const payload& params) = 0;
    };
}
