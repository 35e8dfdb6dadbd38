/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once
#include <string>
#include <stdint.h>
#include <functional>

namespace peergen
{
    // the two symmetric peers of a generated protocol binding
    enum class role
    {
        initiator,
        responder
    };

    inline const char* to_string(role val)
    {
        switch (val)
        {
        case role::initiator:
            return "initiator";
        case role::responder:
            return "responder";
        }
        return "unknown";
    }

    // dense index of an entry in a dispatch table, the jump slot behind a wire method string
    struct ordinal
    {
        uint64_t id = 0;

        uint64_t get_val() const { return id; }
        bool operator==(const ordinal& other) const = default;
        bool operator<(const ordinal& other) const { return id < other.id; }
    };
}

namespace std
{
    inline std::string to_string(const peergen::ordinal& val)
    {
        return std::to_string(val.get_val());
    }

    template<> struct hash<peergen::ordinal>
    {
        auto operator()(const peergen::ordinal& item) const noexcept { return (std::size_t)item.get_val(); }
    };
}
