/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#pragma once

#include <string>

#include <peergen/internal/errors.h>

namespace peergen
{
    // a name had to be dereferenced (a mixin, for instance) and nothing carries it
    class unresolved_type_reference : public error
    {
        std::string name_;

    public:
        unresolved_type_reference(const std::string& name, const std::string& referenced_from)
            : error("unresolved type reference '" + name + "' in '" + referenced_from + "'")
            , name_(name)
        {
        }

        const std::string& get_name() const { return name_; }
    };

    // default-value synthesis met a shape it cannot produce a value for
    class unsupported_type_default : public error
    {
    public:
        using error::error;
    };

    // the protocol description could not be read
    class metamodel_error : public error
    {
    public:
        using error::error;
    };
}
