/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#pragma once

#include <string>
#include <vector>

#include <peergen/internal/payload.h>

#include "definition.h"

namespace peergen
{
    namespace default_values
    {
        struct options
        {
            bool only_required = false; // leave out optional fields
            bool recursive = false;     // expand referenced records instead of reporting them missing
        };

        struct result
        {
            payload value;
            std::vector<std::string> missing; // records left null, in the order they were met
        };

        // Builds a placeholder value for the named definition, typically a record used as request params.
        // Throws unsupported_type_default for a shape it cannot fill in.
        result synthesize(const definition_list& definitions, const std::string& name, const options& opts = {});
    }
}
