/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#pragma once

#include <ostream>
#include <string>

#include "code_generator.h"

namespace peergen
{
    namespace cpp_emitter
    {
        // the shared types header, definitions live in namespace <output_namespace>::types
        void write_types(const generation_result& result, const generator_options& options, std::ostream& stream);

        // a role's class template, parameterised on the transport it derives from
        void write_peer(const generation_result& result,
            const message_compiler::peer_artifact& artifact,
            const generator_options& options,
            std::ostream& stream);

        // type as spelled in a parameter list, by const reference unless it is a scalar
        std::string parameter_type(const type_expr& type);
    }
}
