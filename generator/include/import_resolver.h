/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#pragma once

#include <string>
#include <vector>

#include "definition.h"
#include "message_compiler.h"

namespace peergen
{
    namespace import_resolver
    {
        // defined names used by any argument or return type of the artifact's methods,
        // first-seen order, no duplicates
        std::vector<std::string> resolve(const message_compiler::peer_artifact& artifact, const definition_list& defined);

        // defined names used by a definition's parents, fields or bound expression
        std::vector<std::string> resolve(const definition& def, const definition_list& defined);
    }
}
