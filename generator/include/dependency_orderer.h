/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#pragma once

#include <string>
#include <vector>

#include "definition.h"

namespace peergen
{
    namespace dependency_orderer
    {
        // "from" had to be placed before "to" because the two are on a cycle
        struct forward_reference
        {
            std::string from;
            std::string to;

            bool operator==(const forward_reference& other) const = default;
        };

        struct result
        {
            definition_list ordered;
            std::vector<forward_reference> forward_references;
        };

        // Depth first placement: every defined name a definition depends on is placed before it, unrelated
        // definitions keep their declaration order. Only the first definition carrying a name is kept.
        // A name met again while it is still being placed is a cycle; it is recorded as a forward reference
        // and the walk carries on.
        result order(const definition_list& definitions);

        // Makes the ordered list declarable: each "from" definition gets its fields and alias bound rewritten so
        // the names it reaches early are forward markers, and each "to" definition is flagged forward_declared.
        // Definitions off every cycle are shared unchanged.
        definition_list close_cycles(const definition_list& ordered, const std::vector<forward_reference>& references);
    }
}
