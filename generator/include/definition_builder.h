/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#pragma once

#include <set>
#include <string>
#include <vector>

#include "definition.h"
#include "metamodel.h"

namespace peergen
{
    namespace definition_builder
    {
        struct options
        {
            // scalar names that compile to opaque names and get a string alias at the top of the types artifact
            std::vector<std::string> base_aliases = {"URI", "DocumentUri", "RegExp"};

            // aliases that take part in recursion; their occurrences inside alias bodies are forward references
            std::set<std::string> recursive_aliases = {"LSPObject", "LSPArray"};
        };

        // entries in declared order, values copied byte for byte
        definition_ptr build_enumeration(const model::enumeration& source);

        // Parents are the compiled extends list. Fields are the structure's own properties followed by the own
        // properties of each mixin in declared order; a mixin's own mixins are not followed.
        // Throws unresolved_type_reference when a mixin names no structure.
        definition_ptr build_structure(const model::metamodel& model, const model::structure& source);

        definition_ptr build_alias(const model::metamodel& model,
            const model::type_alias& source,
            const std::set<std::string>& recursive_aliases);

        definition_list build_base_aliases(const std::vector<std::string>& names);

        // base aliases, then enumerations, structures and aliases in declaration order
        definition_list build_all(const model::metamodel& model, const options& opts);

        // replaces every name in names with a forward marker
        type_expr wrap_forward(const type_expr& expr, const std::set<std::string>& names);
    }
}
