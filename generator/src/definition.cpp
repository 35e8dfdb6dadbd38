/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <algorithm>

#include "definition.h"

namespace peergen
{
    namespace
    {
        std::vector<std::string> scan(const definition& def, bool include_forward)
        {
            std::vector<std::string> all;
            for (const auto& parent : def.parents)
            {
                collect_identifiers(parent, all, include_forward);
            }
            for (const auto& item : def.fields)
            {
                collect_identifiers(item.type, all, include_forward);
            }
            if (def.kind == definition_kind::alias)
            {
                collect_identifiers(def.bound, all, include_forward);
            }

            std::vector<std::string> result;
            for (auto& name : all)
            {
                if (std::find(result.begin(), result.end(), name) == result.end())
                    result.push_back(std::move(name));
            }
            return result;
        }
    }

    std::vector<std::string> definition::references() const
    {
        return scan(*this, true);
    }

    std::vector<std::string> definition::dependencies() const
    {
        return scan(*this, false);
    }

    definition_ptr find_definition(const definition_list& definitions, const std::string& name)
    {
        auto it = std::find_if(
            definitions.begin(), definitions.end(), [&](const definition_ptr& def) { return def->name == name; });
        if (it == definitions.end())
            return nullptr;
        return *it;
    }
}
