/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <algorithm>
#include <set>

#include "import_resolver.h"

namespace peergen
{
    namespace import_resolver
    {
        namespace
        {
            std::vector<std::string> keep_defined(const std::vector<std::string>& tokens, const definition_list& defined)
            {
                std::set<std::string> names;
                for (const auto& def : defined)
                {
                    names.insert(def->name);
                }

                std::vector<std::string> result;
                for (const auto& token : tokens)
                {
                    if (!names.count(token))
                        continue;
                    if (std::find(result.begin(), result.end(), token) == result.end())
                        result.push_back(token);
                }
                return result;
            }
        }

        std::vector<std::string> resolve(const message_compiler::peer_artifact& artifact, const definition_list& defined)
        {
            std::vector<std::string> tokens;
            for (const auto& method : artifact.methods)
            {
                for (const auto& arg : method.arguments)
                {
                    collect_identifiers(arg.type, tokens, true);
                }
                if (method.returns)
                    collect_identifiers(*method.returns, tokens, true);
            }
            return keep_defined(tokens, defined);
        }

        std::vector<std::string> resolve(const definition& def, const definition_list& defined)
        {
            return keep_defined(def.references(), defined);
        }
    }
}
