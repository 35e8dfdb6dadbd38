/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#pragma once

#include <filesystem>
#include <string>

#include "metamodel.h"

namespace peergen
{
    namespace loader
    {
        // parses a metaModel.json document, throws metamodel_error when it cannot be read
        model::metamodel load_json(const std::string& json);

        model::metamodel load_file(const std::filesystem::path& path);

        model::message_direction parse_direction(const std::string& tag);
        model::enumeration_kind parse_enumeration_kind(const std::string& name);
    }
}
