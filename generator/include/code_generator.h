/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "definition.h"
#include "dependency_orderer.h"
#include "message_compiler.h"
#include "metamodel.h"

namespace peergen
{
    struct generator_options
    {
        std::string output_namespace = "protocol";

        std::string types_file = "types.h";
        std::string initiator_file = "initiator.h";
        std::string responder_file = "responder.h";

        std::vector<std::string> base_aliases = {"URI", "DocumentUri", "RegExp"};
        std::set<std::string> recursive_aliases = {"LSPObject", "LSPArray"};

        bool include_proposed = true;
    };

    struct types_artifact
    {
        std::string version;
        definition_list definitions; // dependency order
        std::vector<dependency_orderer::forward_reference> forward_references;
    };

    struct generation_result
    {
        types_artifact types;
        message_compiler::peer_artifact initiator;
        message_compiler::peer_artifact responder;
    };

    class code_generator
    {
        model::metamodel model_;
        generator_options options_;
        std::optional<generation_result> result_;

        const generation_result& get_result() const;

    public:
        code_generator(model::metamodel model, generator_options options);

        // runs the whole pipeline, only the first call does any work
        const generation_result& generate();

        // rendered headers, generate() must have been called
        std::string types_code() const;
        std::string initiator_code() const;
        std::string responder_code() const;

        const generator_options& get_options() const { return options_; }
    };
}
