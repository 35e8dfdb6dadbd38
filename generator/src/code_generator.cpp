/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <sstream>
#include <utility>

#include <peergen/internal/errors.h>
#include <peergen/internal/logger.h>

#include "code_generator.h"
#include "cpp_emitter.h"
#include "definition_builder.h"
#include "import_resolver.h"

namespace peergen
{
    code_generator::code_generator(model::metamodel model, generator_options options)
        : model_(std::move(model))
        , options_(std::move(options))
    {
    }

    const generation_result& code_generator::generate()
    {
        if (result_)
            return *result_;

        model::metamodel filtered;
        const model::metamodel* input = &model_;
        if (!options_.include_proposed)
        {
            filtered = model::without_proposed(model_);
            input = &filtered;
        }

        definition_builder::options build_options;
        build_options.base_aliases = options_.base_aliases;
        build_options.recursive_aliases = options_.recursive_aliases;
        auto definitions = definition_builder::build_all(*input, build_options);

        auto ordered = dependency_orderer::order(definitions);
        auto messages = message_compiler::compile(*input);

        generation_result result;
        result.types.version = input->meta.version;
        result.types.definitions = dependency_orderer::close_cycles(ordered.ordered, ordered.forward_references);
        result.types.forward_references = std::move(ordered.forward_references);

        messages.initiator.imports = import_resolver::resolve(messages.initiator, result.types.definitions);
        messages.responder.imports = import_resolver::resolve(messages.responder, result.types.definitions);
        result.initiator = std::move(messages.initiator);
        result.responder = std::move(messages.responder);

        PEERGEN_INFO("generated {} definitions, initiator {} methods, responder {} methods",
            result.types.definitions.size(),
            result.initiator.methods.size(),
            result.responder.methods.size());

        result_ = std::move(result);
        return *result_;
    }

    const generation_result& code_generator::get_result() const
    {
        if (!result_)
            throw error("code not generated yet");
        return *result_;
    }

    std::string code_generator::types_code() const
    {
        std::stringstream stream;
        cpp_emitter::write_types(get_result(), options_, stream);
        return stream.str();
    }

    std::string code_generator::initiator_code() const
    {
        std::stringstream stream;
        cpp_emitter::write_peer(get_result(), get_result().initiator, options_, stream);
        return stream.str();
    }

    std::string code_generator::responder_code() const
    {
        std::stringstream stream;
        cpp_emitter::write_peer(get_result(), get_result().responder, options_, stream);
        return stream.str();
    }
}
