/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "metamodel.h"
#include "type_expression.h"

namespace peergen
{
    enum class definition_kind
    {
        record,
        alias,
        enumeration
    };

    struct field
    {
        std::string name;
        type_expr type;
        std::string documentation;
        std::string deprecated;
    };

    struct enumerator
    {
        std::string name;
        model::enumeration_value value;
        std::string documentation;
        std::string deprecated;
    };

    // A compiled, named output unit. Built once by the definition builder and shared as const afterwards;
    // ordering only ever rearranges pointers to it.
    struct definition
    {
        definition_kind kind = definition_kind::record;
        std::string name;
        std::string documentation;
        std::string deprecated;

        // record
        std::vector<type_expr> parents;
        std::vector<field> fields;

        // alias
        type_expr bound;

        // record or alias that others refer to through a forward marker, declared ahead of every definition
        bool forward_declared = false;

        // enumeration
        model::enumeration_kind backing = model::enumeration_kind::string;
        std::vector<enumerator> entries;
        bool supports_custom_values = false;

        // identifiers of parents, field types and the bound expression, first-seen order
        std::vector<std::string> references() const;

        // the subset of references() that has to be defined first, forward markers excluded
        std::vector<std::string> dependencies() const;
    };

    using definition_ptr = std::shared_ptr<const definition>;
    using definition_list = std::vector<definition_ptr>;

    // nullptr when no definition carries the name
    definition_ptr find_definition(const definition_list& definitions, const std::string& name);
}
