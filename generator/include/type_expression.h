/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "metamodel.h"

namespace peergen
{
    enum class primitive
    {
        string,
        integer,
        uinteger,
        decimal,
        boolean,
        null
    };

    enum class expr_kind
    {
        primitive,
        name,           // reference to a named definition, or an opaque base name passed through
        sequence,       // args[0] is the element
        associative,    // args[0] is the key, args[1] the value
        union_of,       // args are the alternatives
        product,        // args are the tuple elements, in order
        literal,        // exactly one value
        inline_record,  // labels[i] names args[i]; echoed back as the text of its field list
        optional_field, // args[0] may be absent, as opposed to present and null
        forward         // name that may be used before its definition is complete
    };

    using literal_value = std::variant<std::string, int64_t, bool>;

    // a compiled target type expression
    struct type_expr
    {
        expr_kind kind = expr_kind::primitive;
        primitive scalar = primitive::null;
        std::string name;
        std::vector<type_expr> args;
        std::vector<std::string> labels;
        literal_value literal;

        static type_expr make_primitive(primitive scalar);
        static type_expr make_name(const std::string& name);
        static type_expr make_sequence(type_expr element);
        static type_expr make_associative(type_expr key, type_expr value);
        static type_expr make_union(std::vector<type_expr> alternatives);
        static type_expr make_product(std::vector<type_expr> elements);
        static type_expr make_literal(literal_value value);
        static type_expr make_inline_record(std::vector<std::string> labels, std::vector<type_expr> fields);
        static type_expr make_optional(type_expr inner);
        static type_expr make_forward(const std::string& name);

        bool operator==(const type_expr& other) const = default;
    };

    // the C++ spelling of the expression
    std::string to_string(const type_expr& expr);
    std::string to_string(primitive scalar);

    // Bare identifiers mentioned by the expression, first-seen order, no duplicates.
    // Text inside literals is never scanned.
    std::vector<std::string> identifiers(const type_expr& expr);

    // appends identifiers to out, optionally skipping names only reached through a forward marker
    void collect_identifiers(const type_expr& expr, std::vector<std::string>& out, bool include_forward);

    namespace type_expression
    {
        // total over every type_kind, pure, and never resolves reference names
        type_expr compile(const model::type_arena& types, model::type_id id);
    }
}
