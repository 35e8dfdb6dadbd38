/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// In-memory form of a protocol description: requests, notifications, structures, enumerations and type aliases.

namespace peergen
{
    namespace model
    {
        enum class type_kind
        {
            base,
            reference,
            array,
            map,
            and_type,
            or_type,
            tuple,
            structure_literal,
            string_literal,
            integer_literal,
            boolean_literal
        };

        // index of a node in a type_arena
        struct type_id
        {
            uint64_t id = 0;

            uint64_t get_val() const { return id; }
            bool operator==(const type_id& other) const = default;
        };

        struct annotations
        {
            std::string documentation;
            std::string since;
            bool proposed = false;
            std::string deprecated; // deprecation message, empty when not deprecated
        };

        struct property : annotations
        {
            std::string name;
            type_id type;
            bool optional = false;
        };

        struct structure_literal : annotations
        {
            std::vector<property> properties;
        };

        struct type_node
        {
            type_kind kind = type_kind::base;
            std::string name;            // base and reference
            type_id element;             // array
            type_id key;                 // map
            type_id value;               // map
            std::vector<type_id> items;  // and, or, tuple
            structure_literal literal;   // structure_literal
            std::string string_value;    // string_literal
            int64_t integer_value = 0;   // integer_literal
            bool boolean_value = false;  // boolean_literal
        };

        // Append-only store of type nodes. A node never changes once added and references between nodes are
        // indices, so self and mutually recursive types need no special handling at construction time.
        class type_arena
        {
            std::vector<type_node> nodes_;

        public:
            type_id add(type_node node);

            // throws std::out_of_range for an id that was not produced by this arena
            const type_node& get(type_id id) const;
            std::size_t size() const { return nodes_.size(); }

            type_id base(const std::string& name);
            type_id reference(const std::string& name);
            type_id array(type_id element);
            type_id map(type_id key, type_id value);
            type_id and_of(std::vector<type_id> items);
            type_id or_of(std::vector<type_id> items);
            type_id tuple(std::vector<type_id> items);
            type_id structure(structure_literal literal);
            type_id string_literal(const std::string& value);
            type_id integer_literal(int64_t value);
            type_id boolean_literal(bool value);
        };

        enum class enumeration_kind
        {
            string,
            integer,
            uinteger
        };

        using enumeration_value = std::variant<std::string, int64_t>;

        struct enumeration_entry : annotations
        {
            std::string name;
            enumeration_value value;
        };

        struct enumeration : annotations
        {
            std::string name;
            enumeration_kind kind = enumeration_kind::string;
            std::vector<enumeration_entry> values;
            bool supports_custom_values = false;
        };

        struct structure : annotations
        {
            std::string name;
            std::vector<type_id> extends;
            std::vector<type_id> mixins;
            std::vector<property> properties;
        };

        struct type_alias : annotations
        {
            std::string name;
            type_id type;
        };

        enum class message_direction
        {
            initiator_to_responder,
            responder_to_initiator,
            both
        };

        struct request : annotations
        {
            std::string method;
            std::string type_name;
            std::optional<type_id> params;
            type_id result;
            std::optional<type_id> partial_result;
            std::optional<type_id> error_data;
            std::string registration_method;
            std::optional<type_id> registration_options;
            message_direction direction = message_direction::initiator_to_responder;
        };

        struct notification : annotations
        {
            std::string method;
            std::string type_name;
            std::optional<type_id> params;
            std::string registration_method;
            std::optional<type_id> registration_options;
            message_direction direction = message_direction::initiator_to_responder;
        };

        struct meta_data
        {
            std::string version;
        };

        struct metamodel
        {
            meta_data meta;
            type_arena types;
            std::vector<request> requests;
            std::vector<notification> notifications;
            std::vector<structure> structures;
            std::vector<enumeration> enumerations;
            std::vector<type_alias> type_aliases;

            // nullptr when no structure carries the name
            const structure* find_structure(const std::string& name) const;
        };

        // copy of the model without anything flagged as proposed
        metamodel without_proposed(const metamodel& model);
    }
}

namespace std
{
    inline std::string to_string(const peergen::model::type_id& val)
    {
        return std::to_string(val.get_val());
    }

    template<> struct hash<peergen::model::type_id>
    {
        auto operator()(const peergen::model::type_id& item) const noexcept { return (std::size_t)item.get_val(); }
    };
}
