/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "metamodel.h"

namespace peergen
{
    namespace model
    {
        type_id type_arena::add(type_node node)
        {
            type_id id{nodes_.size()};
            nodes_.push_back(std::move(node));
            return id;
        }

        const type_node& type_arena::get(type_id id) const
        {
            if (id.get_val() >= nodes_.size())
            {
                throw std::out_of_range("type id " + std::to_string(id) + " is not part of this arena");
            }
            return nodes_[id.get_val()];
        }

        type_id type_arena::base(const std::string& name)
        {
            type_node node;
            node.kind = type_kind::base;
            node.name = name;
            return add(std::move(node));
        }

        type_id type_arena::reference(const std::string& name)
        {
            type_node node;
            node.kind = type_kind::reference;
            node.name = name;
            return add(std::move(node));
        }

        type_id type_arena::array(type_id element)
        {
            type_node node;
            node.kind = type_kind::array;
            node.element = element;
            return add(std::move(node));
        }

        type_id type_arena::map(type_id key, type_id value)
        {
            type_node node;
            node.kind = type_kind::map;
            node.key = key;
            node.value = value;
            return add(std::move(node));
        }

        type_id type_arena::and_of(std::vector<type_id> items)
        {
            type_node node;
            node.kind = type_kind::and_type;
            node.items = std::move(items);
            return add(std::move(node));
        }

        type_id type_arena::or_of(std::vector<type_id> items)
        {
            type_node node;
            node.kind = type_kind::or_type;
            node.items = std::move(items);
            return add(std::move(node));
        }

        type_id type_arena::tuple(std::vector<type_id> items)
        {
            type_node node;
            node.kind = type_kind::tuple;
            node.items = std::move(items);
            return add(std::move(node));
        }

        type_id type_arena::structure(structure_literal literal)
        {
            type_node node;
            node.kind = type_kind::structure_literal;
            node.literal = std::move(literal);
            return add(std::move(node));
        }

        type_id type_arena::string_literal(const std::string& value)
        {
            type_node node;
            node.kind = type_kind::string_literal;
            node.string_value = value;
            return add(std::move(node));
        }

        type_id type_arena::integer_literal(int64_t value)
        {
            type_node node;
            node.kind = type_kind::integer_literal;
            node.integer_value = value;
            return add(std::move(node));
        }

        type_id type_arena::boolean_literal(bool value)
        {
            type_node node;
            node.kind = type_kind::boolean_literal;
            node.boolean_value = value;
            return add(std::move(node));
        }

        const structure* metamodel::find_structure(const std::string& name) const
        {
            auto it = std::find_if(
                structures.begin(), structures.end(), [&](const structure& item) { return item.name == name; });
            if (it == structures.end())
                return nullptr;
            return &*it;
        }

        namespace
        {
            template<typename T> void drop_proposed(std::vector<T>& items)
            {
                items.erase(std::remove_if(items.begin(), items.end(), [](const T& item) { return item.proposed; }),
                    items.end());
            }
        }

        metamodel without_proposed(const metamodel& model)
        {
            metamodel result = model;
            drop_proposed(result.requests);
            drop_proposed(result.notifications);
            drop_proposed(result.structures);
            drop_proposed(result.enumerations);
            drop_proposed(result.type_aliases);
            for (auto& item : result.structures)
            {
                drop_proposed(item.properties);
            }
            for (auto& item : result.enumerations)
            {
                drop_proposed(item.values);
            }
            return result;
        }
    }
}
