/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <algorithm>
#include <utility>

#include <fmt/format.h>

#include "helpers.h"
#include "type_expression.h"

namespace peergen
{
    type_expr type_expr::make_primitive(primitive scalar)
    {
        type_expr expr;
        expr.kind = expr_kind::primitive;
        expr.scalar = scalar;
        return expr;
    }

    type_expr type_expr::make_name(const std::string& name)
    {
        type_expr expr;
        expr.kind = expr_kind::name;
        expr.name = name;
        return expr;
    }

    type_expr type_expr::make_sequence(type_expr element)
    {
        type_expr expr;
        expr.kind = expr_kind::sequence;
        expr.args.push_back(std::move(element));
        return expr;
    }

    type_expr type_expr::make_associative(type_expr key, type_expr value)
    {
        type_expr expr;
        expr.kind = expr_kind::associative;
        expr.args.push_back(std::move(key));
        expr.args.push_back(std::move(value));
        return expr;
    }

    type_expr type_expr::make_union(std::vector<type_expr> alternatives)
    {
        type_expr expr;
        expr.kind = expr_kind::union_of;
        expr.args = std::move(alternatives);
        return expr;
    }

    type_expr type_expr::make_product(std::vector<type_expr> elements)
    {
        type_expr expr;
        expr.kind = expr_kind::product;
        expr.args = std::move(elements);
        return expr;
    }

    type_expr type_expr::make_literal(literal_value value)
    {
        type_expr expr;
        expr.kind = expr_kind::literal;
        expr.literal = std::move(value);
        return expr;
    }

    type_expr type_expr::make_inline_record(std::vector<std::string> labels, std::vector<type_expr> fields)
    {
        type_expr expr;
        expr.kind = expr_kind::inline_record;
        expr.labels = std::move(labels);
        expr.args = std::move(fields);
        return expr;
    }

    type_expr type_expr::make_optional(type_expr inner)
    {
        type_expr expr;
        expr.kind = expr_kind::optional_field;
        expr.args.push_back(std::move(inner));
        return expr;
    }

    type_expr type_expr::make_forward(const std::string& name)
    {
        type_expr expr;
        expr.kind = expr_kind::forward;
        expr.name = name;
        return expr;
    }

    std::string to_string(primitive scalar)
    {
        switch (scalar)
        {
        case primitive::string:
            return "std::string";
        case primitive::integer:
            return "std::int32_t";
        case primitive::uinteger:
            return "std::uint32_t";
        case primitive::decimal:
            return "double";
        case primitive::boolean:
            return "bool";
        case primitive::null:
            return "std::nullptr_t";
        }
        return "std::nullptr_t";
    }

    namespace
    {
        std::string join(const std::vector<type_expr>& items)
        {
            std::string result;
            for (const auto& item : items)
            {
                if (!result.empty())
                    result += ", ";
                result += to_string(item);
            }
            return result;
        }

        std::string literal_to_string(const literal_value& value)
        {
            if (auto* text = std::get_if<std::string>(&value))
                return fmt::format("peergen::string_literal<\"{}\">", escape_string(*text));
            if (auto* number = std::get_if<int64_t>(&value))
                return fmt::format("peergen::integer_literal<{}>", *number);
            return fmt::format("peergen::boolean_literal<{}>", std::get<bool>(value) ? "true" : "false");
        }
    }

    std::string to_string(const type_expr& expr)
    {
        switch (expr.kind)
        {
        case expr_kind::primitive:
            return to_string(expr.scalar);
        case expr_kind::name:
            return expr.name;
        case expr_kind::sequence:
            return fmt::format("std::vector<{}>", to_string(expr.args.at(0)));
        case expr_kind::associative:
            return fmt::format("std::map<{}, {}>", to_string(expr.args.at(0)), to_string(expr.args.at(1)));
        case expr_kind::union_of:
            return fmt::format("std::variant<{}>", join(expr.args));
        case expr_kind::product:
            return fmt::format("std::tuple<{}>", join(expr.args));
        case expr_kind::literal:
            return literal_to_string(expr.literal);
        case expr_kind::inline_record:
        {
            std::string text;
            for (size_t i = 0; i < expr.args.size(); ++i)
            {
                if (!text.empty())
                    text += " ";
                text += fmt::format("{} {};", to_string(expr.args[i]), expr.labels.at(i));
            }
            return literal_to_string(text);
        }
        case expr_kind::optional_field:
            return fmt::format("std::optional<{}>", to_string(expr.args.at(0)));
        case expr_kind::forward:
            return fmt::format("peergen::forward<{}>", expr.name);
        }
        return expr.name;
    }

    void collect_identifiers(const type_expr& expr, std::vector<std::string>& out, bool include_forward)
    {
        switch (expr.kind)
        {
        case expr_kind::name:
            out.push_back(expr.name);
            return;
        case expr_kind::forward:
            if (include_forward)
                out.push_back(expr.name);
            return;
        case expr_kind::primitive:
        case expr_kind::literal:
        case expr_kind::inline_record: // rendered as literal text, names inside it are not type uses
            return;
        default:
            for (const auto& arg : expr.args)
            {
                collect_identifiers(arg, out, include_forward);
            }
        }
    }

    std::vector<std::string> identifiers(const type_expr& expr)
    {
        std::vector<std::string> all;
        collect_identifiers(expr, all, true);

        std::vector<std::string> result;
        for (auto& name : all)
        {
            if (std::find(result.begin(), result.end(), name) == result.end())
                result.push_back(std::move(name));
        }
        return result;
    }

    namespace type_expression
    {
        namespace
        {
            type_expr compile_base(const std::string& name)
            {
                if (name == "string")
                    return type_expr::make_primitive(primitive::string);
                if (name == "integer")
                    return type_expr::make_primitive(primitive::integer);
                if (name == "uinteger")
                    return type_expr::make_primitive(primitive::uinteger);
                if (name == "decimal")
                    return type_expr::make_primitive(primitive::decimal);
                if (name == "boolean")
                    return type_expr::make_primitive(primitive::boolean);
                if (name == "null")
                    return type_expr::make_primitive(primitive::null);
                // URI, DocumentUri, RegExp and anything else unknown stay opaque names
                return type_expr::make_name(name);
            }

            std::vector<type_expr> compile_items(const model::type_arena& types, const std::vector<model::type_id>& items)
            {
                std::vector<type_expr> result;
                result.reserve(items.size());
                for (auto item : items)
                {
                    result.push_back(compile(types, item));
                }
                return result;
            }
        }

        type_expr compile(const model::type_arena& types, model::type_id id)
        {
            const auto& node = types.get(id);
            switch (node.kind)
            {
            case model::type_kind::base:
                return compile_base(node.name);
            case model::type_kind::reference:
                return type_expr::make_name(node.name);
            case model::type_kind::array:
                return type_expr::make_sequence(compile(types, node.element));
            case model::type_kind::map:
                return type_expr::make_associative(compile(types, node.key), compile(types, node.value));
            case model::type_kind::and_type:
                // there is no structural intersection in the target, "and" is rendered like "or"
            case model::type_kind::or_type:
                return type_expr::make_union(compile_items(types, node.items));
            case model::type_kind::tuple:
                return type_expr::make_product(compile_items(types, node.items));
            case model::type_kind::structure_literal:
            {
                std::vector<std::string> labels;
                std::vector<type_expr> fields;
                for (const auto& prop : node.literal.properties)
                {
                    labels.push_back(prop.name);
                    auto field = compile(types, prop.type);
                    fields.push_back(prop.optional ? type_expr::make_optional(std::move(field)) : std::move(field));
                }
                return type_expr::make_inline_record(std::move(labels), std::move(fields));
            }
            case model::type_kind::string_literal:
                return type_expr::make_literal(node.string_value);
            case model::type_kind::integer_literal:
                return type_expr::make_literal(node.integer_value);
            case model::type_kind::boolean_literal:
                return type_expr::make_literal(node.boolean_value);
            }
            return type_expr::make_name(node.name);
        }
    }
}
