/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <algorithm>

#include "default_values.h"
#include "generator_errors.h"

namespace peergen
{
    namespace default_values
    {
        namespace
        {
            payload enumeration_value(const model::enumeration_value& value)
            {
                if (auto* text = std::get_if<std::string>(&value))
                    return make_string(*text);
                return make_number(static_cast<double>(std::get<int64_t>(value)));
            }

            payload literal(const literal_value& value)
            {
                if (auto* text = std::get_if<std::string>(&value))
                    return make_string(*text);
                if (auto* number = std::get_if<int64_t>(&value))
                    return make_number(static_cast<double>(*number));
                return make_bool(std::get<bool>(value));
            }

            const type_expr& strip_optional(const type_expr& expr)
            {
                if (expr.kind == expr_kind::optional_field)
                    return expr.args.at(0);
                return expr;
            }

            class synthesizer
            {
                const definition_list& definitions_;
                options opts_;
                std::vector<std::string> expanding_;

            public:
                std::vector<std::string> missing;

                synthesizer(const definition_list& definitions, const options& opts)
                    : definitions_(definitions)
                    , opts_(opts)
                {
                }

                payload of_definition(const definition& def)
                {
                    if (std::find(expanding_.begin(), expanding_.end(), def.name) != expanding_.end())
                    {
                        missing.push_back(def.name);
                        return make_null();
                    }

                    expanding_.push_back(def.name);
                    payload value;
                    switch (def.kind)
                    {
                    case definition_kind::alias:
                        value = of_type(def.bound);
                        break;
                    case definition_kind::enumeration:
                        value = def.entries.empty() ? make_null() : enumeration_value(def.entries.front().value);
                        break;
                    case definition_kind::record:
                        value = make_null();
                        fill_record(def, *value.mutable_struct_value());
                        break;
                    }
                    expanding_.pop_back();
                    return value;
                }

                payload of_type(const type_expr& expr)
                {
                    switch (expr.kind)
                    {
                    case expr_kind::primitive:
                        switch (expr.scalar)
                        {
                        case primitive::string:
                            return make_string("");
                        case primitive::integer:
                        case primitive::uinteger:
                        case primitive::decimal:
                            return make_number(0);
                        case primitive::boolean:
                            return make_bool(false);
                        case primitive::null:
                            return make_null();
                        }
                        return make_null();
                    case expr_kind::name:
                    case expr_kind::forward:
                        return of_name(expr.name);
                    case expr_kind::sequence:
                        return make_list();
                    case expr_kind::associative:
                        return make_object();
                    case expr_kind::union_of:
                    {
                        if (expr.args.empty())
                            return make_null();
                        const auto& first = expr.args.front();
                        if ((first.kind == expr_kind::name || first.kind == expr_kind::forward)
                            && !find_definition(definitions_, first.name))
                        {
                            throw unsupported_type_default("union branch '" + first.name + "' does not resolve");
                        }
                        return of_type(first);
                    }
                    case expr_kind::product:
                    {
                        std::vector<payload> items;
                        for (const auto& arg : expr.args)
                        {
                            items.push_back(of_type(arg));
                        }
                        return make_list(items);
                    }
                    case expr_kind::literal:
                        return literal(expr.literal);
                    case expr_kind::inline_record:
                    {
                        if (!opts_.recursive)
                            throw unsupported_type_default("inline record " + to_string(expr) + " needs recursive expansion");
                        payload value = make_object();
                        auto& fields = *value.mutable_struct_value()->mutable_fields();
                        for (std::size_t i = 0; i < expr.args.size(); ++i)
                        {
                            if (opts_.only_required && expr.args[i].kind == expr_kind::optional_field)
                                continue;
                            fields[expr.labels.at(i)] = of_type(expr.args[i]);
                        }
                        return value;
                    }
                    case expr_kind::optional_field:
                        return of_type(expr.args.at(0));
                    }
                    return make_null();
                }

            private:
                payload of_name(const std::string& name)
                {
                    auto def = find_definition(definitions_, name);
                    if (!def)
                        throw unsupported_type_default("unable to get a default value for '" + name + "'");
                    if (def->kind == definition_kind::record && !opts_.recursive)
                    {
                        missing.push_back(name);
                        return make_null();
                    }
                    return of_definition(*def);
                }

                payload value_set(const field& item)
                {
                    const auto& type = strip_optional(item.type);
                    if (type.kind == expr_kind::sequence)
                    {
                        const auto& element = type.args.at(0);
                        auto def = element.kind == expr_kind::name ? find_definition(definitions_, element.name) : nullptr;
                        if (def && def->kind == definition_kind::enumeration)
                        {
                            std::vector<payload> items;
                            for (const auto& entry : def->entries)
                            {
                                items.push_back(enumeration_value(entry.value));
                            }
                            return make_list(items);
                        }
                    }
                    throw unsupported_type_default("'valueSet' only accepts a list of enumeration values");
                }

                // inherited fields first, so a redeclared field takes the most derived default
                void fill_record(const definition& def, google::protobuf::Struct& out)
                {
                    for (const auto& parent : def.parents)
                    {
                        if (parent.kind != expr_kind::name)
                            continue;
                        auto base = find_definition(definitions_, parent.name);
                        if (!base)
                            throw unsupported_type_default("parent '" + parent.name + "' of '" + def.name + "' does not resolve");
                        if (base->kind == definition_kind::record)
                            fill_record(*base, out);
                    }

                    auto& fields = *out.mutable_fields();
                    for (const auto& item : def.fields)
                    {
                        if (opts_.only_required && item.type.kind == expr_kind::optional_field)
                            continue;
                        fields[item.name] = item.name == "valueSet" ? value_set(item) : of_type(item.type);
                    }
                }
            };
        }

        result synthesize(const definition_list& definitions, const std::string& name, const options& opts)
        {
            auto def = find_definition(definitions, name);
            if (!def)
                throw unsupported_type_default("unknown definition '" + name + "'");

            synthesizer builder(definitions, opts);
            result output;
            output.value = builder.of_definition(*def);
            output.missing = std::move(builder.missing);
            return output;
        }
    }
}
