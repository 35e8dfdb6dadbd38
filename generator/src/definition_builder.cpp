/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <memory>
#include <utility>

#include <peergen/internal/logger.h>

#include "definition_builder.h"
#include "generator_errors.h"
#include "type_expression.h"

namespace peergen
{
    namespace definition_builder
    {
        namespace
        {
            field build_field(const model::type_arena& types, const model::property& prop)
            {
                field result;
                result.name = prop.name;
                result.type = type_expression::compile(types, prop.type);
                if (prop.optional)
                {
                    // presence is tracked separately from the value being null
                    result.type = type_expr::make_optional(std::move(result.type));
                }
                result.documentation = prop.documentation;
                result.deprecated = prop.deprecated;
                return result;
            }

            const model::structure& resolve_mixin(
                const model::metamodel& model, const model::structure& owner, model::type_id mixin)
            {
                const auto& node = model.types.get(mixin);
                if (node.kind != model::type_kind::reference)
                {
                    throw unresolved_type_reference(to_string(type_expression::compile(model.types, mixin)), owner.name);
                }
                const auto* target = model.find_structure(node.name);
                if (!target)
                {
                    throw unresolved_type_reference(node.name, owner.name);
                }
                return *target;
            }
        }

        type_expr wrap_forward(const type_expr& expr, const std::set<std::string>& names)
        {
            if (expr.kind == expr_kind::name)
            {
                if (names.count(expr.name))
                    return type_expr::make_forward(expr.name);
                return expr;
            }
            type_expr result = expr;
            for (auto& arg : result.args)
            {
                arg = wrap_forward(arg, names);
            }
            return result;
        }

        definition_ptr build_enumeration(const model::enumeration& source)
        {
            auto def = std::make_shared<definition>();
            def->kind = definition_kind::enumeration;
            def->name = source.name;
            def->documentation = source.documentation;
            def->deprecated = source.deprecated;
            def->backing = source.kind;
            def->supports_custom_values = source.supports_custom_values;
            for (const auto& entry : source.values)
            {
                def->entries.push_back(enumerator{entry.name, entry.value, entry.documentation, entry.deprecated});
            }
            return def;
        }

        definition_ptr build_structure(const model::metamodel& model, const model::structure& source)
        {
            auto def = std::make_shared<definition>();
            def->kind = definition_kind::record;
            def->name = source.name;
            def->documentation = source.documentation;
            def->deprecated = source.deprecated;

            for (auto parent : source.extends)
            {
                def->parents.push_back(type_expression::compile(model.types, parent));
            }

            for (const auto& prop : source.properties)
            {
                def->fields.push_back(build_field(model.types, prop));
            }
            // one level only, the mixin's own mixins are not copied
            for (auto mixin : source.mixins)
            {
                const auto& target = resolve_mixin(model, source, mixin);
                for (const auto& prop : target.properties)
                {
                    def->fields.push_back(build_field(model.types, prop));
                }
            }

            // a record cannot hold itself by value
            const std::set<std::string> self = {source.name};
            for (auto& item : def->fields)
            {
                item.type = wrap_forward(item.type, self);
            }

            PEERGEN_DEBUG("structure {}: {} parents, {} fields", def->name, def->parents.size(), def->fields.size());
            return def;
        }

        definition_ptr build_alias(const model::metamodel& model,
            const model::type_alias& source,
            const std::set<std::string>& recursive_aliases)
        {
            auto def = std::make_shared<definition>();
            def->kind = definition_kind::alias;
            def->name = source.name;
            def->documentation = source.documentation;
            def->deprecated = source.deprecated;
            def->bound = wrap_forward(type_expression::compile(model.types, source.type), recursive_aliases);
            def->forward_declared = recursive_aliases.count(source.name) != 0;
            return def;
        }

        definition_list build_base_aliases(const std::vector<std::string>& names)
        {
            definition_list result;
            for (const auto& name : names)
            {
                auto def = std::make_shared<definition>();
                def->kind = definition_kind::alias;
                def->name = name;
                def->bound = type_expr::make_primitive(primitive::string);
                result.push_back(def);
            }
            return result;
        }

        definition_list build_all(const model::metamodel& model, const options& opts)
        {
            definition_list result = build_base_aliases(opts.base_aliases);
            for (const auto& item : model.enumerations)
            {
                result.push_back(build_enumeration(item));
            }
            for (const auto& item : model.structures)
            {
                result.push_back(build_structure(model, item));
            }
            for (const auto& item : model.type_aliases)
            {
                result.push_back(build_alias(model, item, opts.recursive_aliases));
            }
            PEERGEN_DEBUG("built {} definitions", result.size());
            return result;
        }
    }
}
