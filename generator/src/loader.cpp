/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <cmath>
#include <fstream>
#include <limits>

#include <google/protobuf/util/json_util.h>

#include <peergen/internal/logger.h>

#include "generator_errors.h"
#include "loader.h"
#include "metamodel.pb.h"

namespace peergen
{
    namespace loader
    {
        namespace
        {
            using google::protobuf::Struct;
            using google::protobuf::Value;

            const Value* find_field(const Struct& object, const std::string& name)
            {
                auto it = object.fields().find(name);
                if (it == object.fields().end())
                    return nullptr;
                return &it->second;
            }

            const Value& require_field(const Struct& object, const std::string& name, const std::string& kind)
            {
                auto* val = find_field(object, name);
                if (!val)
                    throw metamodel_error("type of kind '" + kind + "' has no '" + name + "'");
                return *val;
            }

            std::string string_field(const Struct& object, const std::string& name)
            {
                auto* val = find_field(object, name);
                if (!val || val->kind_case() != Value::kStringValue)
                    return {};
                return val->string_value();
            }

            bool bool_field(const Struct& object, const std::string& name)
            {
                auto* val = find_field(object, name);
                return val && val->kind_case() == Value::kBoolValue && val->bool_value();
            }

            int64_t to_integer(const Value& val, const std::string& what)
            {
                if (val.kind_case() != Value::kNumberValue || std::trunc(val.number_value()) != val.number_value())
                    throw metamodel_error(what + " is not an integer");
                // -2^63 is exact as a double, 2^63 is the first value past the top of the range
                constexpr double lowest = static_cast<double>(std::numeric_limits<int64_t>::min());
                if (val.number_value() < lowest || val.number_value() >= -lowest)
                    throw metamodel_error(what + " is out of the 64 bit integer range");
                return static_cast<int64_t>(val.number_value());
            }

            template<class Source> void copy_annotations(const Source& source, model::annotations& target)
            {
                target.documentation = source.documentation();
                target.since = source.since();
                target.proposed = source.proposed();
                target.deprecated = source.deprecated();
            }

            class type_reader
            {
                model::type_arena& types_;

            public:
                explicit type_reader(model::type_arena& types)
                    : types_(types)
                {
                }

                model::type_id read(const Value& val)
                {
                    if (val.kind_case() != Value::kStructValue)
                        throw metamodel_error("a type must be a JSON object");
                    const auto& object = val.struct_value();
                    auto kind = string_field(object, "kind");

                    if (kind == "base")
                        return types_.base(string_field(object, "name"));
                    if (kind == "reference")
                        return types_.reference(string_field(object, "name"));
                    if (kind == "array")
                        return types_.array(read(require_field(object, "element", kind)));
                    if (kind == "map")
                    {
                        auto key = read(require_field(object, "key", kind));
                        auto value = read(require_field(object, "value", kind));
                        return types_.map(key, value);
                    }
                    if (kind == "and")
                        return types_.and_of(read_list(require_field(object, "items", kind)));
                    if (kind == "or")
                        return types_.or_of(read_list(require_field(object, "items", kind)));
                    if (kind == "tuple")
                        return types_.tuple(read_list(require_field(object, "items", kind)));
                    if (kind == "literal")
                        return types_.structure(read_structure_literal(require_field(object, "value", kind)));
                    if (kind == "stringLiteral")
                    {
                        const auto& literal = require_field(object, "value", kind);
                        if (literal.kind_case() != Value::kStringValue)
                            throw metamodel_error("stringLiteral value is not a string");
                        return types_.string_literal(literal.string_value());
                    }
                    if (kind == "integerLiteral")
                        return types_.integer_literal(to_integer(require_field(object, "value", kind), "integerLiteral value"));
                    if (kind == "booleanLiteral")
                    {
                        const auto& literal = require_field(object, "value", kind);
                        if (literal.kind_case() != Value::kBoolValue)
                            throw metamodel_error("booleanLiteral value is not a boolean");
                        return types_.boolean_literal(literal.bool_value());
                    }
                    throw metamodel_error("unknown type kind '" + kind + "'");
                }

                std::vector<model::type_id> read_list(const Value& val)
                {
                    if (val.kind_case() != Value::kListValue)
                        throw metamodel_error("expected a list of types");
                    std::vector<model::type_id> result;
                    for (const auto& item : val.list_value().values())
                    {
                        result.push_back(read(item));
                    }
                    return result;
                }

                // absent, null and a list of types (read as a tuple) are all accepted for message params
                std::optional<model::type_id> read_params(bool present, const Value& val)
                {
                    if (!present || val.kind_case() == Value::kNullValue || val.kind_case() == Value::KIND_NOT_SET)
                        return std::nullopt;
                    if (val.kind_case() == Value::kListValue)
                        return types_.tuple(read_list(val));
                    return read(val);
                }

                std::optional<model::type_id> read_optional(bool present, const Value& val)
                {
                    if (!present || val.kind_case() == Value::kNullValue || val.kind_case() == Value::KIND_NOT_SET)
                        return std::nullopt;
                    return read(val);
                }

                model::property read_property(const schema::Property& source)
                {
                    model::property prop;
                    prop.name = source.name();
                    if (!source.has_type())
                        throw metamodel_error("property '" + source.name() + "' has no type");
                    prop.type = read(source.type());
                    prop.optional = source.is_optional();
                    copy_annotations(source, prop);
                    return prop;
                }

                model::structure_literal read_structure_literal(const Value& val)
                {
                    if (val.kind_case() != Value::kStructValue)
                        throw metamodel_error("structure literal value must be a JSON object");
                    const auto& object = val.struct_value();

                    model::structure_literal literal;
                    literal.documentation = string_field(object, "documentation");
                    literal.since = string_field(object, "since");
                    literal.proposed = bool_field(object, "proposed");
                    literal.deprecated = string_field(object, "deprecated");

                    auto* properties = find_field(object, "properties");
                    if (!properties)
                        return literal;
                    if (properties->kind_case() != Value::kListValue)
                        throw metamodel_error("structure literal properties must be a list");
                    for (const auto& item : properties->list_value().values())
                    {
                        if (item.kind_case() != Value::kStructValue)
                            throw metamodel_error("structure literal property must be a JSON object");
                        const auto& entry = item.struct_value();

                        model::property prop;
                        prop.name = string_field(entry, "name");
                        prop.type = read(require_field(entry, "type", "property"));
                        prop.optional = bool_field(entry, "optional");
                        prop.documentation = string_field(entry, "documentation");
                        prop.since = string_field(entry, "since");
                        prop.proposed = bool_field(entry, "proposed");
                        prop.deprecated = string_field(entry, "deprecated");
                        literal.properties.push_back(std::move(prop));
                    }
                    return literal;
                }
            };

            model::enumeration_value read_entry_value(const schema::EnumerationEntry& entry, model::enumeration_kind kind)
            {
                const auto& val = entry.value();
                if (kind == model::enumeration_kind::string)
                {
                    if (val.kind_case() != Value::kStringValue)
                        throw metamodel_error("entry '" + entry.name() + "' of a string enumeration is not a string");
                    return val.string_value();
                }
                return to_integer(val, "entry '" + entry.name() + "'");
            }

            model::metamodel convert(const schema::MetaModel& source)
            {
                model::metamodel result;
                result.meta.version = source.meta_data().version();
                type_reader reader(result.types);

                for (const auto& item : source.requests())
                {
                    model::request req;
                    req.method = item.method();
                    req.type_name = item.type_name();
                    req.params = reader.read_params(item.has_params(), item.params());
                    if (!item.has_result())
                        throw metamodel_error("request '" + item.method() + "' has no result");
                    req.result = reader.read(item.result());
                    req.partial_result = reader.read_optional(item.has_partial_result(), item.partial_result());
                    req.error_data = reader.read_optional(item.has_error_data(), item.error_data());
                    req.registration_method = item.registration_method();
                    req.registration_options = reader.read_optional(item.has_registration_options(), item.registration_options());
                    req.direction = parse_direction(item.message_direction());
                    copy_annotations(item, req);
                    result.requests.push_back(std::move(req));
                }

                for (const auto& item : source.notifications())
                {
                    model::notification note;
                    note.method = item.method();
                    note.type_name = item.type_name();
                    note.params = reader.read_params(item.has_params(), item.params());
                    note.registration_method = item.registration_method();
                    note.registration_options = reader.read_optional(item.has_registration_options(), item.registration_options());
                    note.direction = parse_direction(item.message_direction());
                    copy_annotations(item, note);
                    result.notifications.push_back(std::move(note));
                }

                for (const auto& item : source.structures())
                {
                    model::structure structure;
                    structure.name = item.name();
                    for (const auto& parent : item.extends())
                    {
                        structure.extends.push_back(reader.read(parent));
                    }
                    for (const auto& mixin : item.mixins())
                    {
                        structure.mixins.push_back(reader.read(mixin));
                    }
                    for (const auto& prop : item.properties())
                    {
                        structure.properties.push_back(reader.read_property(prop));
                    }
                    copy_annotations(item, structure);
                    result.structures.push_back(std::move(structure));
                }

                for (const auto& item : source.enumerations())
                {
                    model::enumeration enumeration;
                    enumeration.name = item.name();
                    enumeration.kind = parse_enumeration_kind(item.type().name());
                    enumeration.supports_custom_values = item.supports_custom_values();
                    for (const auto& entry : item.values())
                    {
                        model::enumeration_entry value;
                        value.name = entry.name();
                        value.value = read_entry_value(entry, enumeration.kind);
                        copy_annotations(entry, value);
                        enumeration.values.push_back(std::move(value));
                    }
                    copy_annotations(item, enumeration);
                    result.enumerations.push_back(std::move(enumeration));
                }

                for (const auto& item : source.type_aliases())
                {
                    model::type_alias alias;
                    alias.name = item.name();
                    if (!item.has_type())
                        throw metamodel_error("type alias '" + item.name() + "' has no type");
                    alias.type = reader.read(item.type());
                    copy_annotations(item, alias);
                    result.type_aliases.push_back(std::move(alias));
                }

                PEERGEN_DEBUG("loaded metamodel {}: {} requests, {} notifications, {} structures, {} enumerations, {} aliases",
                    result.meta.version,
                    result.requests.size(),
                    result.notifications.size(),
                    result.structures.size(),
                    result.enumerations.size(),
                    result.type_aliases.size());
                return result;
            }
        }

        model::message_direction parse_direction(const std::string& tag)
        {
            if (tag == "clientToServer")
                return model::message_direction::initiator_to_responder;
            if (tag == "serverToClient")
                return model::message_direction::responder_to_initiator;
            if (tag == "both")
                return model::message_direction::both;
            throw metamodel_error("unknown message direction '" + tag + "'");
        }

        model::enumeration_kind parse_enumeration_kind(const std::string& name)
        {
            if (name == "string")
                return model::enumeration_kind::string;
            if (name == "integer")
                return model::enumeration_kind::integer;
            if (name == "uinteger")
                return model::enumeration_kind::uinteger;
            throw metamodel_error("unknown enumeration backing kind '" + name + "'");
        }

        model::metamodel load_json(const std::string& json)
        {
            schema::MetaModel document;
            google::protobuf::util::JsonParseOptions options;
            options.ignore_unknown_fields = true;
            auto status = google::protobuf::util::JsonStringToMessage(json, &document, options);
            if (!status.ok())
                throw metamodel_error("unable to parse metamodel: " + status.ToString());
            return convert(document);
        }

        model::metamodel load_file(const std::filesystem::path& path)
        {
            std::ifstream file(path);
            if (!file)
                throw metamodel_error("unable to open " + path.string());
            std::string data;
            std::getline(file, data, '\0');
            return load_json(data);
        }
    }
}
