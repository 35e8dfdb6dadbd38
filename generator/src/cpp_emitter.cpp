/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <cctype>
#include <sstream>
#include <vector>

#include <fmt/format.h>

#include <peergen/internal/logger.h>

#include "cpp_emitter.h"
#include "helpers.h"
#include "writer.h"

namespace peergen
{
    namespace cpp_emitter
    {
        namespace
        {
            // a trailing backslash, even one followed by blanks, would splice the next emitted line into the comment
            std::string comment_text(std::string line)
            {
                while (!line.empty() && (line.back() == '\\' || std::isspace(static_cast<unsigned char>(line.back()))))
                    line.pop_back();
                return line;
            }

            void write_documentation(writer& cpp, const std::string& documentation)
            {
                if (documentation.empty())
                    return;
                std::stringstream lines(documentation);
                std::string line;
                while (std::getline(lines, line))
                {
                    line = comment_text(line);
                    if (line.empty())
                        cpp("//");
                    else
                        cpp("// {}", line);
                }
            }

            std::string deprecated_attribute(const std::string& message)
            {
                if (message.empty())
                    return {};
                return fmt::format("[[deprecated(\"{}\")]] ", escape_string(message));
            }

            std::string enumerator_declaration(const enumerator& entry)
            {
                auto name = sanitize_identifier(entry.name);
                if (entry.deprecated.empty())
                    return name;
                return fmt::format("{} [[deprecated(\"{}\")]]", name, escape_string(entry.deprecated));
            }

            void write_banner(writer& cpp, const generation_result& result)
            {
                cpp("#pragma once");
                cpp("");
                cpp("// Generated by peergen from protocol version {}, do not edit.", comment_text(result.types.version));
                cpp("");
            }

            std::string underlying_type(model::enumeration_kind kind)
            {
                return kind == model::enumeration_kind::uinteger ? "std::uint32_t" : "std::int32_t";
            }

            void write_alias(writer& cpp, const definition& def)
            {
                write_documentation(cpp, def.documentation);
                auto bound = to_string(def.bound);
                if (!def.forward_declared)
                {
                    cpp("using {} {}= {};", def.name, deprecated_attribute(def.deprecated), bound);
                    return;
                }
                // recursive aliases are distinct types so that they can be declared ahead of their use
                cpp("struct {}{} : {}", deprecated_attribute(def.deprecated), def.name, bound);
                cpp("{{");
                cpp("using base_type = {};", bound);
                cpp("using base_type::base_type;");
                cpp("}};");
            }

            void write_enumeration(writer& cpp, const definition& def)
            {
                write_documentation(cpp, def.documentation);
                if (def.supports_custom_values)
                    cpp("// the protocol allows values beyond the ones listed here");

                if (def.backing != model::enumeration_kind::string)
                {
                    cpp("enum class {}{} : {}", deprecated_attribute(def.deprecated), def.name, underlying_type(def.backing));
                    cpp("{{");
                    for (const auto& entry : def.entries)
                    {
                        write_documentation(cpp, entry.documentation);
                        cpp("{} = {},", enumerator_declaration(entry), std::get<int64_t>(entry.value));
                    }
                    cpp("}};");
                    return;
                }

                cpp("enum class {}{}", deprecated_attribute(def.deprecated), def.name);
                cpp("{{");
                for (const auto& entry : def.entries)
                {
                    write_documentation(cpp, entry.documentation);
                    cpp("{},", enumerator_declaration(entry));
                }
                cpp("}};");
                cpp("");

                // the wire text of each entry, byte for byte
                cpp("inline std::string_view to_wire({} value)", def.name);
                cpp("{{");
                cpp("switch (value)");
                cpp("{{");
                for (const auto& entry : def.entries)
                {
                    cpp("case {}::{}:", def.name, sanitize_identifier(entry.name));
                    cpp("    return \"{}\";", escape_string(std::get<std::string>(entry.value)));
                }
                cpp("}}");
                cpp("return {{}};");
                cpp("}}");
                cpp("");

                cpp("inline bool from_wire(std::string_view text, {}& value)", def.name);
                cpp("{{");
                for (const auto& entry : def.entries)
                {
                    cpp("if (text == \"{}\")", escape_string(std::get<std::string>(entry.value)));
                    cpp("{{");
                    cpp("value = {}::{};", def.name, sanitize_identifier(entry.name));
                    cpp("return true;");
                    cpp("}}");
                }
                cpp("return false;");
                cpp("}}");
            }

            void write_record(writer& cpp, const definition& def)
            {
                write_documentation(cpp, def.documentation);
                std::string parents;
                for (const auto& parent : def.parents)
                {
                    parents += parents.empty() ? " : public " : ", public ";
                    parents += to_string(parent);
                }
                cpp("struct {}{}{}", deprecated_attribute(def.deprecated), def.name, parents);
                cpp("{{");
                for (const auto& item : def.fields)
                {
                    write_documentation(cpp, item.documentation);
                    cpp("{}{} {};", deprecated_attribute(item.deprecated), to_string(item.type), sanitize_identifier(item.name));
                }
                cpp("}};");
            }

            std::string arguments_of(const message_compiler::method_def& method)
            {
                std::string result;
                for (const auto& arg : method.arguments)
                {
                    if (!result.empty())
                        result += ", ";
                    result += fmt::format("{} {}", parameter_type(arg.type), arg.name);
                }
                return result;
            }

            const message_compiler::argument* find_argument(const message_compiler::method_def& method, const std::string& name)
            {
                for (const auto& arg : method.arguments)
                {
                    if (arg.name == name)
                        return &arg;
                }
                return nullptr;
            }

            bool is_handler(message_compiler::method_kind kind)
            {
                return kind == message_compiler::method_kind::result_handler
                       || kind == message_compiler::method_kind::request_handler
                       || kind == message_compiler::method_kind::notification_handler;
            }

            void write_sender(writer& cpp, const message_compiler::method_def& method)
            {
                write_documentation(cpp, method.documentation);
                const char* primitive = method.kind == message_compiler::method_kind::request_sender ? "request" : "notify";
                cpp("{}void {}({})", deprecated_attribute(method.deprecated), sanitize_identifier(method.name), arguments_of(method));
                cpp("{{");
                if (find_argument(method, "params"))
                    cpp("this->{}(\"{}\", this->encode(params));", primitive, escape_string(method.wire_method));
                else
                    cpp("this->{}(\"{}\", peergen::make_null());", primitive, escape_string(method.wire_method));
                cpp("}}");
            }

            void write_stub(writer& cpp, const message_compiler::method_def& method)
            {
                write_documentation(cpp, method.documentation);
                auto returns = method.returns ? to_string(*method.returns) : std::string("void");
                cpp("{}virtual {} {}({}) = 0;", deprecated_attribute(method.deprecated), returns, method.name, arguments_of(method));
            }

            // member that decodes a payload, calls the stub and encodes what it returns
            void write_thunk(writer& cpp, const message_compiler::method_def& method)
            {
                const auto* value = find_argument(method, "params");
                if (!value)
                    value = find_argument(method, "result");
                auto input_name = method.kind == message_compiler::method_kind::result_handler ? "result" : "params";

                cpp("peergen::payload dispatch_{}(const peergen::context& context, const peergen::payload&{})",
                    method.name,
                    value ? std::string(" ") + input_name : std::string());
                cpp("{{");
                std::string call = value ? fmt::format("{}(context, this->template decode<{}>({}))",
                                               method.name,
                                               to_string(value->type),
                                               input_name)
                                         : fmt::format("{}(context)", method.name);
                if (method.returns)
                {
                    cpp("return this->encode({});", call);
                }
                else
                {
                    cpp("{};", call);
                    cpp("return peergen::make_null();");
                }
                cpp("}}");
            }

            void write_entry_point(writer& cpp,
                const char* entry_name,
                const char* input_name,
                bool returns,
                const dispatch_table& table,
                const std::string& class_name)
            {
                cpp("{} {}(const std::string& method, const peergen::payload& {})",
                    returns ? "peergen::payload" : "void",
                    entry_name,
                    input_name);
                cpp("{{");
                if (table.empty())
                {
                    cpp("static const std::map<std::string, thunk> table;");
                }
                else
                {
                    cpp("static const std::map<std::string, thunk> table = {{");
                    for (const auto& entry : table.get_entries())
                    {
                        cpp("{{\"{}\", &{}::dispatch_{}}},", escape_string(entry.method), class_name, entry.handler);
                    }
                    cpp("}};");
                }
                cpp("auto it = table.find(method);");
                cpp("if (it == table.end())");
                cpp("    throw peergen::lookup_failure(method);");
                cpp("{}(this->*(it->second))(peergen::context{{peergen::role::{}, method}}, {});",
                    returns ? "return " : "",
                    class_name,
                    input_name);
                cpp("}}");
            }
        }

        std::string parameter_type(const type_expr& type)
        {
            if (type.kind == expr_kind::primitive && type.scalar != primitive::string)
                return to_string(type);
            if (type.kind == expr_kind::literal)
                return to_string(type);
            return fmt::format("const {}&", to_string(type));
        }

        void write_types(const generation_result& result, const generator_options& options, std::ostream& stream)
        {
            writer cpp(stream);
            write_banner(cpp, result);

            cpp("#include <cstddef>");
            cpp("#include <cstdint>");
            cpp("#include <map>");
            cpp("#include <optional>");
            cpp("#include <string>");
            cpp("#include <string_view>");
            cpp("#include <tuple>");
            cpp("#include <variant>");
            cpp("#include <vector>");
            cpp("");
            cpp("#include <peergen/literal.h>");
            cpp("");
            cpp("namespace {}::types", options.output_namespace);
            cpp("{{");

            bool any_forward = false;
            for (const auto& def : result.types.definitions)
            {
                if (def->kind != definition_kind::enumeration && def->forward_declared)
                {
                    cpp("struct {};", def->name);
                    any_forward = true;
                }
            }
            for (const auto& ref : result.types.forward_references)
            {
                cpp("// {} refers to {} before it is complete", ref.from, ref.to);
                any_forward = true;
            }

            for (const auto& def : result.types.definitions)
            {
                if (any_forward || def != result.types.definitions.front())
                    cpp("");
                switch (def->kind)
                {
                case definition_kind::alias:
                    write_alias(cpp, *def);
                    break;
                case definition_kind::enumeration:
                    write_enumeration(cpp, *def);
                    break;
                case definition_kind::record:
                    write_record(cpp, *def);
                    break;
                }
            }
            cpp("}}");
            PEERGEN_DEBUG("types header: {} definitions", result.types.definitions.size());
        }

        void write_peer(const generation_result& result,
            const message_compiler::peer_artifact& artifact,
            const generator_options& options,
            std::ostream& stream)
        {
            std::string class_name = to_string(artifact.peer_role);
            writer cpp(stream);
            write_banner(cpp, result);

            cpp("#include <map>");
            cpp("#include <string>");
            cpp("");
            cpp("#include <peergen/peergen.h>");
            cpp("");
            cpp("#include \"{}\"", options.types_file);
            cpp("");
            cpp("namespace {}", options.output_namespace);
            cpp("{{");
            for (const auto& name : artifact.imports)
            {
                cpp("using types::{};", name);
            }
            if (!artifact.imports.empty())
                cpp("");

            cpp("// Transport supplies request(method, payload), notify(method, payload), encode(value) and decode<T>(payload)");
            cpp("template<class Transport> class {} : public Transport", class_name);
            cpp("{{");
            cpp("using thunk = peergen::payload ({}::*)(const peergen::context&, const peergen::payload&);", class_name);
            cpp("");
            cpp("public:");
            cpp("using Transport::Transport;");
            cpp("virtual ~{}() = default;", class_name);

            for (const auto& method : artifact.methods)
            {
                cpp("");
                if (is_handler(method.kind))
                    write_stub(cpp, method);
                else
                    write_sender(cpp, method);
            }

            cpp("");
            write_entry_point(cpp, "handle", "params", true, artifact.table, class_name);
            cpp("");
            write_entry_point(cpp, "handle_result", "result", false, artifact.result_table, class_name);

            bool first = true;
            for (const auto& method : artifact.methods)
            {
                if (!is_handler(method.kind))
                    continue;
                cpp("");
                if (first)
                {
                    cpp("private:");
                    first = false;
                }
                write_thunk(cpp, method);
            }
            cpp("}};");
            cpp("}}");
            PEERGEN_DEBUG("{} header: {} methods, {} imports", class_name, artifact.methods.size(), artifact.imports.size());
        }
    }
}
