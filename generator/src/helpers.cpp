/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <cctype>
#include <set>

#include <fmt/format.h>

#include "helpers.h"

namespace peergen
{
    std::string to_snake_case(const std::string& text)
    {
        std::string result;
        result.reserve(text.size() + 8);
        for (size_t i = 0; i < text.size(); ++i)
        {
            unsigned char c = static_cast<unsigned char>(text[i]);
            if (i > 0 && std::isupper(c) && !std::isupper(static_cast<unsigned char>(text[i - 1])))
            {
                result += '_';
            }
            result += static_cast<char>(std::tolower(c));
        }
        return result;
    }

    std::string escape_string(const std::string& text)
    {
        std::string result;
        result.reserve(text.size());
        for (char ch : text)
        {
            unsigned char c = static_cast<unsigned char>(ch);
            switch (c)
            {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            default:
                // octal escapes stop after three digits, unlike \x which would swallow a following hex digit
                if (c < 0x20 || c >= 0x7f)
                    result += fmt::format("\\{:03o}", c);
                else
                    result += ch;
            }
        }
        return result;
    }

    bool is_cpp_keyword(const std::string& name)
    {
        static const std::set<std::string> keywords = {"alignas",
            "alignof",
            "and",
            "and_eq",
            "asm",
            "auto",
            "bitand",
            "bitor",
            "bool",
            "break",
            "case",
            "catch",
            "char",
            "char8_t",
            "char16_t",
            "char32_t",
            "class",
            "compl",
            "concept",
            "const",
            "consteval",
            "constexpr",
            "constinit",
            "const_cast",
            "continue",
            "co_await",
            "co_return",
            "co_yield",
            "decltype",
            "default",
            "delete",
            "do",
            "double",
            "dynamic_cast",
            "else",
            "enum",
            "explicit",
            "export",
            "extern",
            "false",
            "float",
            "for",
            "friend",
            "goto",
            "if",
            "inline",
            "int",
            "long",
            "mutable",
            "namespace",
            "new",
            "noexcept",
            "not",
            "not_eq",
            "nullptr",
            "operator",
            "or",
            "or_eq",
            "private",
            "protected",
            "public",
            "register",
            "reinterpret_cast",
            "requires",
            "return",
            "short",
            "signed",
            "sizeof",
            "static",
            "static_assert",
            "static_cast",
            "struct",
            "switch",
            "template",
            "this",
            "thread_local",
            "throw",
            "true",
            "try",
            "typedef",
            "typeid",
            "typename",
            "union",
            "unsigned",
            "using",
            "virtual",
            "void",
            "volatile",
            "wchar_t",
            "while",
            "xor",
            "xor_eq"};
        return keywords.find(name) != keywords.end();
    }

    std::string sanitize_identifier(const std::string& name)
    {
        if (is_cpp_keyword(name))
            return name + "_";
        return name;
    }
}
