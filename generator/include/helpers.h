/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#pragma once

#include <string>

namespace peergen
{
    // "TextDocumentHover" -> "text_document_hover": a separator goes in front of every uppercase letter that
    // follows a non-uppercase character, then everything is lowercased
    std::string to_snake_case(const std::string& text);

    // contents of a C++ string literal holding exactly the bytes of text, without the surrounding quotes
    std::string escape_string(const std::string& text);

    bool is_cpp_keyword(const std::string& name);

    // appends an underscore to names that would collide with a C++ keyword
    std::string sanitize_identifier(const std::string& name);
}
