/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>

// Vocabulary used by generated protocol headers for singleton literal types and forward references.

namespace peergen
{
    template<std::size_t N> struct fixed_string
    {
        char value[N]{};

        constexpr fixed_string(const char (&text)[N]) { std::copy_n(text, N, value); }

        constexpr std::string_view view() const { return std::string_view(value, N - 1); }
    };

    // a type inhabited by exactly one string
    template<fixed_string Text> struct string_literal
    {
        static constexpr std::string_view value = Text.view();
    };

    template<std::int64_t Value> struct integer_literal
    {
        static constexpr std::int64_t value = Value;
    };

    template<bool Value> struct boolean_literal
    {
        static constexpr bool value = Value;
    };

    // names a type that may not be complete yet, used to break self and mutual recursion
    template<typename T> using forward = std::shared_ptr<T>;
}
