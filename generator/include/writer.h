/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#pragma once

#include <ostream>
#include <string>
#include <utility>

#include <fmt/format.h>

namespace peergen
{
    // Line oriented output with automatic indentation: a line ending in '{' indents what follows, a line starting
    // with '}' is outdented. Comment lines never change the indentation.
    class writer
    {
        std::ostream& strm_;
        int count_ = 0;

        static bool is_comment(const std::string& line)
        {
            auto pos = line.find_first_not_of(" \t");
            return pos != std::string::npos && line.compare(pos, 2, "//") == 0;
        }

    public:
        explicit writer(std::ostream& strm)
            : strm_(strm)
        {
        }

        template<typename... Args> void operator()(fmt::format_string<Args...> format, Args&&... args)
        {
            raw(fmt::format(format, std::forward<Args>(args)...));
        }

        void raw(const std::string& line)
        {
            bool comment = is_comment(line);
            if (!comment && !line.empty() && line.front() == '}' && count_ > 0)
                count_--;

            if (!line.empty())
            {
                print_tabs();
                strm_ << line;
            }
            strm_ << '\n';

            if (!comment && !line.empty() && line.back() == '{')
                count_++;
        }

        void print_tabs()
        {
            for (int i = 0; i < count_; i++)
            {
                strm_ << "    ";
            }
        }
    };
}
