/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#pragma once

#include <ostream>
#include <string>
#include <utility>

#include <fmt/format.h>

namespace gnoigen
{
    // Line based text writer shared by the generators.
    // A line ending in '{' indents the lines that follow it, a line starting with '}' is
    // outdented together with everything after it. Format strings are fmt format strings so
    // literal braces are written as "{{" and "}}".
    class writer
    {
        std::ostream& strm_;
        int count_ = 0;
        std::string tab_;

    public:
        explicit writer(std::ostream& strm, int count = 0, std::string tab = "    ");

        template<typename... Args> void operator()(const std::string& format_str, Args&&... args)
        {
            write_line(fmt::format(fmt::runtime(format_str), std::forward<Args>(args)...));
        }

        void print_tabs();

        int get_count() const { return count_; }

    private:
        void write_line(const std::string& line);
    };
}
