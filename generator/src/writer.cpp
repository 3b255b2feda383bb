/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <gnoigen/writer.h>

namespace gnoigen
{
    writer::writer(std::ostream& strm, int count, std::string tab)
        : strm_(strm)
        , count_(count)
        , tab_(std::move(tab))
    {
    }

    void writer::print_tabs()
    {
        for (int i = 0; i < count_; i++)
            strm_ << tab_;
    }

    void writer::write_line(const std::string& line)
    {
        if (line.empty())
        {
            strm_ << '\n';
            return;
        }

        if (line.front() == '}' && count_ > 0)
            count_--;

        print_tabs();
        strm_ << line << '\n';

        if (line.back() == '{')
            count_++;
    }
}
