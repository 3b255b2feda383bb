/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#pragma once

#include <memory>
#include <string>

#include <gnoigen/statement.h>

namespace gnoigen
{
    namespace yang_parser
    {
        // parses the text of one YANG file and returns its top level statement.
        // Only the generic statement grammar is checked, throws parse_error on malformed text.
        std::shared_ptr<statement> parse(const std::string& text, const std::string& source_name);
    }
}
