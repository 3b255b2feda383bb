/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#pragma once

#include <ostream>
#include <string>

#include <gnoigen/schema_tree.h>

namespace gnoigen
{
    namespace protobuf_generator
    {
        // entry point - writes the proto3 schema of one compiled module
        void write_proto(const module_node& module, std::ostream& stream);

        // same as write_proto, returning the text
        std::string print_proto(const module_node& module);
    }
}
