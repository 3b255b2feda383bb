/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#pragma once

#include <string>

namespace gnoigen
{
    class statement;
    class module_set;

    namespace type_resolver
    {
        enum class proto_kind
        {
            INT32,
            INT64,
            UINT32,
            UINT64,
            SINT64,
            BOOL,
            BYTES,
            STRING,
            VALUE,      // google.protobuf.Value, the placeholder for unions
            ENUMERATION // needs enum_compiler
        };

        struct resolved_type
        {
            proto_kind kind = proto_kind::STRING;
            // the base type statement the chain ended in, the enumeration for ENUMERATION
            const statement* type_stmt = nullptr;
        };

        bool is_base_type(const std::string& type_name);

        // maps a YANG base type name, throws resolution_error for anything else
        proto_kind map_base_type(const std::string& type_name);

        // proto spelling of a kind, "enum" for ENUMERATION
        std::string to_proto_type(proto_kind kind);

        // Resolves the type of a leaf or leaf-list, chasing typedefs and leafrefs.
        // Throws resolution_error naming the node when any step of the chain cannot be resolved.
        resolved_type resolve(const statement& node, const module_set& modules);
    }
}
