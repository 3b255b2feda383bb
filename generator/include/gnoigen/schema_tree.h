/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace gnoigen
{
    struct enum_member
    {
        std::string name;
        int tag = 0;
    };

    struct enum_def
    {
        std::vector<enum_member> members;
        std::set<std::string> names;
    };

    struct leaf_node
    {
        std::string name;      // proto field identifier
        std::string type;      // proto scalar, or a message or enum name from the same tree
        std::string json_name; // qualified schema path segment
        bool repeated = false;
        std::optional<enum_def> enumeration;

        // member names of an enumeration this leaf declared, kept after a downgrade to string
        // so that later siblings still see the collision
        std::set<std::string> declared_enum_names;
    };

    // A container or a list; a list is referenced from its parent through a repeated field
    struct container_node
    {
        std::string name;
        std::vector<container_node> containers;
        std::vector<container_node> lists;
        std::vector<leaf_node> leafs;
    };

    using list_node = container_node;

    // method descriptor of one rpc
    struct rpc_node
    {
        std::string name;        // PascalCase of module and rpc name, unique across modules
        std::string short_name;  // PascalCase of the rpc name, the service method
        std::string module_name; // PascalCase module name
        std::string url;         // schema path used as the wire route
        std::string input;       // request message
        std::string output;      // response message
        bool input_empty = false;
        bool output_empty = false;
    };

    struct module_node
    {
        std::string name;       // PascalCase, used for the package and service
        std::string plain_name; // hyphens replaced by underscores, used for file names
        std::string yang_name;

        // top level containers, lists and leafs of the module
        container_node top_level;
        std::vector<rpc_node> rpcs;

        // a union was mapped to google.protobuf.Value
        bool has_value_type = false;
    };
}
