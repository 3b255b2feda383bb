/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#pragma once

#include <string>
#include <utility>
#include <vector>

#include <gnoigen/schema_tree.h>

namespace gnoigen
{
    class statement;
    class module_set;

    namespace schema_tree_builder
    {
        // Module level facts collected while lowering, merged into the module_node at the end
        struct build_context
        {
            const module_set& modules;
            std::string module_name; // plain module name

            bool has_value_type = false;
            std::vector<rpc_node> rpcs;
            // request and response wrappers, they live at the top level of the module
            std::vector<container_node> rpc_messages;

            build_context(const module_set& mods, std::string name)
                : modules(mods)
                , module_name(std::move(name))
            {
            }
        };

        // lowers the schema children of node into parent
        void process_children(const statement& node, container_node& parent, build_context& ctx);

        // resolves a leaf or leaf-list and appends it to parent
        void process_leaf(const statement& node, container_node& parent, build_context& ctx);

        // Builds the tree of one module. With rpc_only only the rpcs of the module are lowered.
        module_node build_module(const statement& module_stmt, const module_set& modules, bool rpc_only);
    }
}
