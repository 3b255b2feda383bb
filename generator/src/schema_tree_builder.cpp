/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <gnoigen/enum_compiler.h>
#include <gnoigen/helpers.h>
#include <gnoigen/logger.h>
#include <gnoigen/rpc_extractor.h>
#include <gnoigen/schema_tree_builder.h>
#include <gnoigen/statement.h>
#include <gnoigen/type_resolver.h>

namespace gnoigen
{
    namespace schema_tree_builder
    {
        namespace
        {
            // a nested message plus the field that makes it addressable from its parent
            void process_message(const statement& node, container_node& parent, build_context& ctx, bool is_list)
            {
                container_node message;
                message.name = pascal_case(node.get_arg());
                process_children(node, message, ctx);

                leaf_node field;
                field.name = sanitize_field_name(node.get_arg());
                field.type = message.name;
                field.json_name = qualified_node_name(node);
                field.repeated = is_list;

                if (is_list)
                    parent.lists.push_back(std::move(message));
                else
                    parent.containers.push_back(std::move(message));
                parent.leafs.push_back(std::move(field));
            }
        }

        void process_children(const statement& node, container_node& parent, build_context& ctx)
        {
            for (auto& child : node.get_children())
            {
                const auto& keyword = child->get_keyword();
                if (keyword == "rpc")
                    rpc_extractor::process_rpc(*child, ctx);
                else if (keyword == "notification" || keyword == "action")
                    continue;
                else if (keyword == "choice" || keyword == "case")
                    process_children(*child, parent, ctx);
                else if (keyword == "container" || keyword == "grouping")
                    process_message(*child, parent, ctx, false);
                else if (keyword == "list")
                    process_message(*child, parent, ctx, true);
                else if (keyword == "leaf" || keyword == "leaf-list")
                    process_leaf(*child, parent, ctx);
                else
                    GNOIGEN_DEBUG("ignoring {}", describe(*child));
            }
        }

        void process_leaf(const statement& node, container_node& parent, build_context& ctx)
        {
            auto resolved = type_resolver::resolve(node, ctx.modules);

            leaf_node leaf;
            leaf.name = sanitize_field_name(node.get_arg());
            leaf.json_name = qualified_node_name(node);
            leaf.repeated = node.get_keyword() == "leaf-list";
            leaf.type = type_resolver::to_proto_type(resolved.kind);

            if (resolved.kind == type_resolver::proto_kind::VALUE)
            {
                ctx.has_value_type = true;
            }
            else if (resolved.kind == type_resolver::proto_kind::ENUMERATION)
            {
                leaf.type = pascal_case(node.get_arg());
                if (!enum_compiler::compile(*resolved.type_stmt, leaf, parent.leafs))
                {
                    GNOIGEN_INFO("Due to protobuf limitation changing type to string from enum for leaf-{}", leaf.json_name);
                    leaf.type = "string";
                    leaf.enumeration.reset();
                }
            }

            parent.leafs.push_back(std::move(leaf));
        }

        module_node build_module(const statement& module_stmt, const module_set& modules, bool rpc_only)
        {
            module_node module;
            module.yang_name = module_stmt.get_arg();
            module.plain_name = plain_module_name(module.yang_name);
            module.name = pascal_case(module.plain_name);

            build_context ctx(modules, module.plain_name);
            if (rpc_only)
            {
                for (auto& child : module_stmt.get_children())
                {
                    if (child->get_keyword() == "rpc")
                        rpc_extractor::process_rpc(*child, ctx);
                }
            }
            else
            {
                process_children(module_stmt, module.top_level, ctx);
            }

            for (auto& message : ctx.rpc_messages)
            {
                module.top_level.containers.push_back(std::move(message));
            }
            module.rpcs = std::move(ctx.rpcs);
            module.has_value_type = ctx.has_value_type;
            return module;
        }
    }
}
