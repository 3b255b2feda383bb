/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <fmt/format.h>

#include <gnoigen/helpers.h>
#include <gnoigen/logger.h>
#include <gnoigen/rpc_extractor.h>
#include <gnoigen/statement.h>

namespace gnoigen
{
    namespace rpc_extractor
    {
        namespace
        {
            // Helper function to build one wrapper message, returns true if it carries no field
            bool build_wrapper(const statement* io,
                const std::string& field_name,
                container_node& wrapper,
                schema_tree_builder::build_context& ctx)
            {
                if (!io || io->get_children().empty())
                    return true;

                container_node inner;
                inner.name = pascal_case(field_name);
                schema_tree_builder::process_children(*io, inner, ctx);

                leaf_node field;
                field.name = field_name;
                field.type = inner.name;
                field.json_name
                    = fmt::format("{}:{}", io->get_module() ? io->get_module()->name : ctx.module_name, field_name);

                wrapper.containers.push_back(std::move(inner));
                wrapper.leafs.push_back(std::move(field));
                return false;
            }
        }

        void process_rpc(const statement& rpc, schema_tree_builder::build_context& ctx)
        {
            GNOIGEN_DEBUG("extracting rpc {}", describe(rpc));

            rpc_node node;
            node.name = pascal_case(ctx.module_name + "_" + rpc.get_arg());
            node.short_name = pascal_case(rpc.get_arg());
            node.module_name = pascal_case(ctx.module_name);
            node.url = schema_path(rpc);

            container_node request;
            request.name = pascal_case(rpc.get_arg() + "_request");
            node.input = request.name;
            node.input_empty = build_wrapper(rpc.find_child("input"), "input", request, ctx);

            container_node response;
            response.name = pascal_case(rpc.get_arg() + "_response");
            node.output = response.name;
            node.output_empty = build_wrapper(rpc.find_child("output"), "output", response, ctx);

            ctx.rpc_messages.push_back(std::move(request));
            ctx.rpc_messages.push_back(std::move(response));
            ctx.rpcs.push_back(std::move(node));
        }
    }
}
