/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#pragma once

#include <gnoigen/schema_tree_builder.h>

namespace gnoigen
{
    class statement;

    namespace rpc_extractor
    {
        // Records the method descriptor of an rpc in ctx.rpcs and its request and response
        // wrappers in ctx.rpc_messages. A wrapper whose input or output has no schema children
        // gets no field and the matching empty flag is set on the descriptor.
        void process_rpc(const statement& rpc, schema_tree_builder::build_context& ctx);
    }
}
