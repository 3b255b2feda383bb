/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <gnoigen/schema_tree.h>

namespace gnoigen
{
    class statement;
    class module_set;

    struct compiler_options
    {
        std::filesystem::path proto_outdir;
        std::filesystem::path server_stub_outdir;
        std::filesystem::path client_outdir;
        std::vector<std::filesystem::path> search_paths;
        std::vector<std::filesystem::path> inputs;
        // only modules declaring rpcs are compiled, and only their rpcs
        bool rpc_only = false;
    };

    // a module lowered and rendered, nothing written yet
    struct compiled_module
    {
        module_node module;
        std::string proto;
        std::string server_stub; // empty when the module has no rpcs
    };

    // number of files actually rewritten by a run
    struct write_summary
    {
        int protos_written = 0;
        int server_stubs_written = 0;
        int aggregates_written = 0;
    };

    namespace compiler
    {
        // throws configuration_error when an output directory is not set, creates the missing ones
        void validate_options(const compiler_options& options);

        // std::nullopt when the module is skipped
        std::optional<compiled_module> compile_module(
            const statement& module_stmt, const module_set& modules, const compiler_options& options);

        std::vector<compiled_module> compile_modules(const module_set& modules, const compiler_options& options);

        write_summary write_outputs(const std::vector<compiled_module>& compiled, const compiler_options& options);

        // Validates the options, loads and compiles every input, then writes. Parse and
        // resolution errors are raised before the first file is written.
        write_summary run(const compiler_options& options);
    }
}
