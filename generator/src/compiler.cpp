/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <sstream>

#include <gnoigen/compiler.h>
#include <gnoigen/errors.h>
#include <gnoigen/file_writer.h>
#include <gnoigen/logger.h>
#include <gnoigen/module_set.h>
#include <gnoigen/protobuf_generator.h>
#include <gnoigen/schema_tree_builder.h>
#include <gnoigen/statement.h>
#include <gnoigen/stub_generator.h>

namespace gnoigen
{
    namespace compiler
    {
        namespace
        {
            bool declares_rpcs(const statement& module_stmt)
            {
                return module_stmt.find_child("rpc") != nullptr;
            }

            std::vector<const module_node*> get_module_nodes(const std::vector<compiled_module>& compiled)
            {
                std::vector<const module_node*> ret;
                for (auto& item : compiled)
                {
                    ret.push_back(&item.module);
                }
                return ret;
            }
        }

        void validate_options(const compiler_options& options)
        {
            const std::pair<const std::filesystem::path*, const char*> dirs[] = {
                {&options.proto_outdir, "--proto-outdir"},
                {&options.server_stub_outdir, "--server-rpc-outdir"},
                {&options.client_outdir, "--client-rpc-outdir"},
            };
            for (auto& dir : dirs)
            {
                if (dir.first->empty())
                    throw configuration_error(std::string(dir.second) + " cannot be empty");
            }
            if (options.inputs.empty())
                throw configuration_error("no input modules");

            for (auto& dir : dirs)
            {
                if (!std::filesystem::exists(*dir.first))
                    std::filesystem::create_directories(*dir.first);
            }
        }

        std::optional<compiled_module> compile_module(
            const statement& module_stmt, const module_set& modules, const compiler_options& options)
        {
            if (options.rpc_only && !declares_rpcs(module_stmt))
            {
                GNOIGEN_DEBUG("skipping {}, it has no rpcs", module_stmt.get_arg());
                return std::nullopt;
            }

            GNOIGEN_INFO("processing {}", module_stmt.get_arg());

            compiled_module ret;
            ret.module = schema_tree_builder::build_module(module_stmt, modules, options.rpc_only);
            ret.proto = protobuf_generator::print_proto(ret.module);
            if (!ret.module.rpcs.empty())
            {
                std::stringstream stub_stream;
                stub_generator::write_server_stub(ret.module, stub_stream);
                ret.server_stub = stub_stream.str();
            }
            return ret;
        }

        std::vector<compiled_module> compile_modules(const module_set& modules, const compiler_options& options)
        {
            std::vector<compiled_module> ret;
            for (auto* module_stmt : modules.get_requested_modules())
            {
                auto compiled = compile_module(*module_stmt, modules, options);
                if (compiled)
                    ret.push_back(std::move(*compiled));
            }
            return ret;
        }

        write_summary write_outputs(const std::vector<compiled_module>& compiled, const compiler_options& options)
        {
            write_summary summary;
            for (auto& item : compiled)
            {
                const auto& plain_name = item.module.plain_name;
                auto proto_path = options.proto_outdir / plain_name / (plain_name + ".proto");
                bool proto_changed = file_writer::write_if_different(proto_path, item.proto);
                if (proto_changed)
                    summary.protos_written++;

                if (item.server_stub.empty())
                    continue;

                // the handler file is only regenerated together with its proto
                auto stub_path = options.server_stub_outdir / plain_name / (plain_name + ".cpp");
                if (!proto_changed && std::filesystem::exists(stub_path))
                {
                    GNOIGEN_INFO("skip unchanged module: {}", item.module.yang_name);
                    continue;
                }
                if (file_writer::write_if_different(stub_path, item.server_stub))
                    summary.server_stubs_written++;
            }

            auto modules = get_module_nodes(compiled);
            auto prefix = stub_generator::get_service_prefix(modules);

            std::stringstream register_stream;
            stub_generator::write_register(modules, prefix, register_stream);
            if (file_writer::write_if_different(
                    options.server_stub_outdir / (prefix + "_register.cpp"), register_stream.str()))
                summary.aggregates_written++;

            std::stringstream header_stream;
            stub_generator::write_support_header(header_stream);
            if (file_writer::write_if_different(options.server_stub_outdir / "gnoiyang.h", header_stream.str()))
                summary.aggregates_written++;

            std::stringstream client_stream;
            stub_generator::write_client(modules, prefix, client_stream);
            if (file_writer::write_if_different(
                    options.client_outdir / ("gnoi_" + prefix + "_client") / "main.cpp", client_stream.str()))
                summary.aggregates_written++;

            return summary;
        }

        write_summary run(const compiler_options& options)
        {
            validate_options(options);

            module_set modules(options.search_paths);
            for (auto& input : options.inputs)
            {
                modules.load_file(input);
            }

            // everything is compiled before the first file is touched
            auto compiled = compile_modules(modules, options);
            return write_outputs(compiled, options);
        }
    }
}
