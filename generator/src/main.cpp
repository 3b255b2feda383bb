/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <iostream>
#include <string>
#include <vector>

#include <args.hxx>

#include <gnoigen/compiler.h>
#include <gnoigen/errors.h>
#include <gnoigen/logger.h>

int main(const int argc, char* argv[])
{
    gnoigen::compiler_options options;
    bool verbose = false;

    {
        args::ArgumentParser args_parser("Generate gNOI protobuf schemas and gRPC stubs from YANG modules");
        args::HelpFlag h(args_parser, "help", "help", {"help"});

        args::ValueFlag<std::string> proto_outdir_arg(
            args_parser, "dir", "output directory for the generated .proto files", {"proto-outdir"});
        args::ValueFlag<std::string> server_outdir_arg(
            args_parser, "dir", "output directory for the generated gRPC server handlers", {"server-rpc-outdir"});
        args::ValueFlag<std::string> client_outdir_arg(
            args_parser, "dir", "output directory for the generated gRPC client", {"client-rpc-outdir"});
        args::ValueFlagList<std::string> search_paths_arg(
            args_parser, "path", "directories searched for imported modules", {'p', "path"});
        args::Flag rpc_only_arg(
            args_parser, "rpc-only", "only compile modules that declare rpcs, and only their rpcs", {"rpc-only"});
        args::Flag verbose_arg(args_parser, "verbose", "debug logging", {'v', "verbose"});
        args::PositionalList<std::string> inputs_arg(args_parser, "modules", "the YANG files to compile");

        try
        {
            args_parser.ParseCLI(argc, argv);
        }
        catch (const args::Help&)
        {
            std::cout << args_parser;
            return 0;
        }
        catch (const args::ParseError& e)
        {
            std::cerr << e.what() << std::endl;
            std::cerr << args_parser;
            return gnoigen::EXIT_RESOLUTION_FAILURE;
        }

        options.proto_outdir = args::get(proto_outdir_arg);
        options.server_stub_outdir = args::get(server_outdir_arg);
        options.client_outdir = args::get(client_outdir_arg);
        for (auto& path : args::get(search_paths_arg))
        {
            options.search_paths.emplace_back(path);
        }
        for (auto& input : args::get(inputs_arg))
        {
            options.inputs.emplace_back(input);
        }
        options.rpc_only = args::get(rpc_only_arg);
        verbose = args::get(verbose_arg);
    }

    gnoigen::init_logging(verbose);

    try
    {
        auto summary = gnoigen::compiler::run(options);
        GNOIGEN_DEBUG("{} proto files, {} server stubs and {} shared files written",
            summary.protos_written,
            summary.server_stubs_written,
            summary.aggregates_written);
    }
    catch (const gnoigen::configuration_error& e)
    {
        GNOIGEN_ERROR("{}", e.what());
        return gnoigen::EXIT_RESOLUTION_FAILURE;
    }
    catch (const gnoigen::resolution_error& e)
    {
        GNOIGEN_ERROR("{}", e.what());
        return gnoigen::EXIT_RESOLUTION_FAILURE;
    }
    catch (const std::exception& e)
    {
        GNOIGEN_ERROR("{}", e.what());
        return 1;
    }

    return 0;
}
