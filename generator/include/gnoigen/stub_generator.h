/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#pragma once

#include <ostream>
#include <string>
#include <vector>

#include <gnoigen/schema_tree.h>

namespace gnoigen
{
    namespace stub_generator
    {
        // "sonic" when any module with rpcs is named sonic* or Sonic*, otherwise "openconfig"
        std::string get_service_prefix(const std::vector<const module_node*>& modules);

        // gRPC service implementation of one module, one handler per rpc
        void write_server_stub(const module_node& module, std::ostream& stream);

        // gnoiyang.h, the declarations shared by every handler file
        void write_support_header(std::ostream& stream);

        // <prefix>_register.cpp, registers the service of every module that has rpcs
        void write_register(const std::vector<const module_node*>& modules, const std::string& prefix, std::ostream& stream);

        // gnoi_<prefix>_client/main.cpp, calls one method selected on the command line
        void write_client(const std::vector<const module_node*>& modules, const std::string& prefix, std::ostream& stream);
    }
}
