/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#pragma once

#include <string>
#include <utility>

namespace gnoigen
{
    class statement;

    // "pfx:name" -> {"pfx", "name"}, {"", "name"} when there is no prefix
    std::pair<std::string, std::string> split_prefix(const std::string& name);

    // "sonic-reboot_info" -> "SonicRebootInfo". Words are split on every character that is not
    // a letter or digit, and within a word a letter is upper case only when it does not follow
    // another letter.
    std::string pascal_case(const std::string& name);

    // identifier usable as a proto field name, invalid characters become '_'
    std::string sanitize_field_name(const std::string& name);

    // module name with hyphens replaced, used for file and directory names
    std::string plain_module_name(const std::string& name);

    // Last segment of the schema path of a node: "module:name" when the owning module changes
    // from the previous path segment (always true at the top level), otherwise "name".
    // case, input and output are not path segments.
    std::string qualified_node_name(const statement& stmt);

    // absolute schema path of a node with the module prefixed wherever it changes,
    // e.g. "/sonic-reboot:reboot"
    std::string schema_path(const statement& stmt);

    // "leaf \"delay\" (sonic-reboot.yang:12)" for diagnostics
    std::string describe(const statement& stmt);
}
