/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#pragma once

#include <filesystem>
#include <string>

namespace gnoigen
{
    namespace file_writer
    {
        // whole content of a file, empty if it does not exist
        std::string read_file(const std::filesystem::path& path);

        bool is_different(const std::string& content, const std::string& existing);

        // Writes content to path only if it differs from what is on disk, creating the parent
        // directories. Returns true if the file was written.
        bool write_if_different(const std::filesystem::path& path, const std::string& content);
    }
}
