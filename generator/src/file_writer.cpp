/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <fstream>
#include <stdexcept>

#include <gnoigen/file_writer.h>
#include <gnoigen/logger.h>

namespace gnoigen
{
    namespace file_writer
    {
        std::string read_file(const std::filesystem::path& path)
        {
            std::string data;
            std::ifstream fs(path, std::ios::binary);
            if (fs)
                std::getline(fs, data, '\0');
            return data;
        }

        bool is_different(const std::string& content, const std::string& existing)
        {
            return content != existing;
        }

        bool write_if_different(const std::filesystem::path& path, const std::string& content)
        {
            // an empty file that does not exist yet still has to be created
            if (std::filesystem::exists(path) && !is_different(content, read_file(path)))
            {
                GNOIGEN_INFO("file {} unchanged, skipped writing", path.string());
                return false;
            }

            if (path.has_parent_path())
                std::filesystem::create_directories(path.parent_path());

            GNOIGEN_INFO("writing file: {}", path.string());
            std::ofstream file(path, std::ios::binary | std::ios::trunc);
            if (!file)
                throw std::runtime_error("cannot open " + path.string() + " for writing");
            file << content;
            file.close();
            if (!file)
                throw std::runtime_error("failed writing " + path.string());
            return true;
        }
    }
}
