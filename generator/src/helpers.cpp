/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <algorithm>
#include <cctype>
#include <vector>

#include <fmt/format.h>

#include <gnoigen/helpers.h>
#include <gnoigen/statement.h>

namespace gnoigen
{
    namespace
    {
        bool is_path_segment(const statement& stmt)
        {
            const auto& keyword = stmt.get_keyword();
            return keyword != "case" && keyword != "input" && keyword != "output";
        }

        bool is_module_root(const statement& stmt)
        {
            return stmt.get_keyword() == "module" || stmt.get_keyword() == "submodule";
        }

        // path segments from the top level down to stmt
        std::vector<const statement*> path_segments(const statement& stmt)
        {
            std::vector<const statement*> segments;
            for (auto* current = &stmt; current && !is_module_root(*current); current = current->get_parent())
            {
                if (is_path_segment(*current))
                    segments.push_back(current);
            }
            std::reverse(segments.begin(), segments.end());
            return segments;
        }

        std::string module_name_of(const statement& stmt)
        {
            return stmt.get_module() ? stmt.get_module()->name : "";
        }

        std::vector<std::string> format_segments(const std::vector<const statement*>& segments)
        {
            std::vector<std::string> ret;
            std::string last_module;
            bool first = true;
            for (auto* segment : segments)
            {
                std::string module_name = module_name_of(*segment);
                if (first || module_name != last_module)
                    ret.push_back(fmt::format("{}:{}", module_name, segment->get_arg()));
                else
                    ret.push_back(segment->get_arg());
                last_module = module_name;
                first = false;
            }
            return ret;
        }
    }

    std::pair<std::string, std::string> split_prefix(const std::string& name)
    {
        auto pos = name.find(':');
        if (pos == std::string::npos)
            return {"", name};
        return {name.substr(0, pos), name.substr(pos + 1)};
    }

    std::string pascal_case(const std::string& name)
    {
        std::string ret;
        bool after_letter = false;
        for (char c : name)
        {
            // '-', '_', '.' and anything else a proto identifier cannot hold separate words
            if (!std::isalnum(static_cast<unsigned char>(c)))
            {
                after_letter = false;
                continue;
            }
            bool is_letter = std::isalpha(static_cast<unsigned char>(c)) != 0;
            if (is_letter)
                ret += static_cast<char>(
                    after_letter ? std::tolower(static_cast<unsigned char>(c)) : std::toupper(static_cast<unsigned char>(c)));
            else
                ret += c;
            after_letter = is_letter;
        }
        return ret;
    }

    std::string sanitize_field_name(const std::string& name)
    {
        std::string result = name;

        // Replace invalid characters with underscore
        for (auto& c : result)
        {
            if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_')
                c = '_';
        }

        // Ensure the name starts with a letter or underscore
        if (!result.empty() && !std::isalpha(static_cast<unsigned char>(result[0])) && result[0] != '_')
            result = "_" + result;

        return result;
    }

    std::string plain_module_name(const std::string& name)
    {
        std::string result = name;
        std::replace(result.begin(), result.end(), '-', '_');
        return result;
    }

    std::string qualified_node_name(const statement& stmt)
    {
        auto segments = format_segments(path_segments(stmt));
        if (segments.empty())
            return stmt.get_arg();
        return segments.back();
    }

    std::string schema_path(const statement& stmt)
    {
        std::string path;
        for (auto& segment : format_segments(path_segments(stmt)))
        {
            path += "/" + segment;
        }
        return path.empty() ? "/" : path;
    }

    std::string describe(const statement& stmt)
    {
        const module_info* lexical = stmt.get_lexical_module();
        return fmt::format("{} \"{}\" ({}:{})",
            stmt.get_keyword(),
            stmt.get_arg(),
            lexical ? lexical->source : std::string("<unknown>"),
            stmt.get_line());
    }
}
