/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

#include <fmt/format.h>

#include <gnoigen/errors.h>
#include <gnoigen/helpers.h>
#include <gnoigen/logger.h>
#include <gnoigen/module_set.h>
#include <gnoigen/yang_parser.h>

namespace gnoigen
{
    namespace
    {
        // groupings may use other groupings, this bounds runaway recursion
        constexpr int max_expansion_depth = 64;

        // removes "[...]" predicates and white space from a leafref path
        std::string strip_predicates(const std::string& path)
        {
            std::string ret;
            int depth = 0;
            for (char c : path)
            {
                if (c == '[')
                    depth++;
                else if (c == ']')
                    depth--;
                else if (depth == 0 && !std::isspace(static_cast<unsigned char>(c)))
                    ret += c;
            }
            return ret;
        }

        bool is_transparent(const statement& stmt)
        {
            return stmt.get_keyword() == "choice" || stmt.get_keyword() == "case";
        }

        const statement* data_parent(const statement& stmt)
        {
            const statement* parent = stmt.get_parent();
            while (parent && is_transparent(*parent))
                parent = parent->get_parent();
            return parent;
        }

        const statement* find_data_child(const statement& node, const std::string& name)
        {
            for (auto& child : node.get_children())
            {
                if (is_transparent(*child))
                {
                    if (auto* found = find_data_child(*child, name))
                        return found;
                    continue;
                }
                if (child->get_arg() == name)
                    return child.get();
                if ((child->get_keyword() == "input" || child->get_keyword() == "output") && child->get_keyword() == name)
                    return child.get();
            }
            return nullptr;
        }
    }

    module_set::module_set(std::vector<std::filesystem::path> search_paths)
        : search_paths_(std::move(search_paths))
    {
    }

    const statement* module_set::load_file(const std::filesystem::path& path)
    {
        std::ifstream file(path);
        if (!file)
            throw parse_error(fmt::format("unable to load {}", path.string()));

        std::stringstream buffer;
        buffer << file.rdbuf();

        // imports are looked up beside the module as well
        auto directory = path.parent_path();
        if (directory.empty())
            directory = ".";
        if (std::find(search_paths_.begin(), search_paths_.end(), directory) == search_paths_.end())
            search_paths_.push_back(directory);

        return add_module(yang_parser::parse(buffer.str(), path.string()), path.string(), true);
    }

    const statement* module_set::load_text(const std::string& text, const std::string& source_name)
    {
        return add_module(yang_parser::parse(text, source_name), source_name, true);
    }

    const statement* module_set::find_module(const std::string& name) const
    {
        auto it = modules_.find(name);
        if (it == modules_.end())
            return nullptr;
        return it->second.get();
    }

    const module_info* module_set::find_module_info(const std::string& name) const
    {
        auto it = infos_.find(name);
        if (it == infos_.end())
            return nullptr;
        return it->second.get();
    }

    const statement* module_set::add_module(
        std::shared_ptr<statement> root, const std::string& source_name, bool requested)
    {
        if (root->get_keyword() == "submodule")
        {
            GNOIGEN_WARNING("skipping submodule {} in {}", root->get_arg(), source_name);
            return nullptr;
        }
        if (root->get_keyword() != "module")
            throw parse_error(fmt::format("{}: expected a module, found \"{}\"", source_name, root->get_keyword()));

        const std::string& name = root->get_arg();
        if (auto* existing = find_module(name))
        {
            if (requested && std::find(requested_.begin(), requested_.end(), existing) == requested_.end())
                requested_.push_back(existing);
            return existing;
        }

        auto info = std::make_unique<module_info>();
        info->name = name;
        info->source = source_name;
        info->stmt = root.get();
        auto* prefix = root->search_one("prefix");
        if (!prefix)
            throw parse_error(fmt::format("{}: module {} has no prefix", source_name, name));
        info->prefix = prefix->get_arg();
        for (auto* import : root->search("import"))
        {
            auto* import_prefix = import->search_one("prefix");
            if (!import_prefix)
                throw parse_error(
                    fmt::format("{}:{}: import {} has no prefix", source_name, import->get_line(), import->get_arg()));
            info->imports[import_prefix->get_arg()] = import->get_arg();
        }

        assign_lexical_module(*root, info.get());

        // registered before the imports are loaded so that import cycles terminate
        const module_info& linked = *info;
        modules_[name] = root;
        infos_[name] = std::move(info);

        load_imports(linked);
        expand(*root, 0);

        if (requested)
            requested_.push_back(root.get());
        return root.get();
    }

    void module_set::load_imports(const module_info& info)
    {
        for (auto& import : info.imports)
        {
            const std::string& module_name = import.second;
            if (find_module(module_name))
                continue;

            auto path = find_module_file(module_name);
            if (path.empty())
            {
                GNOIGEN_WARNING("module {} imported by {} not found in the search path", module_name, info.name);
                continue;
            }

            GNOIGEN_DEBUG("loading {} for {}", path.string(), info.name);
            std::ifstream file(path);
            std::stringstream buffer;
            buffer << file.rdbuf();
            add_module(yang_parser::parse(buffer.str(), path.string()), path.string(), false);
        }
    }

    std::filesystem::path module_set::find_module_file(const std::string& name) const
    {
        std::error_code ec;
        for (auto& directory : search_paths_)
        {
            auto exact = directory / (name + ".yang");
            if (std::filesystem::exists(exact, ec))
                return exact;

            // name@revision.yang
            if (!std::filesystem::is_directory(directory, ec))
                continue;
            for (auto& entry : std::filesystem::directory_iterator(directory, ec))
            {
                auto filename = entry.path().filename().string();
                if (filename.rfind(name + "@", 0) == 0 && entry.path().extension() == ".yang")
                    return entry.path();
            }
        }
        return {};
    }

    void module_set::assign_lexical_module(statement& stmt, const module_info* info)
    {
        stmt.set_module(info);
        stmt.set_lexical_module(info);
        for (auto& sub : stmt.get_substatements())
        {
            assign_lexical_module(*sub, info);
        }
    }

    void module_set::expand(statement& node, int depth)
    {
        if (depth > max_expansion_depth)
            throw resolution_error(
                fmt::format("grouping expansion too deep at {} \"{}\"", node.get_keyword(), node.get_arg()));

        node.clear_children();
        for (auto& sub : node.get_substatements())
        {
            if (sub->get_keyword() == "uses")
            {
                expand_uses(node, *sub, depth);
            }
            else if (sub->is_schema_node())
            {
                sub->set_parent(&node);
                sub->set_module(node.get_module());
                node.add_child(sub);
                expand(*sub, depth + 1);
            }
        }
    }

    void module_set::expand_uses(statement& node, const statement& uses, int depth)
    {
        if (depth > max_expansion_depth)
        {
            throw resolution_error(fmt::format("{}:{}: grouping expansion too deep at uses {}, groupings use each other",
                uses.get_lexical_module()->source,
                uses.get_line(),
                uses.get_arg()));
        }

        auto* grouping = find_grouping(uses);
        if (!grouping)
        {
            throw resolution_error(fmt::format("{}:{}: grouping {} not found",
                uses.get_lexical_module()->source,
                uses.get_line(),
                uses.get_arg()));
        }

        for (auto& sub : grouping->get_substatements())
        {
            if (sub->get_keyword() == "uses")
            {
                expand_uses(node, *sub, depth + 1);
            }
            else if (sub->is_schema_node())
            {
                auto copy = sub->clone(&node);
                node.add_child(copy);
                expand(*copy, depth + 1);
            }
        }
    }

    const statement* module_set::find_grouping(const statement& uses) const
    {
        auto [pfx, name] = split_prefix(uses.get_arg());
        const module_info* lexical = uses.get_lexical_module();

        std::string module_name = lexical->module_for_prefix(pfx);
        if (module_name.empty())
        {
            throw resolution_error(fmt::format("{}:{}: prefix {} is not imported by module {}",
                lexical->source,
                uses.get_line(),
                pfx,
                lexical->name));
        }

        if (module_name == lexical->name)
        {
            for (auto* scope = uses.get_lexical_parent(); scope; scope = scope->get_lexical_parent())
            {
                for (auto* grouping : scope->search("grouping"))
                {
                    if (grouping->get_arg() == name)
                        return grouping;
                }
            }
            return nullptr;
        }

        auto* imported = find_module(module_name);
        if (!imported)
            return nullptr;
        for (auto* grouping : imported->search("grouping"))
        {
            if (grouping->get_arg() == name)
                return grouping;
        }
        return nullptr;
    }

    const statement* module_set::resolve_path(
        const statement& context, const std::string& path, const module_info& lexical) const
    {
        std::string cleaned = strip_predicates(path);
        if (cleaned.empty())
            return nullptr;

        std::vector<std::string> steps;
        std::stringstream stream(cleaned);
        std::string step;
        while (std::getline(stream, step, '/'))
        {
            if (!step.empty())
                steps.push_back(step);
        }

        const statement* current = &context;
        size_t first = 0;
        if (cleaned.front() == '/')
        {
            if (steps.empty())
                return nullptr;
            auto [pfx, name] = split_prefix(steps.front());
            auto* top = find_module(lexical.module_for_prefix(pfx));
            if (!top)
                return nullptr;
            current = find_data_child(*top, name);
            first = 1;
        }

        for (size_t i = first; current && i < steps.size(); i++)
        {
            if (steps[i] == "..")
                current = data_parent(*current);
            else if (steps[i] != ".")
                current = find_data_child(*current, split_prefix(steps[i]).second);
        }
        return current;
    }
}
