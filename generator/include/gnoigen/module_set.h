/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <gnoigen/statement.h>

namespace gnoigen
{
    // The set of modules a run works on, plus the modules they import.
    // Loading a module links it: module identity and import prefixes are recorded, "uses" is
    // expanded into schema children and every schema node gets its owning module.
    class module_set
    {
        std::vector<std::filesystem::path> search_paths_;
        std::map<std::string, std::shared_ptr<statement>> modules_;
        std::map<std::string, std::unique_ptr<module_info>> infos_;
        std::vector<const statement*> requested_;

    public:
        explicit module_set(std::vector<std::filesystem::path> search_paths = {});

        module_set(const module_set&) = delete;
        module_set& operator=(const module_set&) = delete;

        // loads a module that is to be compiled, submodules are skipped and return nullptr
        const statement* load_file(const std::filesystem::path& path);
        const statement* load_text(const std::string& text, const std::string& source_name);

        const statement* find_module(const std::string& name) const;
        const module_info* find_module_info(const std::string& name) const;

        // the modules passed to load_file/load_text, in load order
        const std::vector<const statement*>& get_requested_modules() const { return requested_; }

        // Resolves a leafref path relative to the leaf or leaf-list that declares it.
        // Prefixes in the path are interpreted in the lexical module of the path statement.
        // Returns nullptr when a step cannot be found.
        const statement* resolve_path(
            const statement& context, const std::string& path, const module_info& lexical) const;

    private:
        const statement* add_module(std::shared_ptr<statement> root, const std::string& source_name, bool requested);
        void load_imports(const module_info& info);
        std::filesystem::path find_module_file(const std::string& name) const;

        void assign_lexical_module(statement& stmt, const module_info* info);
        void expand(statement& node, int depth);
        void expand_uses(statement& node, const statement& uses, int depth);
        const statement* find_grouping(const statement& uses) const;
    };
}
