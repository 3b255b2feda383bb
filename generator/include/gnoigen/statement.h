/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace gnoigen
{
    class statement;

    // Identity of a loaded module: its name, prefix and the prefixes of its imports
    struct module_info
    {
        std::string name;
        std::string prefix;
        std::string source;
        std::map<std::string, std::string> imports; // prefix -> module name
        const statement* stmt = nullptr;

        // maps a prefix used inside this module to a module name, empty if unknown
        std::string module_for_prefix(const std::string& pfx) const;
    };

    // One YANG statement as delivered by the frontend.
    // Substatements are the statements as written. Children are the schema nodes below this
    // node once groupings have been expanded, so a node copied in by "uses" appears only in
    // the children of the node that used it. Two module links are kept: the module whose
    // namespace the node belongs to, and the lexical module the text was written in, which
    // is the one prefixes and typedef names are resolved against.
    class statement
    {
        std::string keyword_;
        std::string arg_;
        int line_ = 0;

        const statement* parent_ = nullptr;
        const statement* lexical_parent_ = nullptr;
        const module_info* module_ = nullptr;
        const module_info* lexical_module_ = nullptr;

        std::vector<std::shared_ptr<statement>> substatements_;
        std::vector<std::shared_ptr<statement>> children_;

    public:
        statement(std::string keyword, std::string arg, int line = 0);

        const std::string& get_keyword() const { return keyword_; }
        const std::string& get_arg() const { return arg_; }
        int get_line() const { return line_; }

        // schema tree parent, the using node for statements copied from a grouping
        const statement* get_parent() const { return parent_; }
        // parent in the text the statement was written in
        const statement* get_lexical_parent() const { return lexical_parent_; }

        const module_info* get_module() const { return module_; }
        const module_info* get_lexical_module() const { return lexical_module_; }

        const std::vector<std::shared_ptr<statement>>& get_substatements() const { return substatements_; }
        const std::vector<std::shared_ptr<statement>>& get_children() const { return children_; }

        // first substatement with this keyword, nullptr if there is none
        const statement* search_one(const std::string& keyword) const;
        std::vector<const statement*> search(const std::string& keyword) const;
        // first schema child with this keyword
        const statement* find_child(const std::string& keyword) const;

        bool is_schema_node() const;

        // deep copy of this statement and its substatements, re-parented under new_parent in
        // the schema tree while keeping the lexical links of the copied statement
        std::shared_ptr<statement> clone(const statement* new_parent) const;

        void add_substatement(std::shared_ptr<statement> stmt);
        void add_child(std::shared_ptr<statement> stmt);
        void clear_children() { children_.clear(); }
        void set_parent(const statement* parent) { parent_ = parent; }
        void set_lexical_parent(const statement* parent) { lexical_parent_ = parent; }
        void set_module(const module_info* module) { module_ = module; }
        void set_lexical_module(const module_info* module) { lexical_module_ = module; }
    };

    // keywords that describe nodes of the schema tree
    bool is_schema_keyword(const std::string& keyword);
}
