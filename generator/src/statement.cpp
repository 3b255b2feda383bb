/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <set>

#include <gnoigen/statement.h>

namespace gnoigen
{
    std::string module_info::module_for_prefix(const std::string& pfx) const
    {
        if (pfx.empty() || pfx == prefix)
            return name;
        auto it = imports.find(pfx);
        if (it == imports.end())
            return "";
        return it->second;
    }

    bool is_schema_keyword(const std::string& keyword)
    {
        static const std::set<std::string> schema_keywords = {"container",
            "list",
            "leaf",
            "leaf-list",
            "choice",
            "case",
            "rpc",
            "action",
            "input",
            "output",
            "notification",
            "anydata",
            "anyxml"};
        return schema_keywords.find(keyword) != schema_keywords.end();
    }

    statement::statement(std::string keyword, std::string arg, int line)
        : keyword_(std::move(keyword))
        , arg_(std::move(arg))
        , line_(line)
    {
    }

    const statement* statement::search_one(const std::string& keyword) const
    {
        for (auto& sub : substatements_)
        {
            if (sub->keyword_ == keyword)
                return sub.get();
        }
        return nullptr;
    }

    std::vector<const statement*> statement::search(const std::string& keyword) const
    {
        std::vector<const statement*> ret;
        for (auto& sub : substatements_)
        {
            if (sub->keyword_ == keyword)
                ret.push_back(sub.get());
        }
        return ret;
    }

    const statement* statement::find_child(const std::string& keyword) const
    {
        for (auto& child : children_)
        {
            if (child->keyword_ == keyword)
                return child.get();
        }
        return nullptr;
    }

    bool statement::is_schema_node() const
    {
        return is_schema_keyword(keyword_);
    }

    std::shared_ptr<statement> statement::clone(const statement* new_parent) const
    {
        auto copy = std::make_shared<statement>(keyword_, arg_, line_);
        copy->parent_ = new_parent;
        copy->lexical_parent_ = lexical_parent_;
        copy->lexical_module_ = lexical_module_;
        copy->module_ = new_parent ? new_parent->module_ : module_;
        for (auto& sub : substatements_)
        {
            copy->substatements_.push_back(sub->clone(copy.get()));
        }
        return copy;
    }

    void statement::add_substatement(std::shared_ptr<statement> stmt)
    {
        substatements_.push_back(std::move(stmt));
    }

    void statement::add_child(std::shared_ptr<statement> stmt)
    {
        children_.push_back(std::move(stmt));
    }
}
