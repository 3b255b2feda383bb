/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <algorithm>
#include <cctype>

#include <gnoigen/enum_compiler.h>
#include <gnoigen/logger.h>
#include <gnoigen/statement.h>

namespace gnoigen
{
    namespace enum_compiler
    {
        namespace
        {
            bool is_valid_member_name(const std::string& name)
            {
                if (name.empty() || std::isdigit(static_cast<unsigned char>(name[0])))
                    return false;
                return name.find('-') == std::string::npos;
            }

            bool collides(const leaf_node& sibling, const std::vector<std::string>& names)
            {
                for (auto& name : names)
                {
                    if (sibling.declared_enum_names.count(name))
                        return true;
                }
                return false;
            }
        }

        bool compile(const statement& enumeration, leaf_node& leaf, std::vector<leaf_node>& siblings)
        {
            std::vector<std::string> names;
            for (auto* member : enumeration.search("enum"))
            {
                // explicit "value" statements are not carried over, members are renumbered
                if (!is_valid_member_name(member->get_arg()))
                    return false;
                if (std::find(names.begin(), names.end(), member->get_arg()) == names.end())
                    names.push_back(member->get_arg());
            }
            if (names.empty())
                return false;

            leaf.declared_enum_names.insert(names.begin(), names.end());

            // enum values share one scope in the generated message
            bool collision = false;
            for (auto& sibling : siblings)
            {
                if (!collides(sibling, names))
                    continue;
                collision = true;
                if (sibling.enumeration)
                {
                    GNOIGEN_INFO("Due to protobuf limitation changing type to string from enum for leaf-{}",
                        sibling.json_name);
                    sibling.enumeration.reset();
                    sibling.type = "string";
                }
            }
            if (collision)
                return false;

            enum_def def;
            int tag = 0;
            for (auto& name : names)
            {
                def.members.push_back({name, tag++});
                def.names.insert(name);
            }
            leaf.enumeration = std::move(def);
            return true;
        }
    }
}
