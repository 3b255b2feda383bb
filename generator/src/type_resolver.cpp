/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <map>
#include <set>

#include <fmt/format.h>

#include <gnoigen/errors.h>
#include <gnoigen/helpers.h>
#include <gnoigen/module_set.h>
#include <gnoigen/statement.h>
#include <gnoigen/type_resolver.h>

namespace gnoigen
{
    namespace type_resolver
    {
        namespace
        {
            constexpr int max_typedef_depth = 64;

            const std::map<std::string, proto_kind>& base_types()
            {
                static const std::map<std::string, proto_kind> types = {
                    {"binary", proto_kind::BYTES},
                    {"bits", proto_kind::BYTES},
                    {"boolean", proto_kind::BOOL},
                    {"decimal64", proto_kind::SINT64},
                    {"empty", proto_kind::STRING},
                    {"int8", proto_kind::INT32},
                    {"int16", proto_kind::INT32},
                    {"int32", proto_kind::INT32},
                    {"int64", proto_kind::INT64},
                    {"string", proto_kind::STRING},
                    {"uint8", proto_kind::UINT32},
                    {"uint16", proto_kind::UINT32},
                    {"uint32", proto_kind::UINT32},
                    {"uint64", proto_kind::UINT64},
                    {"union", proto_kind::VALUE},
                    {"enumeration", proto_kind::ENUMERATION},
                    {"identityref", proto_kind::STRING},
                    {"instance-identifier", proto_kind::STRING},
                };
                return types;
            }

            const statement* find_typedef_in(const statement& scope, const std::string& name)
            {
                for (auto* typedef_stmt : scope.search("typedef"))
                {
                    if (typedef_stmt->get_arg() == name)
                        return typedef_stmt;
                }
                return nullptr;
            }

            // typedefs are visible from the enclosing statements of the text they are used in
            const statement* find_local_typedef(const statement& type, const std::string& name)
            {
                for (auto* scope = type.get_lexical_parent(); scope; scope = scope->get_lexical_parent())
                {
                    if (auto* found = find_typedef_in(*scope, name))
                        return found;
                }
                return nullptr;
            }

            // follows typedef references until a base type statement is reached
            const statement* chase_typedefs(const statement& node, const statement& type, const module_set& modules)
            {
                const statement* current = &type;
                int depth = 0;
                while (!is_base_type(current->get_arg()))
                {
                    if (++depth > max_typedef_depth)
                        throw resolution_error(
                            fmt::format("{}: typedef chain of {} is too deep", describe(node), type.get_arg()));

                    auto [pfx, name] = split_prefix(current->get_arg());
                    const module_info* lexical = current->get_lexical_module();
                    std::string module_name = lexical->module_for_prefix(pfx);
                    if (module_name.empty())
                    {
                        throw resolution_error(fmt::format("{}: prefix {} of type {} is not an imported module of {}",
                            describe(node),
                            pfx,
                            current->get_arg(),
                            lexical->name));
                    }

                    const statement* typedef_stmt = nullptr;
                    if (module_name == lexical->name)
                    {
                        typedef_stmt = find_local_typedef(*current, name);
                        if (!typedef_stmt)
                            typedef_stmt = find_typedef_in(*lexical->stmt, name);
                    }
                    else
                    {
                        auto* imported = modules.find_module(module_name);
                        if (!imported)
                        {
                            throw resolution_error(fmt::format(
                                "{}: typedef {} is not found, module {} is not loaded, make sure all dependent "
                                "modules are present",
                                describe(node),
                                current->get_arg(),
                                module_name));
                        }
                        typedef_stmt = find_typedef_in(*imported, name);
                    }

                    if (!typedef_stmt)
                    {
                        throw resolution_error(
                            fmt::format("{}: typedef {} is not found, make sure all dependent modules are present",
                                describe(node),
                                current->get_arg()));
                    }

                    current = typedef_stmt->search_one("type");
                    if (!current)
                        throw resolution_error(fmt::format("{}: {} has no type", describe(node), describe(*typedef_stmt)));
                }
                return current;
            }

            resolved_type resolve_node(const statement& node, const module_set& modules, std::set<const statement*>& visited);

            resolved_type resolve_leafref(const statement& node,
                const statement& leafref,
                const module_set& modules,
                std::set<const statement*>& visited)
            {
                auto* path = leafref.search_one("path");
                if (!path)
                    throw resolution_error(fmt::format("{}: leafref without a path", describe(node)));

                auto* target = modules.resolve_path(node, path->get_arg(), *leafref.get_lexical_module());
                if (!target)
                {
                    throw resolution_error(
                        fmt::format("{}: leafref path {} does not resolve to a node", describe(node), path->get_arg()));
                }
                if (target->get_keyword() != "leaf" && target->get_keyword() != "leaf-list")
                {
                    throw resolution_error(fmt::format("{}: leafref not pointing to leaf/leaf-list, {} resolves to {}",
                        describe(node),
                        path->get_arg(),
                        describe(*target)));
                }
                return resolve_node(*target, modules, visited);
            }

            resolved_type resolve_node(const statement& node, const module_set& modules, std::set<const statement*>& visited)
            {
                if (!visited.insert(&node).second)
                    throw resolution_error(fmt::format("{}: leafref cycle", describe(node)));

                auto* type = node.search_one("type");
                if (!type)
                    throw resolution_error(fmt::format("{}: no type statement", describe(node)));

                auto* base = chase_typedefs(node, *type, modules);
                if (base->get_arg() == "leafref")
                    return resolve_leafref(node, *base, modules, visited);

                return {map_base_type(base->get_arg()), base};
            }
        }

        bool is_base_type(const std::string& type_name)
        {
            return type_name == "leafref" || base_types().count(type_name) != 0;
        }

        proto_kind map_base_type(const std::string& type_name)
        {
            auto it = base_types().find(type_name);
            if (it == base_types().end())
                throw resolution_error(fmt::format("no proto type mapping for yang type {}", type_name));
            return it->second;
        }

        std::string to_proto_type(proto_kind kind)
        {
            switch (kind)
            {
            case proto_kind::INT32:
                return "int32";
            case proto_kind::INT64:
                return "int64";
            case proto_kind::UINT32:
                return "uint32";
            case proto_kind::UINT64:
                return "uint64";
            case proto_kind::SINT64:
                return "sint64";
            case proto_kind::BOOL:
                return "bool";
            case proto_kind::BYTES:
                return "bytes";
            case proto_kind::STRING:
                return "string";
            case proto_kind::VALUE:
                return "google.protobuf.Value";
            case proto_kind::ENUMERATION:
                return "enum";
            }
            return "string";
        }

        resolved_type resolve(const statement& node, const module_set& modules)
        {
            std::set<const statement*> visited;
            return resolve_node(node, modules, visited);
        }
    }
}
