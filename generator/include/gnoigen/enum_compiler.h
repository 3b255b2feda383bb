/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#pragma once

#include <vector>

#include <gnoigen/schema_tree.h>

namespace gnoigen
{
    class statement;

    namespace enum_compiler
    {
        // Compiles the enum members of an enumeration type statement into leaf.enumeration,
        // tagged 0..N-1 in declaration order. siblings are the leafs already compiled under the
        // same parent. Returns false when proto3 cannot express the enumeration: a member name
        // that starts with a digit or contains '-', no members, or a member name another sibling
        // declared. Siblings sharing a member name are downgraded to string as well.
        bool compile(const statement& enumeration, leaf_node& leaf, std::vector<leaf_node>& siblings);
    }
}
