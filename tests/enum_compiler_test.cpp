/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <gtest/gtest.h>

#include <gnoigen/enum_compiler.h>
#include <gnoigen/yang_parser.h>

using namespace gnoigen;

namespace
{
    std::shared_ptr<statement> enumeration(const std::string& members)
    {
        return yang_parser::parse("type enumeration { " + members + " }", "enum.yang");
    }

    leaf_node make_leaf(const std::string& name)
    {
        leaf_node leaf;
        leaf.name = name;
        leaf.json_name = name;
        leaf.type = "Enum";
        return leaf;
    }
}

TEST(enum_compiler, members_are_tagged_in_declaration_order)
{
    auto type = enumeration("enum UP { value 1; } enum DOWN { value 2; } enum TESTING { value 7; }");
    auto leaf = make_leaf("oper_status");
    std::vector<leaf_node> siblings;

    ASSERT_TRUE(enum_compiler::compile(*type, leaf, siblings));
    ASSERT_TRUE(leaf.enumeration);
    ASSERT_EQ(leaf.enumeration->members.size(), 3u);
    EXPECT_EQ(leaf.enumeration->members[0].name, "UP");
    EXPECT_EQ(leaf.enumeration->members[0].tag, 0);
    EXPECT_EQ(leaf.enumeration->members[1].name, "DOWN");
    EXPECT_EQ(leaf.enumeration->members[1].tag, 1);
    EXPECT_EQ(leaf.enumeration->members[2].name, "TESTING");
    EXPECT_EQ(leaf.enumeration->members[2].tag, 2);
    EXPECT_EQ(leaf.enumeration->names.count("DOWN"), 1u);
}

TEST(enum_compiler, duplicate_members_collapse)
{
    auto type = enumeration("enum A; enum B; enum A;");
    auto leaf = make_leaf("x");
    std::vector<leaf_node> siblings;

    ASSERT_TRUE(enum_compiler::compile(*type, leaf, siblings));
    EXPECT_EQ(leaf.enumeration->members.size(), 2u);
}

TEST(enum_compiler, member_starting_with_digit_falls_back)
{
    auto type = enumeration("enum 10G; enum 40G;");
    auto leaf = make_leaf("speed");
    std::vector<leaf_node> siblings;

    EXPECT_FALSE(enum_compiler::compile(*type, leaf, siblings));
    EXPECT_FALSE(leaf.enumeration);
}

TEST(enum_compiler, member_with_hyphen_falls_back)
{
    auto type = enumeration("enum up; enum lower-layer-down;");
    auto leaf = make_leaf("status");
    std::vector<leaf_node> siblings;

    EXPECT_FALSE(enum_compiler::compile(*type, leaf, siblings));
}

TEST(enum_compiler, empty_enumeration_falls_back)
{
    auto type = enumeration("");
    auto leaf = make_leaf("nothing");
    std::vector<leaf_node> siblings;

    EXPECT_FALSE(enum_compiler::compile(*type, leaf, siblings));
}

TEST(enum_compiler, siblings_sharing_a_member_both_fall_back)
{
    std::vector<leaf_node> siblings;

    auto admin_type = enumeration("enum UP; enum DOWN;");
    auto admin = make_leaf("admin_status");
    ASSERT_TRUE(enum_compiler::compile(*admin_type, admin, siblings));
    siblings.push_back(admin);

    auto oper_type = enumeration("enum UP; enum DOWN; enum DORMANT;");
    auto oper = make_leaf("oper_status");
    EXPECT_FALSE(enum_compiler::compile(*oper_type, oper, siblings));

    EXPECT_FALSE(siblings[0].enumeration);
    EXPECT_EQ(siblings[0].type, "string");
}

TEST(enum_compiler, third_sibling_still_sees_downgraded_names)
{
    std::vector<leaf_node> siblings;

    auto first_type = enumeration("enum ON; enum OFF;");
    auto first = make_leaf("first");
    ASSERT_TRUE(enum_compiler::compile(*first_type, first, siblings));
    siblings.push_back(first);

    auto second_type = enumeration("enum ON;");
    auto second = make_leaf("second");
    ASSERT_FALSE(enum_compiler::compile(*second_type, second, siblings));
    second.type = "string";
    siblings.push_back(second);

    auto third_type = enumeration("enum OFF; enum AUTO;");
    auto third = make_leaf("third");
    EXPECT_FALSE(enum_compiler::compile(*third_type, third, siblings));
}

TEST(enum_compiler, disjoint_siblings_keep_their_enums)
{
    std::vector<leaf_node> siblings;

    auto first_type = enumeration("enum RED; enum GREEN;");
    auto first = make_leaf("color");
    ASSERT_TRUE(enum_compiler::compile(*first_type, first, siblings));
    siblings.push_back(first);

    auto second_type = enumeration("enum SMALL; enum LARGE;");
    auto second = make_leaf("size");
    EXPECT_TRUE(enum_compiler::compile(*second_type, second, siblings));
    EXPECT_TRUE(siblings[0].enumeration);
}
