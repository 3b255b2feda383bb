/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <gtest/gtest.h>

#include <gnoigen/errors.h>
#include <gnoigen/module_set.h>
#include <gnoigen/schema_tree_builder.h>

#include "test_helpers.h"

using namespace gnoigen;

namespace
{
    module_node build(const std::string& text, bool rpc_only = false)
    {
        module_set modules;
        auto* root = modules.load_text(text, "test.yang");
        return schema_tree_builder::build_module(*root, modules, rpc_only);
    }
}

TEST(schema_tree_builder, module_names)
{
    auto module = build("module openconfig-system { prefix oc-sys; }");
    EXPECT_EQ(module.name, "OpenconfigSystem");
    EXPECT_EQ(module.plain_name, "openconfig_system");
    EXPECT_EQ(module.yang_name, "openconfig-system");
    EXPECT_TRUE(module.rpcs.empty());
    EXPECT_FALSE(module.has_value_type);
}

TEST(schema_tree_builder, containers_and_lists_become_messages_and_fields)
{
    auto module = build(R"(
module sys {
    prefix s;
    container system {
        leaf host-name { type string; }
        list server {
            key address;
            leaf address { type string; }
            leaf-list tags { type string; }
        }
        container clock {
            leaf timezone { type string; }
        }
    }
})");

    ASSERT_EQ(module.top_level.containers.size(), 1u);
    ASSERT_EQ(module.top_level.leafs.size(), 1u);
    EXPECT_EQ(module.top_level.leafs[0].name, "system");
    EXPECT_EQ(module.top_level.leafs[0].type, "System");
    EXPECT_EQ(module.top_level.leafs[0].json_name, "sys:system");

    const auto& system = module.top_level.containers[0];
    EXPECT_EQ(system.name, "System");
    ASSERT_EQ(system.lists.size(), 1u);
    EXPECT_EQ(system.lists[0].name, "Server");
    ASSERT_EQ(system.containers.size(), 1u);
    EXPECT_EQ(system.containers[0].name, "Clock");

    // fields in schema order
    ASSERT_EQ(system.leafs.size(), 3u);
    EXPECT_EQ(system.leafs[0].name, "host_name");
    EXPECT_EQ(system.leafs[0].json_name, "host-name");
    EXPECT_EQ(system.leafs[1].name, "server");
    EXPECT_EQ(system.leafs[1].type, "Server");
    EXPECT_TRUE(system.leafs[1].repeated);
    EXPECT_EQ(system.leafs[2].name, "clock");
    EXPECT_FALSE(system.leafs[2].repeated);

    const auto& server = system.lists[0];
    ASSERT_EQ(server.leafs.size(), 2u);
    EXPECT_FALSE(server.leafs[0].repeated);
    EXPECT_TRUE(server.leafs[1].repeated);
}

TEST(schema_tree_builder, choice_and_case_are_flattened)
{
    auto module = build(R"(
module m {
    prefix m;
    container transport {
        choice protocol {
            case tcp { leaf tcp-port { type uint16; } }
            case udp { leaf udp-port { type uint16; } }
            leaf raw { type boolean; }
        }
    }
})");

    const auto& transport = module.top_level.containers[0];
    ASSERT_EQ(transport.leafs.size(), 3u);
    EXPECT_EQ(transport.leafs[0].name, "tcp_port");
    EXPECT_EQ(transport.leafs[1].name, "udp_port");
    EXPECT_EQ(transport.leafs[2].name, "raw");
    EXPECT_EQ(transport.leafs[2].type, "bool");
}

TEST(schema_tree_builder, notifications_actions_and_anydata_are_ignored)
{
    auto module = build(R"(
module m {
    prefix m;
    notification alarm { leaf text { type string; } }
    anydata blob;
    container c {
        action reset { input { leaf force { type boolean; } } }
        leaf kept { type string; }
    }
})");

    ASSERT_EQ(module.top_level.containers.size(), 1u);
    ASSERT_EQ(module.top_level.leafs.size(), 1u);
    ASSERT_EQ(module.top_level.containers[0].leafs.size(), 1u);
    EXPECT_EQ(module.top_level.containers[0].leafs[0].name, "kept");
    EXPECT_TRUE(module.rpcs.empty());
}

TEST(schema_tree_builder, enum_leaf_gets_pascal_case_enum_type)
{
    auto module = build(R"(
module m {
    prefix m;
    container port {
        leaf admin-status { type enumeration { enum UP; enum DOWN; } }
        leaf speed { type enumeration { enum 10G; enum 100G; } }
    }
})");

    const auto& port = module.top_level.containers[0];
    ASSERT_EQ(port.leafs.size(), 2u);
    EXPECT_EQ(port.leafs[0].type, "AdminStatus");
    ASSERT_TRUE(port.leafs[0].enumeration);
    EXPECT_EQ(port.leafs[1].type, "string");
    EXPECT_FALSE(port.leafs[1].enumeration);
}

TEST(schema_tree_builder, sibling_enums_sharing_a_member_both_become_strings)
{
    auto module = build(R"(
module m {
    prefix m;
    container port {
        leaf admin-status { type enumeration { enum UP; enum DOWN; } }
        leaf oper-status { type enumeration { enum UP; enum DOWN; enum DORMANT; } }
    }
})");

    const auto& port = module.top_level.containers[0];
    EXPECT_EQ(port.leafs[0].type, "string");
    EXPECT_FALSE(port.leafs[0].enumeration);
    EXPECT_EQ(port.leafs[1].type, "string");
    EXPECT_FALSE(port.leafs[1].enumeration);
}

TEST(schema_tree_builder, enums_in_different_messages_do_not_collide)
{
    auto module = build(R"(
module m {
    prefix m;
    container a { leaf state { type enumeration { enum UP; } } }
    container b { leaf state { type enumeration { enum UP; } } }
})");

    EXPECT_TRUE(module.top_level.containers[0].leafs[0].enumeration);
    EXPECT_TRUE(module.top_level.containers[1].leafs[0].enumeration);
}

TEST(schema_tree_builder, union_sets_value_flag)
{
    auto module = build(R"(
module m {
    prefix m;
    container c { leaf addr { type union { type string; type uint32; } } }
})");

    EXPECT_TRUE(module.has_value_type);
    EXPECT_EQ(module.top_level.containers[0].leafs[0].type, "google.protobuf.Value");
}

TEST(schema_tree_builder, rpcs_are_not_fields)
{
    auto module = build(R"(
module m {
    prefix m;
    container state { leaf up { type boolean; } }
    rpc ping { input { leaf count { type uint8; } } }
})");

    ASSERT_EQ(module.rpcs.size(), 1u);
    ASSERT_EQ(module.top_level.leafs.size(), 1u);
    EXPECT_EQ(module.top_level.leafs[0].name, "state");

    // request and response wrappers follow the data containers
    ASSERT_EQ(module.top_level.containers.size(), 3u);
    EXPECT_EQ(module.top_level.containers[0].name, "State");
    EXPECT_EQ(module.top_level.containers[1].name, "PingRequest");
    EXPECT_EQ(module.top_level.containers[2].name, "PingResponse");
}

TEST(schema_tree_builder, rpc_only_skips_data_nodes)
{
    auto module = build(R"(
module m {
    prefix m;
    container state { leaf up { type boolean; } }
    rpc ping { }
})",
        true);

    EXPECT_TRUE(module.top_level.leafs.empty());
    ASSERT_EQ(module.top_level.containers.size(), 2u);
    EXPECT_EQ(module.top_level.containers[0].name, "PingRequest");
}

TEST(schema_tree_builder, resolution_failure_propagates)
{
    EXPECT_THROW(build("module m { prefix m; container c { leaf x { type missing; } } }"), resolution_error);
}
