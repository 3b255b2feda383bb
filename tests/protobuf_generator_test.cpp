/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <gtest/gtest.h>

#include <gnoigen/module_set.h>
#include <gnoigen/protobuf_generator.h>
#include <gnoigen/schema_tree_builder.h>

#include "test_helpers.h"

using namespace gnoigen;

namespace
{
    std::string emit(const std::string& text)
    {
        module_set modules;
        auto* root = modules.load_text(text, "test.yang");
        return protobuf_generator::print_proto(schema_tree_builder::build_module(*root, modules, false));
    }
}

TEST(protobuf_generator, reboot_rpc)
{
    const char* expected = R"(syntax = "proto3";

package gnoi.SonicReboot;

message RebootRequest {
    message Input {
        int32 method = 1 [json_name = "method"];
        uint64 delay = 2 [json_name = "delay"];
        string message = 3 [json_name = "message"];
    }
    Input input = 1 [json_name = "sonic-reboot:input"];
}

message RebootResponse {
}

service SonicRebootService {
    rpc Reboot(RebootRequest) returns (RebootResponse) {}
}
)";
    EXPECT_EQ(emit(gnoigen_test::reboot_module), expected);
}

TEST(protobuf_generator, data_module_without_service)
{
    const char* expected = R"(syntax = "proto3";

package gnoi.Sys;

message hostname {
    string hostname = 1 [json_name = "sys:hostname"];
}

message system {
    System system = 1 [json_name = "sys:system"];
}

message System {
    message Server {
        string address = 1 [json_name = "address"];
        repeated string tags = 2 [json_name = "tags"];
    }
    message Clock {
        string timezone = 1 [json_name = "timezone"];
    }
    enum AdminStatus {
        UP = 0;
        DOWN = 1;
    }
    AdminStatus admin_status = 1 [json_name = "admin-status"];
    repeated Server server = 2 [json_name = "server"];
    Clock clock = 3 [json_name = "clock"];
}
)";
    auto proto = emit(R"(
module sys {
    prefix s;
    leaf hostname { type string; }
    container system {
        leaf admin-status { type enumeration { enum UP; enum DOWN; } }
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
    EXPECT_EQ(proto, expected);
    EXPECT_EQ(proto.find("service"), std::string::npos);
}

TEST(protobuf_generator, top_level_list)
{
    auto proto = emit(R"(
module m {
    prefix m;
    list user {
        key name;
        leaf name { type string; }
    }
})");
    EXPECT_NE(proto.find("message user {\n    repeated User user = 1 [json_name = \"m:user\"];\n}\n"), std::string::npos)
        << proto;
    EXPECT_NE(proto.find("message User {\n    string name = 1 [json_name = \"name\"];\n}\n"), std::string::npos) << proto;
}

TEST(protobuf_generator, struct_import_only_with_union)
{
    auto with_union = emit("module m { prefix m; container c { leaf v { type union { type string; type int8; } } } }");
    EXPECT_NE(with_union.find("package gnoi.M;\n\nimport \"google/protobuf/struct.proto\";\n\n"), std::string::npos)
        << with_union;
    EXPECT_NE(with_union.find("google.protobuf.Value v = 1"), std::string::npos) << with_union;

    auto without_union = emit("module m { prefix m; container c { leaf v { type string; } } }");
    EXPECT_EQ(without_union.find("import"), std::string::npos) << without_union;
}

TEST(protobuf_generator, fields_numbered_in_append_order)
{
    auto proto = emit(R"(
module m {
    prefix m;
    container c {
        leaf a { type int8; }
        leaf b { type int64; }
        leaf c { type uint8; }
        leaf d { type uint64; }
        leaf e { type decimal64; }
        leaf f { type binary; }
    }
})");
    EXPECT_NE(proto.find("    int32 a = 1 [json_name = \"a\"];\n"
                         "    int64 b = 2 [json_name = \"b\"];\n"
                         "    uint32 c = 3 [json_name = \"c\"];\n"
                         "    uint64 d = 4 [json_name = \"d\"];\n"
                         "    sint64 e = 5 [json_name = \"e\"];\n"
                         "    bytes f = 6 [json_name = \"f\"];\n"),
        std::string::npos)
        << proto;
}

TEST(protobuf_generator, several_rpcs_in_one_service)
{
    auto proto = emit(R"(
module sonic-image-management {
    prefix sim;
    rpc image-install { input { leaf imagename { type string; } } }
    rpc image-default { }
})");
    EXPECT_NE(proto.find("service SonicImageManagementService {\n"
                         "    rpc ImageInstall(ImageInstallRequest) returns (ImageInstallResponse) {}\n"
                         "    rpc ImageDefault(ImageDefaultRequest) returns (ImageDefaultResponse) {}\n"
                         "}\n"),
        std::string::npos)
        << proto;
}

TEST(protobuf_generator, output_is_deterministic)
{
    EXPECT_EQ(emit(gnoigen_test::reboot_module), emit(gnoigen_test::reboot_module));
}
