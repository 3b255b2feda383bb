/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

// Standard C++ headers
#include <sstream>

// Other headers
#include <gnoigen/protobuf_generator.h>
#include <gnoigen/writer.h>

namespace gnoigen
{
    namespace protobuf_generator
    {
        namespace
        {
            // Helper function to write an enum declaration ahead of the field using it
            void write_enum(const leaf_node& leaf, writer& proto)
            {
                proto("enum {} {{", leaf.type);
                for (auto& member : leaf.enumeration->members)
                {
                    proto("{} = {};", member.name, member.tag);
                }
                proto("}}");
            }

            // Helper function to write one field, numbered from 1 in the order the fields were appended
            void write_field(const leaf_node& leaf, int field_number, writer& proto)
            {
                if (leaf.enumeration)
                    write_enum(leaf, proto);
                proto("{}{} {} = {} [json_name = \"{}\"];",
                    leaf.repeated ? "repeated " : "",
                    leaf.type,
                    leaf.name,
                    field_number,
                    leaf.json_name);
            }

            void write_message(const container_node& message, writer& proto)
            {
                proto("message {} {{", message.name);

                for (auto& list : message.lists)
                {
                    write_message(list, proto);
                }
                for (auto& container : message.containers)
                {
                    write_message(container, proto);
                }

                int field_number = 1;
                for (auto& leaf : message.leafs)
                {
                    write_field(leaf, field_number++, proto);
                }

                proto("}}");
            }

            // a top level leaf cannot stand on its own in proto3, so it gets a message named after it
            void write_leaf_message(const leaf_node& leaf, writer& proto)
            {
                proto("message {} {{", leaf.name);
                write_field(leaf, 1, proto);
                proto("}}");
            }

            void write_service(const module_node& module, writer& proto)
            {
                proto("service {}Service {{", module.name);
                for (auto& rpc : module.rpcs)
                {
                    proto("rpc {}({}) returns ({}) {{}}", rpc.short_name, rpc.input, rpc.output);
                }
                proto("}}");
            }
        }

        void write_proto(const module_node& module, std::ostream& stream)
        {
            writer proto(stream);

            proto("syntax = \"proto3\";");
            proto("");
            proto("package gnoi.{};", module.name);
            proto("");
            if (module.has_value_type)
            {
                proto("import \"google/protobuf/struct.proto\";");
                proto("");
            }

            // top level blocks are separated by one empty line
            bool first = true;
            auto separate = [&]()
            {
                if (!first)
                    proto("");
                first = false;
            };

            for (auto& leaf : module.top_level.leafs)
            {
                separate();
                write_leaf_message(leaf, proto);
            }
            for (auto& list : module.top_level.lists)
            {
                separate();
                write_message(list, proto);
            }
            for (auto& container : module.top_level.containers)
            {
                separate();
                write_message(container, proto);
            }
            if (!module.rpcs.empty())
            {
                separate();
                write_service(module, proto);
            }
        }

        std::string print_proto(const module_node& module)
        {
            std::stringstream stream;
            write_proto(module, stream);
            return stream.str();
        }
    }
}
