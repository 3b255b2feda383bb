/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <gnoigen/stub_generator.h>
#include <gnoigen/writer.h>

namespace gnoigen
{
    namespace stub_generator
    {
        namespace
        {
            bool has_prefix(const std::string& name, const std::string& prefix)
            {
                return name.compare(0, prefix.size(), prefix) == 0;
            }

            // Helper function to get the C++ namespace protoc generates for the package of a module
            std::string get_proto_namespace(const module_node& module)
            {
                return "gnoi::" + module.name;
            }

            std::string get_grpc_header(const module_node& module)
            {
                return module.plain_name + "/" + module.plain_name + ".grpc.pb.h";
            }

            void write_handler(const module_node& module, const rpc_node& rpc, writer& cpp)
            {
                auto ns = get_proto_namespace(module);
                cpp("grpc::Status {}(grpc::ServerContext* context, const {}::{}* {}, {}::{}* {}) override",
                    rpc.short_name,
                    ns,
                    rpc.input,
                    rpc.input_empty ? "/*request*/" : "request",
                    ns,
                    rpc.output,
                    rpc.output_empty ? "/*response*/" : "response");
                cpp("{{");
                cpp("std::string payload;");
                if (!rpc.input_empty)
                {
                    cpp("auto status = to_json(*request, payload);");
                    cpp("if (!status.ok())");
                    cpp("{{");
                    cpp("return status;");
                    cpp("}}");
                }
                else
                {
                    cpp("grpc::Status status;");
                }
                cpp("std::string result;");
                cpp("status = process_action(*context, \"{}\", payload, result);", rpc.url);
                cpp("if (!status.ok())");
                cpp("{{");
                cpp("return status;");
                cpp("}}");
                if (!rpc.output_empty)
                    cpp("return from_json(result, *response);");
                else
                    cpp("return grpc::Status::OK;");
                cpp("}}");
            }

            void write_client_call(const module_node& module, const rpc_node& rpc, writer& cpp)
            {
                auto ns = get_proto_namespace(module);
                cpp("int call_{}(const std::shared_ptr<grpc::Channel>& channel, const std::string& json_in)", rpc.name);
                cpp("{{");
                cpp("auto stub = {}::{}Service::NewStub(channel);", ns, module.name);
                cpp("{}::{} request;", ns, rpc.input);
                cpp("if (!json_in.empty())");
                cpp("{{");
                cpp("auto status = google::protobuf::util::JsonStringToMessage(json_in, &request);");
                cpp("if (!status.ok())");
                cpp("{{");
                cpp("std::cerr << \"invalid -jsonin: \" << status.ToString() << std::endl;");
                cpp("return 2;");
                cpp("}}");
                cpp("}}");
                cpp("{}::{} response;", ns, rpc.output);
                cpp("grpc::ClientContext context;");
                cpp("auto status = stub->{}(&context, request, &response);", rpc.short_name);
                cpp("return print_response(status, response);");
                cpp("}}");
                cpp("");
            }
        }

        std::string get_service_prefix(const std::vector<const module_node*>& modules)
        {
            for (auto* module : modules)
            {
                // modules without rpcs contribute no service
                if (module->rpcs.empty())
                    continue;
                if (has_prefix(module->yang_name, "sonic") || has_prefix(module->yang_name, "Sonic"))
                    return "sonic";
            }
            return "openconfig";
        }

        void write_server_stub(const module_node& module, std::ostream& stream)
        {
            writer cpp(stream);
            cpp("// Generated by gnoigen from {}, do not edit", module.yang_name);
            cpp("");
            cpp("#include <memory>");
            cpp("#include <string>");
            cpp("");
            cpp("#include <grpcpp/grpcpp.h>");
            cpp("");
            cpp("#include \"../gnoiyang.h\"");
            cpp("#include \"{}\"", get_grpc_header(module));
            cpp("");
            cpp("namespace gnoi_yang");
            cpp("{{");
            cpp("class {0}ServiceImpl final : public {1}::{0}Service::Service", module.name, get_proto_namespace(module));
            cpp("{{");
            cpp("public:");
            bool first = true;
            for (auto& rpc : module.rpcs)
            {
                if (!first)
                    cpp("");
                first = false;
                write_handler(module, rpc, cpp);
            }
            cpp("}};");
            cpp("");
            cpp("std::unique_ptr<grpc::Service> make_{}_service()", module.plain_name);
            cpp("{{");
            cpp("return std::make_unique<{}ServiceImpl>();", module.name);
            cpp("}}");
            cpp("}}");
        }

        void write_support_header(std::ostream& stream)
        {
            writer cpp(stream);
            cpp("// Generated by gnoigen, do not edit");
            cpp("");
            cpp("#pragma once");
            cpp("");
            cpp("#include <string>");
            cpp("");
            cpp("#include <google/protobuf/message.h>");
            cpp("#include <google/protobuf/util/json_util.h>");
            cpp("#include <grpcpp/grpcpp.h>");
            cpp("");
            cpp("namespace gnoi_yang");
            cpp("{{");
            cpp("// Implemented by the host. Executes the action at url with a JSON payload and returns the");
            cpp("// JSON reply in result.");
            cpp("grpc::Status process_action(grpc::ServerContext& context, const std::string& url, const std::string& "
                "payload, std::string& result);");
            cpp("");
            cpp("inline grpc::Status to_json(const google::protobuf::Message& message, std::string& json)");
            cpp("{{");
            cpp("auto status = google::protobuf::util::MessageToJsonString(message, &json);");
            cpp("if (!status.ok())");
            cpp("{{");
            cpp("return grpc::Status(grpc::StatusCode::INTERNAL, std::string(status.message()));");
            cpp("}}");
            cpp("return grpc::Status::OK;");
            cpp("}}");
            cpp("");
            cpp("inline grpc::Status from_json(const std::string& json, google::protobuf::Message& message)");
            cpp("{{");
            cpp("if (json.empty())");
            cpp("{{");
            cpp("return grpc::Status::OK;");
            cpp("}}");
            cpp("google::protobuf::util::JsonParseOptions options;");
            cpp("options.ignore_unknown_fields = true;");
            cpp("auto status = google::protobuf::util::JsonStringToMessage(json, &message, options);");
            cpp("if (!status.ok())");
            cpp("{{");
            cpp("return grpc::Status(grpc::StatusCode::INTERNAL, std::string(status.message()));");
            cpp("}}");
            cpp("return grpc::Status::OK;");
            cpp("}}");
            cpp("}}");
        }

        void write_register(const std::vector<const module_node*>& modules, const std::string& prefix, std::ostream& stream)
        {
            writer cpp(stream);
            cpp("// Generated by gnoigen, do not edit");
            cpp("");
            cpp("#include <memory>");
            cpp("#include <vector>");
            cpp("");
            cpp("#include <grpcpp/grpcpp.h>");
            cpp("");
            cpp("namespace gnoi_yang");
            cpp("{{");
            for (auto* module : modules)
            {
                if (!module->rpcs.empty())
                    cpp("std::unique_ptr<grpc::Service> make_{}_service();", module->plain_name);
            }
            cpp("");
            cpp("// the builder does not own the services, they have to outlive the server");
            cpp("void register_{}_services(grpc::ServerBuilder& builder, std::vector<std::unique_ptr<grpc::Service>>& "
                "services)",
                prefix);
            cpp("{{");
            for (auto* module : modules)
            {
                if (module->rpcs.empty())
                    continue;
                cpp("services.push_back(make_{}_service());", module->plain_name);
                cpp("builder.RegisterService(services.back().get());");
            }
            cpp("}}");
            cpp("}}");
        }

        void write_client(const std::vector<const module_node*>& modules, const std::string& prefix, std::ostream& stream)
        {
            writer cpp(stream);
            cpp("// Generated by gnoigen, do not edit");
            cpp("");
            cpp("#include <functional>");
            cpp("#include <iostream>");
            cpp("#include <map>");
            cpp("#include <memory>");
            cpp("#include <string>");
            cpp("");
            cpp("#include <google/protobuf/util/json_util.h>");
            cpp("#include <grpcpp/grpcpp.h>");
            cpp("");
            for (auto* module : modules)
            {
                if (!module->rpcs.empty())
                    cpp("#include \"{}\"", get_grpc_header(*module));
            }
            cpp("");
            cpp("namespace");
            cpp("{{");
            cpp("using call_fn = std::function<int(const std::shared_ptr<grpc::Channel>&, const std::string&)>;");
            cpp("");
            cpp("int print_response(const grpc::Status& status, const google::protobuf::Message& response)");
            cpp("{{");
            cpp("if (!status.ok())");
            cpp("{{");
            cpp("std::cerr << \"rpc failed: \" << status.error_message() << std::endl;");
            cpp("return 1;");
            cpp("}}");
            cpp("std::string json;");
            cpp("auto json_status = google::protobuf::util::MessageToJsonString(response, &json);");
            cpp("if (!json_status.ok())");
            cpp("{{");
            cpp("std::cerr << \"cannot print response: \" << json_status.ToString() << std::endl;");
            cpp("return 1;");
            cpp("}}");
            cpp("std::cout << json << std::endl;");
            cpp("return 0;");
            cpp("}}");
            cpp("");
            for (auto* module : modules)
            {
                for (auto& rpc : module->rpcs)
                {
                    write_client_call(*module, rpc, cpp);
                }
            }
            cpp("const std::map<std::string, call_fn>& get_methods()");
            cpp("{{");
            cpp("static const std::map<std::string, call_fn> methods = {{");
            for (auto* module : modules)
            {
                for (auto& rpc : module->rpcs)
                {
                    cpp("{{\"{0}\", &call_{0}}},", rpc.name);
                }
            }
            cpp("}};");
            cpp("return methods;");
            cpp("}}");
            cpp("");
            cpp("void usage(const char* program)");
            cpp("{{");
            cpp("std::cerr << \"usage: \" << program << \" -target host:port -rpc method [-jsonin json]\" << std::endl;");
            cpp("std::cerr << \"{} methods:\" << std::endl;", prefix);
            cpp("for (auto& method : get_methods())");
            cpp("{{");
            cpp("std::cerr << \"  \" << method.first << std::endl;");
            cpp("}}");
            cpp("}}");
            cpp("}}");
            cpp("");
            cpp("int main(int argc, char* argv[])");
            cpp("{{");
            cpp("std::string target = \"localhost:8080\";");
            cpp("std::string rpc;");
            cpp("std::string json_in;");
            cpp("for (int i = 1; i + 1 < argc; i += 2)");
            cpp("{{");
            cpp("std::string flag = argv[i];");
            cpp("if (flag == \"-target\")");
            cpp("{{");
            cpp("target = argv[i + 1];");
            cpp("}}");
            cpp("else if (flag == \"-rpc\")");
            cpp("{{");
            cpp("rpc = argv[i + 1];");
            cpp("}}");
            cpp("else if (flag == \"-jsonin\")");
            cpp("{{");
            cpp("json_in = argv[i + 1];");
            cpp("}}");
            cpp("else");
            cpp("{{");
            cpp("usage(argv[0]);");
            cpp("return 2;");
            cpp("}}");
            cpp("}}");
            cpp("");
            cpp("auto method = get_methods().find(rpc);");
            cpp("if (method == get_methods().end())");
            cpp("{{");
            cpp("std::cerr << \"unknown method '\" << rpc << \"'\" << std::endl;");
            cpp("usage(argv[0]);");
            cpp("return 2;");
            cpp("}}");
            cpp("");
            cpp("auto channel = grpc::CreateChannel(target, grpc::InsecureChannelCredentials());");
            cpp("return method->second(channel, json_in);");
            cpp("}}");
        }
    }
}
