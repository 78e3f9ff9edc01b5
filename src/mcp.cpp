#include "runbox/mcp.hpp"

#include "runbox/format.hpp"

#include <glaze/ext/jsonrpc.hpp>
#include <glaze/glaze.hpp>

#include <csignal>
#include <iostream>
#include <string>
#include <vector>

using namespace runbox::literals;

namespace runbox::mcp {

    namespace detail {

        // ── MCP protocol types ──────────────────────────────────────────

        struct client_info {
            std::string name{};
            std::string version{};
            struct glaze {
                using T = client_info;
                static constexpr auto value = glz::object(&T::name, &T::version);
            };
        };

        struct initialize_params {
            std::string protocolVersion{};
            client_info clientInfo{};
            struct glaze {
                using T = initialize_params;
                static constexpr auto value =
                        glz::object("protocolVersion", &T::protocolVersion, "clientInfo", &T::clientInfo);
            };
        };

        struct server_info {
            std::string name{};
            std::string version{};
            struct glaze {
                using T = server_info;
                static constexpr auto value = glz::object(&T::name, &T::version);
            };
        };

        struct tools_capability {
            struct glaze {
                using T = tools_capability;
                static constexpr auto value = glz::object();
            };
        };

        struct server_capabilities {
            tools_capability tools{};
            struct glaze {
                using T = server_capabilities;
                static constexpr auto value = glz::object(&T::tools);
            };
        };

        struct initialize_result {
            std::string protocolVersion{};
            server_capabilities capabilities{};
            server_info serverInfo{};
            struct glaze {
                using T = initialize_result;
                static constexpr auto value = glz::object(
                        "protocolVersion",
                        &T::protocolVersion,
                        "capabilities",
                        &T::capabilities,
                        "serverInfo",
                        &T::serverInfo);
            };
        };

        struct tool_definition {
            std::string name{};
            std::string description{};
            glz::raw_json inputSchema{};
            struct glaze {
                using T = tool_definition;
                static constexpr auto value = glz::object(&T::name, &T::description, "inputSchema", &T::inputSchema);
            };
        };

        struct tools_list_result {
            std::vector<tool_definition> tools{};
            struct glaze {
                using T = tools_list_result;
                static constexpr auto value = glz::object(&T::tools);
            };
        };

        struct tool_call_params {
            std::string name{};
            glz::raw_json arguments{};
            struct glaze {
                using T = tool_call_params;
                static constexpr auto value = glz::object(&T::name, &T::arguments);
            };
        };

        struct text_content {
            std::string type{"text"};
            std::string text{};
            struct glaze {
                using T = text_content;
                static constexpr auto value = glz::object(&T::type, &T::text);
            };
        };

        struct tool_call_result {
            std::vector<text_content> content{};
            bool isError{false};
            struct glaze {
                using T = tool_call_result;
                static constexpr auto value = glz::object(&T::content, "isError", &T::isError);
            };
        };

        // ── Tool schema ─────────────────────────────────────────────────

        static constexpr auto execute_description =
                R"(Run a JavaScript or Python snippet in an isolated runtime. Placeholders <variable.name>, {{ENV}} and <block.path> are substituted before execution. The response carries the returned value, captured stdout and, on failure, the error location in the submitted snippet.)";
        static constexpr auto execute_input_schema =
                R"json({"type": "object","properties": {"code": {"type": "string","description": "Function body to execute; its return value is the result"},"language": {"type": "string","enum": ["javascript","python"],"default": "javascript"},"params": {"type": "object","description": "Values available as `params` and {{name}} placeholders"},"envVars": {"type": "object","additionalProperties": {"type": "string"}},"timeout": {"type": "number","description": "Timeout in milliseconds"},"blockData": {"type": "object"},"blockNameMapping": {"type": "object","additionalProperties": {"type": "string"}},"blockOutputSchemas": {"type": "object"},"workflowVariables": {"type": "object"},"workflowId": {"type": "string"},"isCustomTool": {"type": "boolean","default": false}},"required": ["code"]})json"sv;

        // ── Response helpers ────────────────────────────────────────────

        template <typename T>
        static std::string make_response(const glz::rpc::id_t& id, T&& result) {
            glz::rpc::response_t<std::decay_t<T>> resp{};
            resp.id = id;
            resp.result = std::forward<T>(result);
            std::string json{};
            (void)glz::write_json(resp, json);
            return json;
        }

        static std::string make_error_response(
                const glz::rpc::id_t& id, glz::rpc::error_e code, const std::string& message) {
            glz::rpc::response_t<glz::raw_json> resp{};
            resp.id = id;
            resp.error = glz::rpc::error{code, std::nullopt, message};
            std::string json{};
            (void)glz::write_json(resp, json);
            return json;
        }

        // ── Handlers ────────────────────────────────────────────────────

        static std::string handle_initialize(const glz::rpc::id_t& id, glz::raw_json_view raw_params) {
            initialize_params params{};
            (void)glz::read<glz::opts{.error_on_unknown_keys = false}>(params, std::string{raw_params.str});
            if (!params.clientInfo.name.empty()) {
                log_info("client connected: ", params.clientInfo.name, " ", params.clientInfo.version);
            }

            initialize_result result{};
            result.protocolVersion = std::string{protocol_version};
            result.capabilities = server_capabilities{};
            result.serverInfo = server_info{.name = "runbox", .version = "0.1.0"};

            return make_response(id, std::move(result));
        }

        static std::string handle_tools_list(const glz::rpc::id_t& id) {
            tools_list_result result{};
            result.tools.push_back(
                    tool_definition{
                            .name = std::string{execute_tool_name},
                            .description = execute_description,
                            .inputSchema = glz::raw_json{execute_input_schema},
                    });

            return make_response(id, std::move(result));
        }

        static std::string handle_execute(
                const glz::rpc::id_t& id, const glz::raw_json& raw_arguments, const execution_service& service) {
            auto arguments = parse_json(raw_arguments.str);
            if (!arguments || !as_object(*arguments)) {
                return make_error_response(
                        id, glz::rpc::error_e::invalid_params, "execute_code arguments must be an object");
            }

            execution_outcome outcome{};
            try {
                outcome = service.execute(request_from_value(*arguments));
            } catch (const execution_error& e) {
                outcome = make_failure(e.kind(), e.what());
            }

            tool_call_result result{};
            result.content.push_back(
                    text_content{.text = render_response(outcome, service.config().output)});
            result.isError = !succeeded(outcome);
            return make_response(id, std::move(result));
        }

        static std::string handle_tools_call(
                const glz::rpc::id_t& id, glz::raw_json_view raw_params, const execution_service& service) {
            tool_call_params params{};
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(params, std::string{raw_params.str});
            if (ec) {
                return make_error_response(id, glz::rpc::error_e::invalid_params, "Failed to parse tool call params");
            }

            if (params.name == execute_tool_name) {
                return handle_execute(id, params.arguments, service);
            }

            return make_error_response(id, glz::rpc::error_e::invalid_params, "Unknown tool: {}"_format(params.name));
        }

    }  // namespace detail

    std::optional<std::string> handle_message(const execution_service& service, std::string_view line) {
        // request fields are views into this buffer
        std::string buffer{line};
        glz::rpc::generic_request_t request{};
        auto ec = glz::read_json(request, buffer);
        if (ec) {
            return detail::make_error_response({}, glz::rpc::error_e::parse_error, "JSON parse error");
        }

        bool is_notification = std::holds_alternative<glz::generic::null_t>(request.id);

        if (request.method == "initialize"sv) {
            return detail::handle_initialize(request.id, request.params);
        }
        if (request.method == "notifications/initialized"sv || request.method == "notifications/cancelled"sv) {
            return std::nullopt;
        }
        if (request.method == "ping"sv) {
            return detail::make_response(request.id, glz::generic::object_t{});
        }
        if (request.method == "tools/list"sv) {
            return detail::handle_tools_list(request.id);
        }
        if (request.method == "tools/call"sv) {
            return detail::handle_tools_call(request.id, request.params, service);
        }
        if (is_notification) {
            return std::nullopt;
        }
        return detail::make_error_response(
                request.id,
                glz::rpc::error_e::method_not_found,
                "Unknown method: {}"_format(std::string{request.method}));
    }

    // ── Server entry point ──────────────────────────────────────────

    int run_server(const execution_service& service, std::istream& in, std::ostream& out) {
        ::signal(SIGPIPE, SIG_IGN);

        std::string line{};
        while (std::getline(in, line)) {
            if (utils::trim_ascii(line).empty()) {
                continue;
            }
            if (auto reply = handle_message(service, line)) {
                out << *reply << '\n';
                out.flush();
            }
        }
        return 0;
    }

}  // namespace runbox::mcp
