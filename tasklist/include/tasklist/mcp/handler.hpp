#pragma once
// MCP Handler: Central request handler for the task tools
//
// Takes one JSON-RPC message as text and returns the response text, or an
// empty string for notifications. Holds no state of its own besides the
// tool table, so one Handler may serve many threads at once; the store
// does its own locking.

#include "protocol.hpp"
#include "types.hpp"
#include "tools/tasks.hpp"
#include "../log.hpp"
#include "../task_store.hpp"
#include "../version.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tasklist::mcp {

using json = nlohmann::json;

// Usage text sent once per session in the initialize result
constexpr const char* SERVER_INSTRUCTIONS =
    "This is a todo server that helps you manage your todo list. "
    "Use list_todos to view all todos, create_todo to create new todos, "
    "update_todo to update existing todos, delete_todo to remove todos, "
    "get_todo to view todo details, and complete_todo to mark todos as completed.";

class Handler {
public:
    explicit Handler(std::shared_ptr<TaskStore> store)
        : store_(std::move(store)) {
        register_all_tools();
    }

    // Process a JSON-RPC request string, return response string.
    // Empty return means the message was a notification.
    std::string handle(const std::string& request_str) {
        json response;
        try {
            auto request = json::parse(request_str);
            response = handle_request(request);
            return response.is_null() ? std::string() : response.dump();
        } catch (const json::parse_error& e) {
            log_warn("rpc", "parse error: %s", e.what());
            response = make_error(json(), error::PARSE_ERROR,
                                  std::string("JSON parse error: ") + e.what());
        } catch (const std::exception& e) {
            log_error("rpc", "internal error: %s", e.what());
            response = make_error(json(), error::INTERNAL_ERROR,
                                  std::string("Internal error: ") + e.what());
        }
        return response.dump();
    }

    json server_info() const {
        return {
            {"protocolVersion", TASKLIST_MCP_PROTOCOL_VERSION},
            {"capabilities", {
                {"tools", json::object()}
            }},
            {"serverInfo", {
                {"name", TASKLIST_SERVER_NAME},
                {"version", TASKLIST_VERSION}
            }},
            {"instructions", SERVER_INSTRUCTIONS}
        };
    }

private:
    std::shared_ptr<TaskStore> store_;
    std::vector<ToolSchema> tools_;
    std::unordered_map<std::string, ToolHandler> handlers_;

    void register_all_tools() {
        tools::tasks::register_schemas(tools_);
        tools::tasks::register_handlers(store_.get(), handlers_);
    }

    // ═══════════════════════════════════════════════════════════════════
    // JSON-RPC dispatch
    // ═══════════════════════════════════════════════════════════════════

    // Returns null for notifications (nothing goes back on the wire)
    json handle_request(const json& request) {
        std::string error_msg;
        if (!validate_request(request, error_msg)) {
            json id = request.is_object() ? request.value("id", json()) : json();
            if (!valid_id(id)) {
                id = json();
            }
            return make_error(id, error::INVALID_REQUEST, error_msg);
        }

        auto info = parse_request(request);
        auto start = std::chrono::steady_clock::now();

        json response;
        if (info.is_notification) {
            log_debug("rpc", "notification %s", info.method.c_str());
            return json();
        } else if (info.method == "initialize") {
            response = handle_initialize(info.params, info.id);
        } else if (info.method == "ping") {
            response = make_result(info.id, json::object());
        } else if (info.method == "tools/list") {
            response = handle_tools_list(info.id);
        } else if (info.method == "tools/call") {
            response = handle_tools_call(info.params, info.id);
        } else {
            response = make_error(info.id, error::METHOD_NOT_FOUND,
                                  "Unknown method: " + info.method);
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start).count();
        log_debug("rpc", "method=%s id=%s handled in %lldus",
                  info.method.c_str(), info.id.dump().c_str(),
                  static_cast<long long>(elapsed));
        return response;
    }

    json handle_initialize(const json& params, const json& id) {
        std::string requested;
        if (params.is_object() && params.contains("protocolVersion") &&
            params["protocolVersion"].is_string()) {
            requested = params["protocolVersion"].get<std::string>();
        }
        if (!requested.empty() && !version::protocol_matches(requested)) {
            log_info("rpc", "client requested protocol %s, answering with %s",
                     requested.c_str(), TASKLIST_MCP_PROTOCOL_VERSION);
        }
        return make_result(id, server_info());
    }

    json handle_tools_list(const json& id) {
        json tools_array = json::array();
        for (const auto& tool : tools_) {
            tools_array.push_back({
                {"name", tool.name},
                {"description", tool.description},
                {"inputSchema", tool.input_schema}
            });
        }
        return make_result(id, {{"tools", tools_array}});
    }

    json handle_tools_call(const json& params, const json& id) {
        if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
            return make_error(id, error::INVALID_PARAMS, "Missing tool name");
        }

        std::string name = params["name"];
        json arguments = params.value("arguments", json::object());
        if (arguments.is_null()) {
            arguments = json::object();
        }

        auto it = handlers_.find(name);
        if (it == handlers_.end()) {
            return make_error(id, error::TOOL_NOT_FOUND, "Unknown tool: " + name);
        }

        try {
            ToolResult result = it->second(arguments);
            if (!result.ok()) {
                return make_error(id, result.error_code, result.content, result.error_data);
            }
            return make_result(id, make_tool_response(result.content));
        } catch (const std::exception& e) {
            log_error("rpc", "tool %s threw: %s", name.c_str(), e.what());
            return make_error(id, error::TOOL_EXECUTION_ERROR,
                              std::string("Tool execution failed: ") + e.what());
        }
    }
};

} // namespace tasklist::mcp
