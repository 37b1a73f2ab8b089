#pragma once
// MCP Protocol: JSON-RPC 2.0 helpers and error codes
//
// Provides utilities for building JSON-RPC requests and responses
// compliant with the Model Context Protocol specification.

#include <nlohmann/json.hpp>
#include <string>

namespace tasklist::mcp {

using json = nlohmann::json;

// JSON-RPC 2.0 error codes
namespace error {
    constexpr int PARSE_ERROR = -32700;
    constexpr int INVALID_REQUEST = -32600;
    constexpr int METHOD_NOT_FOUND = -32601;
    constexpr int INVALID_PARAMS = -32602;
    constexpr int INTERNAL_ERROR = -32603;
    // MCP-specific errors
    constexpr int TOOL_NOT_FOUND = -32001;
    constexpr int TOOL_EXECUTION_ERROR = -32002;
}

// Build a JSON-RPC 2.0 success response
inline json make_result(const json& id, const json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

// Build a JSON-RPC 2.0 error response; `data` is omitted when null
inline json make_error(const json& id, int code, const std::string& message,
                       const json& data = json()) {
    json err = {
        {"code", code},
        {"message", message}
    };
    if (!data.is_null()) {
        err["data"] = data;
    }
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", err}
    };
}

// Build a tool call response (MCP content format)
inline json make_tool_response(const std::string& text, bool is_error = false) {
    json content = json::array();
    content.push_back({
        {"type", "text"},
        {"text", text}
    });

    return {
        {"content", content},
        {"isError", is_error}
    };
}

// JSON-RPC 2.0 ids are strings, numbers or null
inline bool valid_id(const json& id) {
    return id.is_string() || id.is_number() || id.is_null();
}

// Validate JSON-RPC 2.0 request
inline bool validate_request(const json& request, std::string& error_msg) {
    if (!request.is_object()) {
        error_msg = "Request must be a JSON object";
        return false;
    }
    if (!request.contains("jsonrpc") || request["jsonrpc"] != "2.0") {
        error_msg = "Missing or invalid jsonrpc version";
        return false;
    }
    if (!request.contains("method") || !request["method"].is_string()) {
        error_msg = "Missing or invalid method";
        return false;
    }
    if (request.contains("id") && !valid_id(request["id"])) {
        error_msg = "Request id must be a string, number or null";
        return false;
    }
    return true;
}

// Extract request components
struct RequestInfo {
    std::string method;
    json params;
    json id;
    bool is_notification = false;
};

inline RequestInfo parse_request(const json& request) {
    return {
        request["method"].get<std::string>(),
        request.value("params", json::object()),
        request.value("id", json()),
        !request.contains("id")
    };
}

} // namespace tasklist::mcp
