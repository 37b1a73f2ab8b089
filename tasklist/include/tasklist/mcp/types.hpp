#pragma once
// MCP Types: Tool schema and result types
//
// Defines the data structures used for MCP tool registration
// and execution results.

#include <tasklist/mcp/protocol.hpp>
#include <nlohmann/json.hpp>
#include <functional>
#include <string>

namespace tasklist::mcp {

using json = nlohmann::json;

// Tool schema definition for MCP tools/list
struct ToolSchema {
    std::string name;
    std::string description;
    json input_schema;
};

// Tool execution result.
// A failed call carries a JSON-RPC error code and structured data;
// the handler turns it into an error response rather than tool content.
struct ToolResult {
    int error_code = 0;
    std::string content;      // Text payload, or the error message
    json error_data;          // e.g. {"id": "..."} or {"error": "..."}

    bool ok() const { return error_code == 0; }

    static ToolResult success(const std::string& text) {
        return {0, text, json()};
    }

    static ToolResult invalid_params(const std::string& message, const json& data = json()) {
        return {error::INVALID_PARAMS, message, data};
    }

    static ToolResult internal_error(const std::string& message, const json& data = json()) {
        return {error::INTERNAL_ERROR, message, data};
    }
};

// Tool handler function type
using ToolHandler = std::function<ToolResult(const json&)>;

} // namespace tasklist::mcp
