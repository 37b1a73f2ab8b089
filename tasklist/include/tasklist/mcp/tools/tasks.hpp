#pragma once
// MCP Task Tools: list_todos, create_todo, update_todo, delete_todo,
//                 get_todo, complete_todo
//
// Pure translation between tool arguments and TaskStore calls. Store
// outcomes pass through unchanged in category; only their shape changes:
//   NotFound       -> INVALID_PARAMS  with {"id": ...}
//   InternalFailure -> INTERNAL_ERROR with {"error": ...}

#include "../types.hpp"
#include "../../log.hpp"
#include "../../task_store.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tasklist::mcp::tools::tasks {

using json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════
// Argument decoding
// Each reader returns an empty string on success, else the error message.
// JSON null for an optional field means "not given".
// ═══════════════════════════════════════════════════════════════════

inline std::string read_string(const json& args, const char* key, std::string& out) {
    if (!args.is_object() || !args.contains(key) || args[key].is_null()) {
        return std::string("Missing required parameter: ") + key;
    }
    if (!args[key].is_string()) {
        return std::string("Invalid parameter type: ") + key;
    }
    out = args[key].get<std::string>();
    return "";
}

inline std::string read_optional_string(const json& args, const char* key,
                                        std::optional<std::string>& out) {
    if (!args.is_object() || !args.contains(key) || args[key].is_null()) {
        return "";
    }
    if (!args[key].is_string()) {
        return std::string("Invalid parameter type: ") + key;
    }
    out = args[key].get<std::string>();
    return "";
}

inline std::string read_optional_bool(const json& args, const char* key,
                                      std::optional<bool>& out) {
    if (!args.is_object() || !args.contains(key) || args[key].is_null()) {
        return "";
    }
    if (!args[key].is_boolean()) {
        return std::string("Invalid parameter type: ") + key;
    }
    out = args[key].get<bool>();
    return "";
}

// ═══════════════════════════════════════════════════════════════════
// Outcome shaping
// ═══════════════════════════════════════════════════════════════════

inline ToolResult from_store_error(const StoreError& err) {
    json data = json::object();
    for (const auto& [key, value] : err.context) {
        data[key] = value;
    }

    switch (err.category) {
        case StoreErrc::NotFound:
            return ToolResult::invalid_params(err.message, data);
        case StoreErrc::InternalFailure:
            return ToolResult::internal_error(err.message, data);
    }
    return ToolResult::internal_error(err.message, data);
}

// Pretty JSON text. dump() throws type_error on strings that are not
// valid UTF-8; that surfaces as INTERNAL_ERROR, not as a bad request.
template<typename T>
inline ToolResult render(const T& value) {
    try {
        json j = value;
        return ToolResult::success(j.dump(2));
    } catch (const json::exception& e) {
        log_error("tasks", "serialization failed: %s", e.what());
        return from_store_error(StoreError::serialization_failed(e.what()));
    }
}

template<typename T>
inline ToolResult render(const StoreResult<T>& result) {
    if (!result) {
        log_debug("tasks", "%s: %s", store_errc_name(result.error().category),
                  result.error().message.c_str());
        return from_store_error(result.error());
    }
    return render(result.value());
}

// ═══════════════════════════════════════════════════════════════════
// Tool schemas
// ═══════════════════════════════════════════════════════════════════

inline json id_schema() {
    return {
        {"type", "object"},
        {"properties", {
            {"id", {{"type", "string"}, {"description", "Todo item ID"}}}
        }},
        {"required", {"id"}}
    };
}

inline void register_schemas(std::vector<ToolSchema>& tools) {
    tools.push_back({
        "list_todos",
        "List all todo items",
        {
            {"type", "object"},
            {"properties", json::object()}
        }
    });

    tools.push_back({
        "create_todo",
        "Create a new todo item",
        {
            {"type", "object"},
            {"properties", {
                {"title", {{"type", "string"}}},
                {"description", {{"type", {"string", "null"}}}}
            }},
            {"required", {"title"}}
        }
    });

    tools.push_back({
        "update_todo",
        "Update a todo item",
        {
            {"type", "object"},
            {"properties", {
                {"id", {{"type", "string"}}},
                {"title", {{"type", {"string", "null"}}}},
                {"description", {{"type", {"string", "null"}}}},
                {"completed", {{"type", {"boolean", "null"}}}}
            }},
            {"required", {"id"}}
        }
    });

    tools.push_back({"delete_todo", "Delete a todo item", id_schema()});
    tools.push_back({"get_todo", "Get details of a single todo item", id_schema()});
    tools.push_back({"complete_todo", "Mark a todo item as completed", id_schema()});
}

// ═══════════════════════════════════════════════════════════════════
// Tool implementations
// ═══════════════════════════════════════════════════════════════════

inline ToolResult list_todos(TaskStore* store, const json& /*params*/) {
    return render(store->list());
}

inline ToolResult create_todo(TaskStore* store, const json& params) {
    std::string title;
    std::optional<std::string> description;

    std::string err = read_string(params, "title", title);
    if (err.empty()) err = read_optional_string(params, "description", description);
    if (!err.empty()) {
        return ToolResult::invalid_params(err);
    }

    TaskRecord task = store->create(std::move(title), std::move(description));
    log_debug("tasks", "created %s", task.id.c_str());
    return render(task);
}

inline ToolResult update_todo(TaskStore* store, const json& params) {
    std::string id;
    TaskPatch patch;

    std::string err = read_string(params, "id", id);
    if (err.empty()) err = read_optional_string(params, "title", patch.title);
    if (err.empty()) err = read_optional_string(params, "description", patch.description);
    if (err.empty()) err = read_optional_bool(params, "completed", patch.completed);
    if (!err.empty()) {
        return ToolResult::invalid_params(err);
    }

    if (patch.empty()) {
        log_debug("tasks", "update %s carries no fields, refreshing updated_at only", id.c_str());
    }
    return render(store->update(id, patch));
}

inline ToolResult delete_todo(TaskStore* store, const json& params) {
    std::string id;
    std::string err = read_string(params, "id", id);
    if (!err.empty()) {
        return ToolResult::invalid_params(err);
    }

    auto removed = store->remove(id);
    if (!removed) {
        return from_store_error(removed.error());
    }

    log_debug("tasks", "deleted %s", removed.value().c_str());
    return ToolResult::success("Successfully deleted todo item with ID " + removed.value());
}

inline ToolResult get_todo(TaskStore* store, const json& params) {
    std::string id;
    std::string err = read_string(params, "id", id);
    if (!err.empty()) {
        return ToolResult::invalid_params(err);
    }
    return render(store->get(id));
}

inline ToolResult complete_todo(TaskStore* store, const json& params) {
    std::string id;
    std::string err = read_string(params, "id", id);
    if (!err.empty()) {
        return ToolResult::invalid_params(err);
    }
    return render(store->complete(id));
}

inline void register_handlers(TaskStore* store,
                              std::unordered_map<std::string, ToolHandler>& handlers) {
    handlers["list_todos"] = [store](const json& p) { return list_todos(store, p); };
    handlers["create_todo"] = [store](const json& p) { return create_todo(store, p); };
    handlers["update_todo"] = [store](const json& p) { return update_todo(store, p); };
    handlers["delete_todo"] = [store](const json& p) { return delete_todo(store, p); };
    handlers["get_todo"] = [store](const json& p) { return get_todo(store, p); };
    handlers["complete_todo"] = [store](const json& p) { return complete_todo(store, p); };
}

} // namespace tasklist::mcp::tools::tasks
