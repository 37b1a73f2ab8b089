#pragma once
// TaskStore: the authoritative, process-scoped collection of todo items
//
// One mutex guards the whole collection. Every operation, reads included,
// holds it for its entire body and returns copies, so no caller ever sees
// a record outside the store's serialized access path.
//
// Records are kept in creation order; deletes don't reorder the rest.

#include <tasklist/types.hpp>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tasklist {

enum class StoreErrc {
    NotFound,
    InternalFailure
};

inline const char* store_errc_name(StoreErrc errc) {
    switch (errc) {
        case StoreErrc::NotFound: return "not_found";
        case StoreErrc::InternalFailure: return "internal_failure";
    }
    return "unknown";
}

// Tagged error with structured context (e.g. {"id": "..."})
struct StoreError {
    StoreErrc category = StoreErrc::InternalFailure;
    std::string message;
    std::map<std::string, std::string> context;

    static StoreError not_found(const std::string& id) {
        return {StoreErrc::NotFound, "Todo item with specified ID not found", {{"id", id}}};
    }

    // A result that exists but cannot be rendered for the caller
    static StoreError serialization_failed(const std::string& what) {
        return {StoreErrc::InternalFailure, "Serialization failed", {{"error", what}}};
    }
};

// Either a value or a StoreError
template<typename T>
class StoreResult {
public:
    StoreResult(T value) : data_(std::move(value)) {}
    StoreResult(StoreError error) : data_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    const T& value() const { return std::get<T>(data_); }
    T& value() { return std::get<T>(data_); }
    const StoreError& error() const { return std::get<StoreError>(data_); }

private:
    std::variant<T, StoreError> data_;
};

// Source of candidate ids; called with the store lock held
using IdSource = std::function<std::string()>;

class TaskStore {
public:
    // Random version-4 UUIDs
    TaskStore()
        : ids_([gen = std::make_shared<IdGenerator>()] { return gen->next(); }) {}

    explicit TaskStore(IdSource ids) : ids_(std::move(ids)) {}

    // One store per process, shared by handle; never copied
    TaskStore(const TaskStore&) = delete;
    TaskStore& operator=(const TaskStore&) = delete;

    // All records, in creation order
    std::vector<TaskRecord> list() const;

    // Always succeeds; each call mints a fresh id
    TaskRecord create(std::string title, std::optional<std::string> description = std::nullopt);

    StoreResult<TaskRecord> update(const std::string& id, const TaskPatch& patch);

    // Returns the removed id
    StoreResult<std::string> remove(const std::string& id);

    StoreResult<TaskRecord> get(const std::string& id) const;

    StoreResult<TaskRecord> complete(const std::string& id);

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<TaskRecord> tasks_;
    IdSource ids_;

    // Caller holds mutex_
    std::vector<TaskRecord>::iterator find_locked(const std::string& id);
    std::vector<TaskRecord>::const_iterator find_locked(const std::string& id) const;
    std::string mint_id_locked();
};

} // namespace tasklist
