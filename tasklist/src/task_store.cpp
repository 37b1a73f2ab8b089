#include <tasklist/task_store.hpp>
#include <algorithm>

namespace tasklist {

std::vector<TaskRecord> TaskStore::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_;
}

TaskRecord TaskStore::create(std::string title, std::optional<std::string> description) {
    std::lock_guard<std::mutex> lock(mutex_);

    TaskRecord task;
    task.id = mint_id_locked();
    task.title = std::move(title);
    task.description = std::move(description);
    task.completed = false;
    task.created_at = now();
    task.updated_at = task.created_at;

    tasks_.push_back(task);
    return task;
}

StoreResult<TaskRecord> TaskStore::update(const std::string& id, const TaskPatch& patch) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = find_locked(id);
    if (it == tasks_.end()) {
        return StoreError::not_found(id);
    }

    if (patch.title) {
        it->title = *patch.title;
    }
    if (patch.description) {
        it->description = *patch.description;
    }
    if (patch.completed) {
        it->completed = *patch.completed;
    }
    it->updated_at = advance_timestamp(it->updated_at);

    return *it;
}

StoreResult<std::string> TaskStore::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = find_locked(id);
    if (it == tasks_.end()) {
        return StoreError::not_found(id);
    }

    std::string removed = it->id;
    tasks_.erase(it);
    return removed;
}

StoreResult<TaskRecord> TaskStore::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = find_locked(id);
    if (it == tasks_.end()) {
        return StoreError::not_found(id);
    }
    return *it;
}

StoreResult<TaskRecord> TaskStore::complete(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = find_locked(id);
    if (it == tasks_.end()) {
        return StoreError::not_found(id);
    }

    it->completed = true;
    it->updated_at = advance_timestamp(it->updated_at);
    return *it;
}

size_t TaskStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

std::vector<TaskRecord>::iterator TaskStore::find_locked(const std::string& id) {
    return std::find_if(tasks_.begin(), tasks_.end(),
                        [&id](const TaskRecord& t) { return t.id == id; });
}

std::vector<TaskRecord>::const_iterator TaskStore::find_locked(const std::string& id) const {
    return std::find_if(tasks_.begin(), tasks_.end(),
                        [&id](const TaskRecord& t) { return t.id == id; });
}

std::string TaskStore::mint_id_locked() {
    // Live ids are unique even on a (122-bit) random clash
    std::string id = ids_();
    while (find_locked(id) != tasks_.end()) {
        id = ids_();
    }
    return id;
}

} // namespace tasklist
