#pragma once
// Core types: task records and the values they are built from
//
// A record is plain data. The store hands out copies, never references,
// so everything here is cheap to copy and safe to pass across threads.

#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <optional>
#include <random>
#include <string>

namespace tasklist {

using json = nlohmann::json;

// Timestamp as Unix micros (UTC)
using Timestamp = int64_t;

// Current time as Timestamp
inline Timestamp now() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::microseconds>(duration).count();
}

// RFC 3339, microsecond precision: 2026-10-18T09:15:02.123456Z
inline std::string format_timestamp(Timestamp ts) {
    int64_t secs = ts / 1000000;
    int64_t micros = ts % 1000000;
    if (micros < 0) {
        micros += 1000000;
        secs -= 1;
    }

    std::time_t t = static_cast<std::time_t>(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);

    char date_buf[32];
    std::strftime(date_buf, sizeof(date_buf), "%Y-%m-%dT%H:%M:%S", &tm);

    char buf[48];
    snprintf(buf, sizeof(buf), "%s.%06lldZ", date_buf, static_cast<long long>(micros));
    return buf;
}

// Next updated_at for a record last touched at `previous`.
// Never goes backwards, and always moves at least one microsecond.
inline Timestamp advance_timestamp(Timestamp previous) {
    return std::max(now(), previous + 1);
}

// Random version-4 UUID source.
// Not thread-safe: owners call it under their own lock.
class IdGenerator {
public:
    IdGenerator() : gen_(std::random_device{}()) {}
    explicit IdGenerator(uint64_t seed) : gen_(seed) {}

    std::string next() {
        uint64_t high = dis_(gen_);
        uint64_t low = dis_(gen_);

        // version 4, variant 10xx
        high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
        low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

        char buf[37];
        snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                 (uint32_t)(high >> 32),
                 (uint16_t)(high >> 16),
                 (uint16_t)high,
                 (uint16_t)(low >> 48),
                 (unsigned long long)(low & 0xFFFFFFFFFFFFULL));
        return buf;
    }

private:
    std::mt19937_64 gen_;
    std::uniform_int_distribution<uint64_t> dis_;
};

// A single todo item
struct TaskRecord {
    std::string id;
    std::string title;
    std::optional<std::string> description;
    bool completed = false;
    Timestamp created_at = 0;
    Timestamp updated_at = 0;
};

// Partial update: only the fields that are set get written.
// There is no way to clear a description, only to replace it.
struct TaskPatch {
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::optional<bool> completed;

    bool empty() const {
        return !title && !description && !completed;
    }
};

inline void to_json(json& j, const TaskRecord& task) {
    j = json{
        {"id", task.id},
        {"title", task.title},
        {"description", task.description ? json(*task.description) : json(nullptr)},
        {"completed", task.completed},
        {"created_at", format_timestamp(task.created_at)},
        {"updated_at", format_timestamp(task.updated_at)}
    };
}

} // namespace tasklist
