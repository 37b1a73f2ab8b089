#pragma once

#include <string>

#define TASKLIST_VERSION "0.3.1"
#define TASKLIST_SERVER_NAME "tasklist"
#define TASKLIST_MCP_PROTOCOL_VERSION "2024-11-05"

namespace tasklist {
namespace version {

// The server always answers with its own protocol revision; a mismatch is
// only worth a log line, the client decides whether to continue.
inline bool protocol_matches(const std::string& requested) {
    return requested == TASKLIST_MCP_PROTOCOL_VERSION;
}

} // namespace version
} // namespace tasklist
