#pragma once

#include "hive/ids.h"

#include <filesystem>
#include <optional>
#include <string>

namespace hive {

struct Heartbeat {
    std::string agent_id;
    std::string state;  // "idle" | "working" | "reviewing" | "stopped"
    int64_t ts{0};
};

// heartbeats/<id>.json, rewritten atomically on every task event.
std::string write_heartbeat(const std::filesystem::path& dir, const std::string& agent_id,
                            const std::string& state, int64_t ts);

std::optional<Heartbeat> read_heartbeat(const std::filesystem::path& dir, const std::string& agent_id);

} // namespace hive
