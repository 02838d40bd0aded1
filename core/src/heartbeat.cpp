#include "hive/heartbeat.h"
#include "hive/json_util.h"

namespace hive {

std::string write_heartbeat(const std::filesystem::path& dir, const std::string& agent_id,
                            const std::string& state, int64_t ts) {
    json::Doc d = json::new_object();
    json::put_string(d.root, "agent_id", agent_id);
    json::put_string(d.root, "state", state);
    json::put_int(d.root, "ts", ts);
    return json::write_atomic(dir / (agent_id + ".json"), json::dump(d.root) + "\n");
}

std::optional<Heartbeat> read_heartbeat(const std::filesystem::path& dir, const std::string& agent_id) {
    bool missing = false;
    json::Doc d = json::load_file(dir / (agent_id + ".json"), &missing);
    if (missing || !d || !json::is_object(d.root)) return std::nullopt;
    Heartbeat hb;
    hb.agent_id = json::get_string(d.root, "agent_id", agent_id);
    hb.state = json::get_string(d.root, "state");
    hb.ts = json::get_int(d.root, "ts");
    return hb;
}

} // namespace hive
