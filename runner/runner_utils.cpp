#include "runner_utils.h"

#include "hive/log.h"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <thread>

namespace hive {

std::optional<std::string> arg_value(int argc, char** argv, int start, const std::string& flag) {
    for (int i = start; i + 1 < argc; i++) {
        if (flag == argv[i]) return std::string(argv[i + 1]);
    }
    return std::nullopt;
}

bool has_flag(int argc, char** argv, int start, const std::string& flag) {
    for (int i = start; i < argc; i++) {
        if (flag == argv[i]) return true;
    }
    return false;
}

std::vector<std::string> positional_args(int argc, char** argv, int start,
                                         const std::vector<std::string>& value_flags) {
    std::vector<std::string> out;
    for (int i = start; i < argc; i++) {
        std::string a = argv[i];
        if (a.size() > 2 && a.rfind("--", 0) == 0) {
            if (std::find(value_flags.begin(), value_flags.end(), a) != value_flags.end()) i++;
            continue;
        }
        out.push_back(a);
    }
    return out;
}

std::filesystem::path resolve_config_path(int argc, char** argv, int start) {
    if (auto v = arg_value(argc, argv, start, "--config")) return std::filesystem::absolute(*v);
    if (const char* e = std::getenv("HIVE_CONFIG")) {
        if (*e) return std::filesystem::absolute(e);
    }
    return std::filesystem::current_path() / "hive.json";
}

std::optional<SwarmConfig> load_config_or_report(int argc, char** argv, int start) {
    apply_profile_defaults(detect_profile());
    const auto path = resolve_config_path(argc, argv, start);
    try {
        return load_config(path);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return std::nullopt;
    }
}

std::vector<std::string> split_csv(const std::string& s) {
    std::vector<std::string> out;
    size_t pos = 0;
    while (pos <= s.size()) {
        size_t comma = s.find(',', pos);
        if (comma == std::string::npos) comma = s.size();
        std::string item = s.substr(pos, comma - pos);
        if (!item.empty()) out.push_back(item);
        pos = comma + 1;
    }
    return out;
}

std::string format_time(int64_t epoch_ms) {
    if (epoch_ms <= 0) return "-";
    std::time_t t = static_cast<std::time_t>(epoch_ms / 1000);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

void sleep_ms(int ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

} // namespace hive
