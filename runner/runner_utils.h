#pragma once

#include "hive/config.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace hive {

// ---- Argument helpers shared by the subcommands ----

// Value following `flag` in argv[start..], if present.
std::optional<std::string> arg_value(int argc, char** argv, int start, const std::string& flag);
bool has_flag(int argc, char** argv, int start, const std::string& flag);

// Positional arguments (anything not a flag or a flag's value) from argv[start..].
// `value_flags` lists flags that consume the next argument.
std::vector<std::string> positional_args(int argc, char** argv, int start,
                                         const std::vector<std::string>& value_flags);

// --config, then HIVE_CONFIG, then ./hive.json.
std::filesystem::path resolve_config_path(int argc, char** argv, int start);

// Applies profile defaults and loads the config. Prints the error and
// returns nullopt when the config cannot be loaded.
std::optional<SwarmConfig> load_config_or_report(int argc, char** argv, int start);

std::vector<std::string> split_csv(const std::string& s);
std::string format_time(int64_t epoch_ms);

void sleep_ms(int ms);

} // namespace hive
