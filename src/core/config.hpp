#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

namespace kmp {

/// Run-time settings. Read from the environment, then overridden by CLI flags.
struct Config {
    /// Engine names ("zstd", "lz4", ...) to treat as unavailable.
    std::vector<std::string> disabled_engines;
    std::optional<spdlog::level::level_enum> log_level;
};

/// Environment variable holding a comma-separated list of engines to disable.
inline constexpr const char* kDisableEnginesEnv = "KOMPRESS_DISABLE_ENGINES";
/// Environment variable holding the log level name.
inline constexpr const char* kLogLevelEnv = "KOMPRESS_LOG_LEVEL";

/// Build a Config from raw setting values (either may be null).
Config parse_config(const char* disable_engines, const char* log_level);

/// Build a Config from KOMPRESS_DISABLE_ENGINES / KOMPRESS_LOG_LEVEL.
Config load_config_from_env();

/// Split "a, b,,c" into {"a", "b", "c"}, lowercased and trimmed.
std::vector<std::string> split_list(std::string_view list);

/// Parse a level name; nullopt when the name is not a spdlog level.
std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name);

} // namespace kmp
