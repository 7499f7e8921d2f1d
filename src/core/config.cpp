#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace kmp {

std::vector<std::string> split_list(std::string_view list) {
    std::vector<std::string> items;
    size_t start = 0;
    while (start <= list.size()) {
        auto comma = list.find(',', start);
        if (comma == std::string_view::npos) comma = list.size();

        std::string item(list.substr(start, comma - start));
        // Trim
        auto not_space = [](unsigned char c) { return !std::isspace(c); };
        item.erase(item.begin(),
                   std::find_if(item.begin(), item.end(), not_space));
        item.erase(std::find_if(item.rbegin(), item.rend(), not_space).base(),
                   item.end());
        std::transform(item.begin(), item.end(), item.begin(),
                       [](unsigned char c) { return std::tolower(c); });

        if (!item.empty()) items.push_back(std::move(item));
        start = comma + 1;
    }
    return items;
}

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    // spdlog maps unknown names to "off", so check that one explicitly
    auto level = spdlog::level::from_str(lower);
    if (level == spdlog::level::off && lower != "off") {
        return std::nullopt;
    }
    return level;
}

Config parse_config(const char* disable_engines, const char* log_level) {
    Config config;
    if (disable_engines) {
        config.disabled_engines = split_list(disable_engines);
    }
    if (log_level && *log_level) {
        config.log_level = parse_log_level(log_level);
        if (!config.log_level) {
            spdlog::warn("Ignoring unknown log level '{}' in {}", log_level,
                         kLogLevelEnv);
        }
    }
    return config;
}

Config load_config_from_env() {
    return parse_config(std::getenv(kDisableEnginesEnv),
                        std::getenv(kLogLevelEnv));
}

} // namespace kmp
