#include "core/log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace kmp::log {

void init(spdlog::level::level_enum level,
          const std::optional<std::filesystem::path>& log_file) {
    // Diagnostics go to stderr so `kompress cat` output stays clean.
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (log_file) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            log_file->string(), true));
    }

    auto logger = std::make_shared<spdlog::logger>(
        "kompress", sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    logger->set_level(level);

    spdlog::set_default_logger(logger);
    spdlog::debug("kompress v0.1.0");
}

void shutdown() {
    spdlog::shutdown();
}

} // namespace kmp::log
