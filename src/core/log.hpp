#pragma once

#include <filesystem>
#include <optional>
#include <spdlog/spdlog.h>

namespace kmp::log {

/// Initialize logging with a console sink and, when given, a file sink.
void init(spdlog::level::level_enum level = spdlog::level::info,
          const std::optional<std::filesystem::path>& log_file = std::nullopt);

/// Flush and shutdown logging.
void shutdown();

} // namespace kmp::log
