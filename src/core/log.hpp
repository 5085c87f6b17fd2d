#pragma once

#include <filesystem>
#include <spdlog/spdlog.h>

namespace halon::log {

/// Initialize logging with a stderr sink and, when log_file is non-empty,
/// an additional file sink.
void init(spdlog::level::level_enum level = spdlog::level::info,
          const std::filesystem::path& log_file = {});

/// Flush and shutdown logging.
void shutdown();

} // namespace halon::log
