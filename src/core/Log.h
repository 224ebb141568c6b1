// src/core/Log.h
#pragma once

#include <filesystem>
#include <string_view>

#include <spdlog/spdlog.h>

namespace promenade::logsys {

// Installs the "promenade" logger as spdlog's default: colour console plus a
// rotating file (1 MiB x 4) under `logDir`. An empty `logDir` logs to console only.
void init(const std::filesystem::path& logDir,
          spdlog::level::level_enum level = spdlog::level::info);

// Flushes and drops the logger; safe to call more than once.
void shutdown();

// Parses "trace", "debug", "info", "warn", "error", "critical", "off".
// Unknown names fall back to `fallback`.
spdlog::level::level_enum parse_level(std::string_view name,
                                      spdlog::level::level_enum fallback = spdlog::level::info);

} // namespace promenade::logsys
