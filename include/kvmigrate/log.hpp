// SPDX-License-Identifier: MIT

// include/kvmigrate/log.hpp
#pragma once

#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

#include "kvmigrate/error.hpp"

namespace kvmigrate::log {

/// @name Logger names, one per pipeline stage
/// @{
constexpr const char* kMainLogger = "kvmigrate";
constexpr const char* kSchemaLogger = "schema";
constexpr const char* kCatalogLogger = "catalog";
constexpr const char* kResolverLogger = "resolver";
constexpr const char* kTransformLogger = "transform";
constexpr const char* kEmitterLogger = "emitter";
constexpr const char* kMigrateLogger = "migrate";
/// @}

enum class Level {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

struct LogConfig {
    Level level{Level::Info};
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v"};
    bool console{true};          ///< Log to stderr; stdout stays free for reports
    std::string file_path;       ///< Rotating log file, empty to disable
    std::size_t max_file_size{10 * 1024 * 1024};
    std::size_t max_files{3};
};

/// Initialize logging. Later calls are ignored until Shutdown().
///
/// The log file, if any, is opened here and shared by every logger.
/// @return InvalidConfig when the log file cannot be opened; logging then
///         stays on the console only.
std::expected<void, Error> Init(const LogConfig& config = LogConfig{});

/// Get a logger by name, creating it (and default logging) on first use.
std::shared_ptr<spdlog::logger> Get(const std::string& name = kMainLogger);

/// Set the level of every logger, existing and future.
void SetLevel(Level level);

Level GetLevel();

/// Parse "trace", "debug", "info", "warn", "error", "critical" or "off".
std::optional<Level> ParseLevel(std::string_view name);

spdlog::level::level_enum ToSpdlogLevel(Level level);

void Flush();

void Shutdown();

}  // namespace kvmigrate::log
