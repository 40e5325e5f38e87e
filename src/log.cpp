// SPDX-License-Identifier: MIT

#include "kvmigrate/log.hpp"

#include <mutex>
#include <unordered_map>
#include <vector>

#include <fmt/format.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace kvmigrate::log {

namespace {

std::mutex g_mutex;
std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> g_loggers;
LogConfig g_config;
spdlog::sink_ptr g_file_sink;
bool g_initialized = false;

std::shared_ptr<spdlog::logger> CreateLogger(const std::string& name) {
    std::vector<spdlog::sink_ptr> sinks;
    auto level = ToSpdlogLevel(g_config.level);

    if (g_config.console) {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(level);
        sinks.push_back(console_sink);
    }

    if (g_file_sink) {
        sinks.push_back(g_file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->set_pattern(g_config.pattern);
    return logger;
}

}  // namespace

spdlog::level::level_enum ToSpdlogLevel(Level level) {
    switch (level) {
        case Level::Trace: return spdlog::level::trace;
        case Level::Debug: return spdlog::level::debug;
        case Level::Info: return spdlog::level::info;
        case Level::Warn: return spdlog::level::warn;
        case Level::Error: return spdlog::level::err;
        case Level::Critical: return spdlog::level::critical;
        case Level::Off: return spdlog::level::off;
    }
    return spdlog::level::info;
}

std::optional<Level> ParseLevel(std::string_view name) {
    if (name == "trace") return Level::Trace;
    if (name == "debug") return Level::Debug;
    if (name == "info") return Level::Info;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "error" || name == "err") return Level::Error;
    if (name == "critical") return Level::Critical;
    if (name == "off") return Level::Off;
    return std::nullopt;
}

std::expected<void, Error> Init(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_initialized) {
        return {};
    }
    g_config = config;
    // Loggers handed out before Init() keep their default sinks
    g_loggers.clear();
    g_file_sink.reset();
    g_initialized = true;

    if (config.file_path.empty()) {
        return {};
    }
    try {
        g_file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file_path, config.max_file_size, config.max_files);
        g_file_sink->set_level(ToSpdlogLevel(config.level));
    } catch (const spdlog::spdlog_ex& e) {
        g_config.file_path.clear();
        return std::unexpected(Error{
            ErrorCode::InvalidConfig,
            fmt::format("cannot open log file {}: {}", config.file_path, e.what()),
            {config.file_path}});
    }
    return {};
}

std::shared_ptr<spdlog::logger> Get(const std::string& name) {
    std::lock_guard<std::mutex> lock(g_mutex);
    auto it = g_loggers.find(name);
    if (it != g_loggers.end()) {
        return it->second;
    }
    auto logger = CreateLogger(name);
    g_loggers[name] = logger;
    return logger;
}

void SetLevel(Level level) {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_config.level = level;
    auto spdlog_level = ToSpdlogLevel(level);
    if (g_file_sink) {
        g_file_sink->set_level(spdlog_level);
    }
    for (auto& [name, logger] : g_loggers) {
        logger->set_level(spdlog_level);
        for (auto& sink : logger->sinks()) {
            sink->set_level(spdlog_level);
        }
    }
}

Level GetLevel() {
    std::lock_guard<std::mutex> lock(g_mutex);
    return g_config.level;
}

void Flush() {
    std::lock_guard<std::mutex> lock(g_mutex);
    for (auto& [name, logger] : g_loggers) {
        logger->flush();
    }
}

void Shutdown() {
    std::lock_guard<std::mutex> lock(g_mutex);
    for (auto& [name, logger] : g_loggers) {
        logger->flush();
    }
    g_loggers.clear();
    g_file_sink.reset();
    g_config = LogConfig{};
    g_initialized = false;
}

}  // namespace kvmigrate::log
