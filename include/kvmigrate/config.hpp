// SPDX-License-Identifier: MIT

// include/kvmigrate/config.hpp
#pragma once

#include <expected>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "kvmigrate/error.hpp"
#include "kvmigrate/log.hpp"
#include "kvmigrate/source_catalog.hpp"

namespace kvmigrate {

/// table -> timestamp field its rows are ordered by.
using ChronologicalTables = std::map<std::string, std::string>;

/// Everything one migration run needs to know.
struct MigrationConfig {
    std::filesystem::path database_path{"database.sqlite"};
    std::filesystem::path export_root{"export"};
    std::filesystem::path output_path{"migrated_data.sql"};
    TableNameOverrides overrides;
    ChronologicalTables chronological{{"event", "created"}};
    log::LogConfig logging;
    bool show_relationships = false;
};

/// Merge a JSON config file into @p config.
///
/// Recognized keys: "database", "export", "output", "overrides" (object of
/// directory -> table), "chronological" (object of table -> field, replaces
/// the defaults), "log_level", "log_file". Unknown keys are rejected.
/// @return InvalidConfig when the file is unreadable or malformed.
std::expected<void, Error> ApplyConfigFile(const std::filesystem::path& path,
                                           MigrationConfig& config);

struct CommandLine {
    MigrationConfig config;
    bool help = false;
};

/// Parse argv. A --config file is applied first, then the remaining flags
/// override it in order.
std::expected<CommandLine, Error> ParseCommandLine(const std::vector<std::string>& args);

/// Usage text for --help and usage errors.
std::string Usage(std::string_view program);

}  // namespace kvmigrate
