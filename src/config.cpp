// SPDX-License-Identifier: MIT

#include "kvmigrate/config.hpp"

#include <optional>

#include <fmt/format.h>

#include "kvmigrate/json_parser.hpp"

namespace kvmigrate {

namespace {

Error Invalid(std::string message) {
    return Error{ErrorCode::InvalidConfig, std::move(message), {}};
}

std::expected<std::string, Error> StringMember(const std::string& key, const Value& value) {
    if (!value.IsString()) {
        return std::unexpected(Invalid(fmt::format("config key '{}' must be a string", key)));
    }
    return value.AsString();
}

std::expected<std::map<std::string, std::string>, Error> StringMap(const std::string& key,
                                                                   const Value& value) {
    if (!value.IsObject()) {
        return std::unexpected(Invalid(fmt::format("config key '{}' must be an object", key)));
    }
    std::map<std::string, std::string> result;
    for (const auto& [name, entry] : value.AsObject()) {
        if (!entry.IsString() || entry.AsString().empty()) {
            return std::unexpected(Invalid(
                fmt::format("config key '{}.{}' must be a non-empty string", key, name)));
        }
        result[name] = entry.AsString();
    }
    return result;
}

std::expected<log::Level, Error> LevelFrom(std::string_view name) {
    auto level = log::ParseLevel(name);
    if (!level) {
        return std::unexpected(Invalid(fmt::format("unknown log level '{}'", name)));
    }
    return *level;
}

// "name=value" with both sides non-empty
std::expected<std::pair<std::string, std::string>, Error> Assignment(std::string_view flag,
                                                                     std::string_view text) {
    auto eq = text.find('=');
    if (eq == std::string_view::npos || eq == 0 || eq + 1 == text.size()) {
        return std::unexpected(
            Invalid(fmt::format("{} expects NAME=VALUE, got '{}'", flag, text)));
    }
    return std::pair{std::string(text.substr(0, eq)), std::string(text.substr(eq + 1))};
}

}  // namespace

std::expected<void, Error> ApplyConfigFile(const std::filesystem::path& path,
                                           MigrationConfig& config) {
    auto document = ReadDocumentFile(path);
    if (!document) {
        return std::unexpected(Error{ErrorCode::InvalidConfig, document.error().message,
                                     {path.string()}});
    }
    if (!document->IsObject()) {
        return std::unexpected(Error{ErrorCode::InvalidConfig,
                                     fmt::format("{}: config must be a JSON object", path.string()),
                                     {path.string()}});
    }

    for (const auto& [key, value] : document->AsObject()) {
        if (key == "overrides" || key == "chronological") {
            auto entries = StringMap(key, value);
            if (!entries) return std::unexpected(entries.error());
            (key == "overrides" ? config.overrides : config.chronological) = std::move(*entries);
            continue;
        }

        auto text = StringMember(key, value);
        if (!text) return std::unexpected(text.error());
        if (key == "database") {
            config.database_path = *text;
        } else if (key == "export") {
            config.export_root = *text;
        } else if (key == "output") {
            config.output_path = *text;
        } else if (key == "log_level") {
            auto level = LevelFrom(*text);
            if (!level) return std::unexpected(level.error());
            config.logging.level = *level;
        } else if (key == "log_file") {
            config.logging.file_path = *text;
        } else {
            return std::unexpected(Invalid(fmt::format("unknown config key '{}'", key)));
        }
    }
    return {};
}

std::expected<CommandLine, Error> ParseCommandLine(const std::vector<std::string>& args) {
    CommandLine cli;

    // Split "--flag=value" and pair flags that take a value with the next argument
    std::vector<std::pair<std::string, std::optional<std::string>>> flags;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            cli.help = true;
            return cli;
        }
        if (arg == "--relationships") {
            flags.emplace_back(arg, std::nullopt);
            continue;
        }
        if (!arg.starts_with("--")) {
            return std::unexpected(Invalid(fmt::format("unexpected argument '{}'", arg)));
        }
        if (auto eq = arg.find('='); eq != std::string::npos) {
            flags.emplace_back(arg.substr(0, eq), arg.substr(eq + 1));
        } else if (i + 1 < args.size()) {
            flags.emplace_back(arg, args[++i]);
        } else {
            return std::unexpected(Invalid(fmt::format("{} requires a value", arg)));
        }
    }

    for (const auto& [flag, value] : flags) {
        if (flag == "--config") {
            auto applied = ApplyConfigFile(*value, cli.config);
            if (!applied) return std::unexpected(applied.error());
        }
    }

    for (const auto& [flag, value] : flags) {
        if (flag == "--config") continue;
        if (flag == "--relationships") {
            cli.config.show_relationships = true;
        } else if (flag == "--db") {
            cli.config.database_path = *value;
        } else if (flag == "--export") {
            cli.config.export_root = *value;
        } else if (flag == "--output") {
            cli.config.output_path = *value;
        } else if (flag == "--override" || flag == "--chronological") {
            auto entry = Assignment(flag, *value);
            if (!entry) return std::unexpected(entry.error());
            auto& target = flag == "--override" ? cli.config.overrides : cli.config.chronological;
            target[entry->first] = entry->second;
        } else if (flag == "--log-level") {
            auto level = LevelFrom(*value);
            if (!level) return std::unexpected(level.error());
            cli.config.logging.level = *level;
        } else if (flag == "--log-file") {
            cli.config.logging.file_path = *value;
        } else {
            return std::unexpected(Invalid(fmt::format("unknown option '{}'", flag)));
        }
    }
    return cli;
}

std::string Usage(std::string_view program) {
    return fmt::format(
        "Usage: {} [options]\n"
        "\n"
        "Convert a directory of JSON export documents into an SQL script for an\n"
        "existing SQLite database.\n"
        "\n"
        "Options:\n"
        "  --db PATH                 Destination SQLite database (default: database.sqlite)\n"
        "  --export DIR              Export root directory (default: export)\n"
        "  --output PATH             SQL script to write (default: migrated_data.sql)\n"
        "  --override DIR=TABLE      Map an export directory to a table (repeatable)\n"
        "  --chronological T=FIELD   Sort rows of table T by FIELD (default: event=created)\n"
        "  --config PATH             JSON config file, applied before other options\n"
        "  --log-level LEVEL         trace, debug, info, warn, error, critical, off\n"
        "  --log-file PATH           Also log to a rotating file\n"
        "  --relationships           Print the foreign key relationships and exit\n"
        "  -h, --help                Show this help\n",
        program);
}

}  // namespace kvmigrate
