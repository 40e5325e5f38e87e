// SPDX-License-Identifier: MIT

#include "kvmigrate/source_catalog.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

#include <fmt/format.h>

#include "kvmigrate/json_parser.hpp"
#include "kvmigrate/log.hpp"

namespace kvmigrate {

namespace {

namespace fs = std::filesystem;

constexpr std::string_view kDocumentExtension = ".json";

bool AllDigits(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
}

// Sorted names of the entries of `dir` accepted by `keep`. Iteration errors
// end the listing early; the caller sees whatever was read.
template <typename Keep>
std::vector<fs::path> SortedEntries(const fs::path& dir, Keep keep, std::error_code& ec) {
    std::vector<fs::path> entries;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (keep(*it)) entries.push_back(it->path());
    }
    std::sort(entries.begin(), entries.end(),
              [](const fs::path& a, const fs::path& b) { return a.filename() < b.filename(); });
    return entries;
}

bool IsDocumentFile(const fs::directory_entry& entry) {
    std::error_code ec;
    return entry.is_regular_file(ec) && entry.path().extension() == kDocumentExtension;
}

// Split one parsed file into documents: an object is one document, an array
// holds one document per element. Empty objects carry nothing to migrate.
void AddFileDocuments(const fs::path& path, Value value, RecordGroup& group) {
    auto file = path.string();
    auto reject = [&](std::string origin, std::string what) {
        group.failures.push_back(FileFailure{
            origin, Error{ErrorCode::InvalidDocumentFormat,
                          fmt::format("{}: {}", origin, what), {origin}}});
    };

    if (value.IsObject()) {
        if (!value.AsObject().empty()) {
            group.documents.push_back(SourceDocument{file, std::move(value)});
        }
        return;
    }
    if (!value.IsArray()) {
        reject(file, "expected a JSON object or an array of objects");
        return;
    }
    auto& elements = value.AsArray();
    for (std::size_t i = 0; i < elements.size(); ++i) {
        auto origin = fmt::format("{}[{}]", file, i);
        if (!elements[i].IsObject()) {
            reject(origin, "array element is not a JSON object");
        } else if (!elements[i].AsObject().empty()) {
            group.documents.push_back(SourceDocument{origin, std::move(elements[i])});
        }
    }
}

void LoadFile(const fs::path& path, RecordGroup& group) {
    auto parsed = ReadDocumentFile(path);
    if (!parsed) {
        group.failures.push_back(FileFailure{path.string(), parsed.error()});
        return;
    }
    AddFileDocuments(path, std::move(*parsed), group);
}

}  // namespace

bool IsReservedTable(std::string_view table) {
    return table == "migrations" || table == "session" || table.starts_with("sqlite_");
}

std::vector<std::string> CandidateTableNames(std::string_view directory,
                                             const TableNameOverrides& overrides) {
    if (auto it = overrides.find(std::string(directory)); it != overrides.end()) {
        return {it->second};
    }

    auto last = directory.rfind('_');
    if (last != std::string_view::npos && AllDigits(directory.substr(last + 1))) {
        auto stem = directory.substr(0, last);
        auto split = stem.find("__");
        if (split == std::string_view::npos) {
            if (!stem.empty()) return {std::string(stem)};
        } else if (split > 0 && split + 2 < stem.size()) {
            auto owner = stem.substr(0, split);
            auto child = stem.substr(split + 2);
            return {fmt::format("{}_{}", owner, child), std::string(stem), std::string(owner)};
        }
    }
    return {std::string(directory)};
}

std::string ResolveTableName(std::string_view directory,
                             const TableNameOverrides& overrides,
                             const SchemaModel& schema) {
    auto candidates = CandidateTableNames(directory, overrides);
    for (const auto& candidate : candidates) {
        if (const auto* table = schema.Find(candidate)) return table->name();
    }
    return candidates.front();
}

std::expected<SourceCatalog, Error> DiscoverSources(const fs::path& root,
                                                    const TableNameOverrides& overrides,
                                                    const SchemaModel& schema) {
    auto logger = log::Get(log::kCatalogLogger);

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return std::unexpected(Error{
            ErrorCode::ExportUnavailable,
            fmt::format("export directory not found: {}", root.string()),
            {root.string()}});
    }

    auto directories = SortedEntries(
        root, [](const fs::directory_entry& e) {
            std::error_code dir_ec;
            return e.is_directory(dir_ec);
        }, ec);
    if (!ec) {
        // Root-level files are concatenated after every directory
        auto root_files = SortedEntries(root, IsDocumentFile, ec);
        directories.insert(directories.end(), root_files.begin(), root_files.end());
    }
    if (ec) {
        return std::unexpected(Error{
            ErrorCode::ExportUnavailable,
            fmt::format("cannot list export directory {}: {}", root.string(), ec.message()),
            {root.string()}});
    }

    SourceCatalog catalog;
    for (const auto& source : directories) {
        bool is_file = source.has_extension() && !fs::is_directory(source, ec);
        auto name = is_file ? source.stem().string() : source.filename().string();
        auto table = ResolveTableName(name, overrides, schema);
        auto label = source.filename().string();

        if (IsReservedTable(table)) {
            logger->debug("skipping {}: {} is not populated from source data", label, table);
            catalog.excluded.push_back({label, table, ExclusionReason::Reserved});
            continue;
        }
        if (!schema.Contains(table)) {
            logger->warn("skipping {}: table {} is not in the destination schema", label, table);
            catalog.excluded.push_back({label, table, ExclusionReason::UnknownTable});
            continue;
        }

        auto& group = catalog.groups[table];
        group.table = table;
        group.sources.push_back(label);

        if (is_file) {
            LoadFile(source, group);
            continue;
        }
        std::error_code list_ec;
        auto files = SortedEntries(source, IsDocumentFile, list_ec);
        if (list_ec) {
            group.failures.push_back(FileFailure{
                source.string(),
                Error{ErrorCode::InvalidDocumentFormat,
                      fmt::format("cannot list {}: {}", source.string(), list_ec.message()),
                      {source.string()}}});
        }
        for (const auto& file : files) {
            LoadFile(file, group);
        }
    }

    for (const auto& [table, group] : catalog.groups) {
        logger->info("{}: {} documents, {} unreadable files from {} source(s)", table,
                     group.documents.size(), group.failures.size(), group.sources.size());
    }
    return catalog;
}

}  // namespace kvmigrate
