// SPDX-License-Identifier: MIT

// include/kvmigrate/source_catalog.hpp
#pragma once

#include <expected>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "kvmigrate/document.hpp"
#include "kvmigrate/error.hpp"
#include "kvmigrate/schema.hpp"

namespace kvmigrate {

/// Directory name -> destination table name, consulted before any other rule.
using TableNameOverrides = std::map<std::string, std::string>;

/// One source record, with the file it came from.
struct SourceDocument {
    std::string origin;  ///< File path; "path[index]" for elements of an array file
    Value body;          ///< Always a JSON object
};

/// A source file that could not be turned into documents.
struct FileFailure {
    std::string path;
    Error error;
};

/// All source documents destined for one table.
struct RecordGroup {
    std::string table;
    std::vector<std::string> sources;         ///< Directories (or root files) in concatenation order
    std::vector<SourceDocument> documents;
    std::vector<FileFailure> failures;
};

enum class ExclusionReason {
    UnknownTable,  ///< Resolved name is not a destination table
    Reserved,      ///< Destination bookkeeping table (migrations, session, sqlite_*)
};

/// A directory (or root-level file) whose resolved table is not migrated.
struct ExcludedSource {
    std::string source;  ///< Directory or file name under the export root
    std::string table;   ///< Resolved table name
    ExclusionReason reason;
};

struct SourceCatalog {
    std::map<std::string, RecordGroup> groups;  ///< Keyed by table name
    std::vector<ExcludedSource> excluded;
};

/// Tables never populated from source data, regardless of overrides.
bool IsReservedTable(std::string_view table);

/// Candidate destination table names for an export directory, most specific first.
///
/// - overrides[dir] when present
/// - "a__b_0001" -> "a_b", "a__b", "a"
/// - "a_0001"    -> "a"
/// - anything else verbatim
std::vector<std::string> CandidateTableNames(std::string_view directory,
                                             const TableNameOverrides& overrides);

/// Resolve a directory to its destination table: the first candidate the
/// schema knows, or the first candidate when none is known.
std::string ResolveTableName(std::string_view directory,
                             const TableNameOverrides& overrides,
                             const SchemaModel& schema);

/// Walk the export root and group its documents by destination table.
///
/// Directories are visited in lexical order, files within a directory in
/// lexical order, so the result is identical across runs. Unknown and
/// reserved tables are excluded; unparseable files are recorded as failures
/// of their group.
/// @return The catalog, or ExportUnavailable when @p root is not a readable directory.
std::expected<SourceCatalog, Error> DiscoverSources(const std::filesystem::path& root,
                                                    const TableNameOverrides& overrides,
                                                    const SchemaModel& schema);

}  // namespace kvmigrate
