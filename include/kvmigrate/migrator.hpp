// SPDX-License-Identifier: MIT

// include/kvmigrate/migrator.hpp
#pragma once

#include <expected>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "kvmigrate/config.hpp"
#include "kvmigrate/error.hpp"
#include "kvmigrate/migration_report.hpp"
#include "kvmigrate/schema_source.hpp"
#include "kvmigrate/source_catalog.hpp"

namespace kvmigrate {

/// Stable-sort @p documents by @p field: documents without the field first,
/// then numbers in numeric order, then strings in lexical order.
void SortChronologically(std::vector<const SourceDocument*>& documents, const std::string& field);

/// Drives one migration: schema, catalog, ordering, transformation, emission.
///
/// Planning failures (schema, export root, cycles) are returned before a
/// single statement is produced. Everything after that is recoverable and
/// ends up in the report.
///
/// Example:
/// @code
/// SqliteSchemaSource source("database.sqlite");
/// Migrator migrator(source, config);
/// std::ostringstream sql;
/// auto report = migrator.Run(sql);
/// @endcode
class Migrator {
public:
    Migrator(ISchemaSource& source, MigrationConfig config)
        : source_(source), config_(std::move(config)) {}

    /// Write the SQL script for the export to @p out.
    std::expected<MigrationReport, Error> Run(std::ostream& out);

private:
    ISchemaSource& source_;
    MigrationConfig config_;
};

/// Run against config.database_path and write config.output_path.
///
/// The script is written next to the output under a temporary name and
/// renamed into place. A failed run creates no file and leaves an existing
/// output untouched.
std::expected<MigrationReport, Error> RunMigration(const MigrationConfig& config);

}  // namespace kvmigrate
