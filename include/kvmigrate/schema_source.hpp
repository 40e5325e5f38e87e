// SPDX-License-Identifier: MIT

// include/kvmigrate/schema_source.hpp
#pragma once

#include <expected>
#include <string>
#include <utility>

#include "kvmigrate/error.hpp"
#include "kvmigrate/schema.hpp"

namespace kvmigrate {

/// Abstract source of the destination schema.
///
/// Implementations read table, column and foreign-key metadata only; they
/// never write to the destination. See SqliteSchemaSource for the concrete
/// backend.
class ISchemaSource {
public:
    virtual ~ISchemaSource() = default;

    /// Load every table visible in the destination catalog.
    /// @return The schema, or SchemaUnavailable when metadata cannot be read.
    virtual std::expected<SchemaModel, Error> Load() = 0;

    /// Human-readable location of the destination, used in diagnostics.
    virtual std::string Describe() const = 0;
};

/// Schema source backed by an existing SQLite database file.
///
/// The file is opened read-only for the duration of Load() and closed
/// unconditionally before it returns. Foreign keys that reference tables the
/// catalog does not contain are dropped with a warning.
class SqliteSchemaSource : public ISchemaSource {
public:
    explicit SqliteSchemaSource(std::string path) : path_(std::move(path)) {}

    std::expected<SchemaModel, Error> Load() override;

    std::string Describe() const override { return path_; }

private:
    std::string path_;
};

/// Schema source returning a prebuilt model. Used when the schema is
/// assembled in memory rather than read from a database.
class StaticSchemaSource : public ISchemaSource {
public:
    explicit StaticSchemaSource(SchemaModel schema) : schema_(std::move(schema)) {}

    std::expected<SchemaModel, Error> Load() override { return schema_; }

    std::string Describe() const override { return "(in-memory schema)"; }

private:
    SchemaModel schema_;
};

}  // namespace kvmigrate
