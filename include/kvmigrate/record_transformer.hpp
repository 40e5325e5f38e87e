// SPDX-License-Identifier: MIT

// include/kvmigrate/record_transformer.hpp
#pragma once

#include <expected>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "kvmigrate/document.hpp"
#include "kvmigrate/error.hpp"
#include "kvmigrate/identifier_registry.hpp"
#include "kvmigrate/schema.hpp"
#include "kvmigrate/sql_literal.hpp"

namespace kvmigrate {

/// Why a document produced no row.
struct Skip {
    ErrorCode reason;
    std::string message;
    std::string original_id;       ///< Document's own identifier, when it has one
    std::string column;            ///< Offending column, for MissingParent
    std::string referenced_table;  ///< Parent table, for MissingParent
    bool self_reference = false;   ///< The missing parent lives in the same table
};

/// One destination row, cells in column order.
struct Row {
    std::vector<std::pair<std::string, SqlLiteral>> cells;
    std::vector<std::string> fallbacks;  ///< Columns whose value was stored as text

    const SqlLiteral* Find(std::string_view column) const;
};

/// Result of coercing one JSON value into a column category.
struct Coerced {
    SqlLiteral literal;
    bool fallback = false;  ///< Value did not fit the category and was kept as text
};

/// Convert @p value to a literal of the given storage category.
///
/// Nothing is ever dropped: a value that does not fit is kept verbatim as
/// text (its JSON for objects and arrays) and flagged as a fallback.
Coerced Coerce(const Value& value, ColumnType type);

/// Turns source documents into destination rows.
///
/// Surrogate keys are allocated through the registry and foreign keys to
/// re-keyed parents are rewritten to the parent's new key. Only tables in
/// @p participating are re-keyed; references to any other table keep their
/// source value.
class RecordTransformer {
public:
    RecordTransformer(const SchemaModel& schema, IdentifierRegistry& registry,
                      std::set<std::string> participating)
        : schema_(schema), registry_(registry), participating_(std::move(participating)) {}

    /// Build the row for @p document destined for @p table.
    ///
    /// A key is assigned only when the row is returned, so skipped documents
    /// never consume one. Tables without a surrogate key are de-duplicated on
    /// their primary key, or on the whole row when they have none.
    std::expected<Row, Skip> Transform(const std::string& table, const Value& document);

private:
    /// True when @p fk points at the surrogate key of a re-keyed table.
    bool IsRekeyed(const ForeignKey& fk) const;

    /// Rendered primary key of @p row, or every cell when the key is
    /// missing, NULL or undeclared.
    static std::string RowSignature(const TableDef& def, const Row& row);

    const SchemaModel& schema_;
    IdentifierRegistry& registry_;
    std::set<std::string> participating_;
    std::map<std::string, std::set<std::string>> emitted_rows_;  ///< Signatures per unkeyed table
};

}  // namespace kvmigrate
