// SPDX-License-Identifier: MIT

// include/kvmigrate/schema.hpp
#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace kvmigrate {

/// Storage category of a column, following SQLite type affinity.
enum class ColumnType {
    Integer,  ///< INTEGER affinity (declared type contains "INT")
    Real,     ///< REAL affinity ("REAL", "FLOA", "DOUB")
    Text,     ///< TEXT affinity ("CHAR", "CLOB", "TEXT")
    Blob,     ///< BLOB / no affinity (declared "BLOB" or no type)
    Numeric,  ///< NUMERIC affinity, anything else (BOOLEAN, DATETIME, DECIMAL...)
};

/// True when two identifiers name the same object. SQLite folds ASCII case
/// in table and column names.
bool SameIdentifier(std::string_view a, std::string_view b);

/// Identifier ordering with ASCII case folding, usable as a transparent
/// map comparator.
struct IdentifierLess {
    using is_transparent = void;
    bool operator()(std::string_view a, std::string_view b) const;
};

/// Classify a declared column type with SQLite's affinity rules.
ColumnType ColumnTypeFromDeclared(std::string_view declared);

std::string_view ColumnTypeName(ColumnType type);

struct Column {
    std::string name;
    std::string declared_type;
    ColumnType type = ColumnType::Blob;
    int ordinal = 0;
    bool primary_key = false;
    bool autoincrement = false;  ///< Destination generates the value (rowid alias / AUTOINCREMENT)
    bool not_null = false;
    std::optional<std::string> default_value;
};

struct ForeignKey {
    std::string column;
    std::string referenced_table;
    std::string referenced_column;  ///< Empty when the constraint targets the referenced primary key
};

/// Definition of one destination table.
class TableDef {
public:
    TableDef() = default;
    TableDef(std::string name, std::vector<Column> columns, std::vector<ForeignKey> foreign_keys = {})
        : name_(std::move(name)), columns_(std::move(columns)), foreign_keys_(std::move(foreign_keys)) {}

    const std::string& name() const { return name_; }
    const std::vector<Column>& columns() const { return columns_; }
    const std::vector<ForeignKey>& foreign_keys() const { return foreign_keys_; }

    /// Column named @p name, compared case-insensitively.
    const Column* FindColumn(std::string_view name) const;

    /// Autoincrement-style primary key that migration re-keys, or nullptr.
    const Column* SurrogateKey() const;

    /// Foreign key declared on @p column, or nullptr.
    const ForeignKey* ForeignKeyFor(std::string_view column) const;

    /// True if any foreign key of this table references the table itself.
    bool IsSelfReferencing() const;

    /// Pass every foreign key to @p resolve, which may rewrite it in place,
    /// and drop those it rejects.
    /// @return The dropped constraints.
    template <typename Resolve>
    std::vector<ForeignKey> ResolveForeignKeys(Resolve resolve) {
        std::vector<ForeignKey> kept;
        std::vector<ForeignKey> dropped;
        for (auto& fk : foreign_keys_) {
            bool known = resolve(fk);
            (known ? kept : dropped).push_back(std::move(fk));
        }
        foreign_keys_ = std::move(kept);
        return dropped;
    }

private:
    std::string name_;
    std::vector<Column> columns_;
    std::vector<ForeignKey> foreign_keys_;
};

/// In-memory mirror of the destination schema.
///
/// Tables are kept ordered by name so every traversal is deterministic.
/// Lookups fold ASCII case like SQLite does; Find() returns the table under
/// its declared name.
class SchemaModel {
public:
    /// Name of SQLite's autoincrement bookkeeping table.
    static constexpr std::string_view kSequenceTable = "sqlite_sequence";

    void AddTable(TableDef table);

    const TableDef* Find(std::string_view name) const;
    bool Contains(std::string_view name) const { return Find(name) != nullptr; }

    const std::map<std::string, TableDef, IdentifierLess>& tables() const { return tables_; }
    std::size_t size() const { return tables_.size(); }

    std::vector<std::string> TableNames() const;

    /// Tables referenced by @p table's foreign keys (self references included).
    std::set<std::string> DependenciesOf(std::string_view table) const;

    /// True when the destination tracks AUTOINCREMENT counters in sqlite_sequence.
    bool HasSequenceTable() const { return Contains(kSequenceTable); }

    /// One line per foreign key: "table.column -> referenced.column".
    std::vector<std::string> RelationshipSummary() const;

private:
    std::map<std::string, TableDef, IdentifierLess> tables_;
};

}  // namespace kvmigrate
