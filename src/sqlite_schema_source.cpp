// SPDX-License-Identifier: MIT

#include "kvmigrate/schema_source.hpp"

#include <cctype>
#include <memory>
#include <optional>
#include <vector>

#include <fmt/format.h>
#include <sqlite3.h>

#include "kvmigrate/log.hpp"

namespace kvmigrate {

namespace {

struct DbCloser {
    void operator()(sqlite3* db) const { sqlite3_close_v2(db); }
};
using DbHandle = std::unique_ptr<sqlite3, DbCloser>;

// RAII wrapper for sqlite3_stmt*
class StmtGuard {
public:
    explicit StmtGuard(sqlite3_stmt* stmt) : stmt_(stmt) {}
    ~StmtGuard() { sqlite3_finalize(stmt_); }
    StmtGuard(const StmtGuard&) = delete;
    StmtGuard& operator=(const StmtGuard&) = delete;

    sqlite3_stmt* get() const { return stmt_; }

private:
    sqlite3_stmt* stmt_;
};

std::string ColumnText(sqlite3_stmt* stmt, int col) {
    auto text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

std::optional<std::string> ColumnTextOrNull(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return ColumnText(stmt, col);
}

std::string ToUpper(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

class CatalogReader {
public:
    CatalogReader(sqlite3* db, const std::string& path) : db_(db), path_(path) {}

    std::expected<std::unique_ptr<StmtGuard>, Error> Prepare(const char* sql) {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return std::unexpected(Failure(sqlite3_errmsg(db_)));
        }
        return std::make_unique<StmtGuard>(stmt);
    }

    Error Failure(std::string_view what) const {
        return Error{ErrorCode::SchemaUnavailable,
                     fmt::format("cannot read schema of {}: {}", path_, what),
                     {path_}};
    }

    // Step until SQLITE_DONE, calling on_row for each row
    template <typename OnRow>
    std::expected<void, Error> ForEachRow(sqlite3_stmt* stmt, OnRow on_row) {
        while (true) {
            int rc = sqlite3_step(stmt);
            if (rc == SQLITE_DONE) return {};
            if (rc != SQLITE_ROW) return std::unexpected(Failure(sqlite3_errmsg(db_)));
            on_row(stmt);
        }
    }

    std::expected<std::vector<std::pair<std::string, std::string>>, Error> ListTables() {
        auto stmt = Prepare(
            "SELECT name, sql FROM sqlite_master WHERE type = 'table' ORDER BY name");
        if (!stmt) return std::unexpected(stmt.error());

        std::vector<std::pair<std::string, std::string>> tables;
        auto done = ForEachRow((*stmt)->get(), [&](sqlite3_stmt* s) {
            tables.emplace_back(ColumnText(s, 0), ColumnText(s, 1));
        });
        if (!done) return std::unexpected(done.error());
        return tables;
    }

    std::expected<std::vector<Column>, Error> ReadColumns(const std::string& table,
                                                          const std::string& ddl) {
        auto stmt = Prepare(
            "SELECT cid, name, type, \"notnull\", dflt_value, pk "
            "FROM pragma_table_info(?1) ORDER BY cid");
        if (!stmt) return std::unexpected(stmt.error());
        sqlite3_bind_text((*stmt)->get(), 1, table.c_str(),
                          static_cast<int>(table.size()), SQLITE_TRANSIENT);

        std::vector<Column> columns;
        int pk_count = 0;
        auto done = ForEachRow((*stmt)->get(), [&](sqlite3_stmt* s) {
            Column column;
            column.ordinal = sqlite3_column_int(s, 0);
            column.name = ColumnText(s, 1);
            column.declared_type = ColumnText(s, 2);
            column.type = ColumnTypeFromDeclared(column.declared_type);
            column.not_null = sqlite3_column_int(s, 3) != 0;
            column.default_value = ColumnTextOrNull(s, 4);
            column.primary_key = sqlite3_column_int(s, 5) > 0;
            if (column.primary_key) ++pk_count;
            columns.push_back(std::move(column));
        });
        if (!done) return std::unexpected(done.error());

        // A sole INTEGER primary key aliases the rowid unless the table is
        // WITHOUT ROWID; AUTOINCREMENT additionally tracks it in sqlite_sequence.
        auto upper_ddl = ToUpper(ddl);
        bool has_rowid = upper_ddl.find("WITHOUT ROWID") == std::string::npos;
        bool keyword = upper_ddl.find("AUTOINCREMENT") != std::string::npos;
        if (pk_count == 1) {
            for (auto& column : columns) {
                if (!column.primary_key) continue;
                bool rowid_alias = has_rowid && ToUpper(column.declared_type) == "INTEGER";
                column.autoincrement = rowid_alias || (keyword && column.type == ColumnType::Integer);
            }
        }
        return columns;
    }

    std::expected<std::vector<ForeignKey>, Error> ReadForeignKeys(const std::string& table) {
        auto stmt = Prepare(
            "SELECT id, seq, \"table\", \"from\", \"to\" "
            "FROM pragma_foreign_key_list(?1) ORDER BY id, seq");
        if (!stmt) return std::unexpected(stmt.error());
        sqlite3_bind_text((*stmt)->get(), 1, table.c_str(),
                          static_cast<int>(table.size()), SQLITE_TRANSIENT);

        std::vector<ForeignKey> keys;
        auto done = ForEachRow((*stmt)->get(), [&](sqlite3_stmt* s) {
            keys.push_back(ForeignKey{
                .column = ColumnText(s, 3),
                .referenced_table = ColumnText(s, 2),
                .referenced_column = ColumnText(s, 4),
            });
        });
        if (!done) return std::unexpected(done.error());
        return keys;
    }

private:
    sqlite3* db_;
    const std::string& path_;
};

}  // namespace

std::expected<SchemaModel, Error> SqliteSchemaSource::Load() {
    auto logger = log::Get(log::kSchemaLogger);

    sqlite3* raw = nullptr;
    int rc = sqlite3_open_v2(path_.c_str(), &raw, SQLITE_OPEN_READONLY, nullptr);
    DbHandle db(raw);
    if (rc != SQLITE_OK) {
        std::string reason = raw ? sqlite3_errmsg(raw) : sqlite3_errstr(rc);
        return std::unexpected(Error{
            ErrorCode::SchemaUnavailable,
            fmt::format("cannot open destination database {}: {}", path_, reason),
            {path_}});
    }

    CatalogReader reader(db.get(), path_);
    auto tables = reader.ListTables();
    if (!tables) return std::unexpected(tables.error());

    SchemaModel schema;
    for (const auto& [name, ddl] : *tables) {
        auto columns = reader.ReadColumns(name, ddl);
        if (!columns) return std::unexpected(columns.error());
        auto foreign_keys = reader.ReadForeignKeys(name);
        if (!foreign_keys) return std::unexpected(foreign_keys.error());
        schema.AddTable(TableDef(name, std::move(*columns), std::move(*foreign_keys)));
    }

    // The destination is trusted but not assumed complete. Names in foreign
    // key clauses match case-insensitively, so store the declared spelling.
    SchemaModel checked;
    for (auto [name, table] : schema.tables()) {
        const auto& own = table;
        auto dropped = table.ResolveForeignKeys([&](ForeignKey& fk) {
            const auto* target = schema.Find(fk.referenced_table);
            if (!target) return false;
            fk.referenced_table = target->name();
            if (const auto* to = target->FindColumn(fk.referenced_column)) {
                fk.referenced_column = to->name;
            }
            if (const auto* from = own.FindColumn(fk.column)) {
                fk.column = from->name;
            }
            return true;
        });
        for (const auto& fk : dropped) {
            logger->warn("ignoring foreign key {}.{} -> {}: referenced table does not exist",
                         name, fk.column, fk.referenced_table);
        }
        checked.AddTable(std::move(table));
    }

    logger->info("loaded {} tables from {}", checked.size(), path_);
    return checked;
}

}  // namespace kvmigrate
