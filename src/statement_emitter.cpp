// SPDX-License-Identifier: MIT

#include "kvmigrate/statement_emitter.hpp"

#include <stdexcept>

#include <fmt/format.h>

#include "kvmigrate/log.hpp"

namespace kvmigrate {

void StatementEmitter::BeginTable(const std::string& table, const std::string& note) {
    sections_.push_back(Section{table, note, {}});
}

void StatementEmitter::AddRow(const Row& row) {
    if (sections_.empty()) {
        throw std::logic_error("StatementEmitter::AddRow called before BeginTable");
    }
    auto& section = sections_.back();
    section.statements.push_back(InsertStatement(section.table, row));
}

std::vector<std::string> StatementEmitter::PopulatedTables() const {
    std::vector<std::string> tables;
    for (const auto& section : sections_) {
        if (!section.statements.empty()) tables.push_back(section.table);
    }
    return tables;
}

std::size_t StatementEmitter::StatementCount() const {
    std::size_t count = 0;
    for (const auto& section : sections_) {
        count += section.statements.size();
    }
    return count;
}

std::string StatementEmitter::InsertStatement(const std::string& table, const Row& row) {
    std::string columns;
    std::string values;
    for (const auto& [column, literal] : row.cells) {
        if (!columns.empty()) {
            columns += ", ";
            values += ", ";
        }
        columns += QuoteIdentifier(column);
        values += literal.Render();
    }
    if (columns.empty()) {
        return fmt::format("INSERT INTO {} DEFAULT VALUES;", QuoteIdentifier(table));
    }
    return fmt::format("INSERT INTO {} ({}) VALUES ({});", QuoteIdentifier(table), columns,
                       values);
}

void StatementEmitter::Write(std::ostream& out) const {
    auto populated = PopulatedTables();
    for (const auto& table : populated) {
        out << fmt::format("DELETE FROM {};\n", QuoteIdentifier(table));
        if (reset_sequences_) {
            out << fmt::format("DELETE FROM sqlite_sequence WHERE name = '{}';\n",
                               EscapeSqlString(table));
        }
    }

    for (const auto& section : sections_) {
        if (section.statements.empty()) continue;
        out << "\n-- SQL statements for table: " << section.table;
        if (!section.note.empty()) {
            out << " (" << section.note << ")";
        }
        out << '\n';
        for (const auto& statement : section.statements) {
            out << statement << '\n';
        }
    }

    log::Get(log::kEmitterLogger)
        ->debug("wrote {} statements for {} tables", StatementCount(), populated.size());
}

}  // namespace kvmigrate
