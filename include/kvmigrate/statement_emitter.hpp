// SPDX-License-Identifier: MIT

// include/kvmigrate/statement_emitter.hpp
#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include "kvmigrate/record_transformer.hpp"

namespace kvmigrate {

/// Collects the rows of a run and writes them as one SQL script.
///
/// Tables must be started in processing order. The script opens with a
/// preamble that empties every table receiving rows (and resets its
/// AUTOINCREMENT counter when the destination keeps sqlite_sequence), so
/// applying it twice leaves the same contents as applying it once. Each
/// table's inserts follow under a section comment.
class StatementEmitter {
public:
    explicit StatementEmitter(bool reset_sequences) : reset_sequences_(reset_sequences) {}

    /// Start the section of @p table. @p note, when non-empty, is appended to
    /// the section comment in parentheses.
    void BeginTable(const std::string& table, const std::string& note = {});

    /// Append an INSERT for @p row to the current table.
    /// @throws std::logic_error when no table was started.
    void AddRow(const Row& row);

    /// Tables with at least one row, in the order they were started.
    std::vector<std::string> PopulatedTables() const;

    std::size_t StatementCount() const;

    /// Write preamble and sections. Tables without rows produce nothing.
    void Write(std::ostream& out) const;

    /// INSERT INTO "t" ("c1", ...) VALUES (...);
    static std::string InsertStatement(const std::string& table, const Row& row);

private:
    struct Section {
        std::string table;
        std::string note;
        std::vector<std::string> statements;
    };

    bool reset_sequences_;
    std::vector<Section> sections_;
};

}  // namespace kvmigrate
