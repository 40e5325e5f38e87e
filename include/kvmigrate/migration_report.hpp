// SPDX-License-Identifier: MIT

// include/kvmigrate/migration_report.hpp
#pragma once

#include <algorithm>
#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "kvmigrate/error.hpp"
#include "kvmigrate/record_transformer.hpp"
#include "kvmigrate/source_catalog.hpp"

namespace kvmigrate {

/// Outcome of one table. discovered == emitted + SkippedTotal() always holds.
struct TableReport {
    std::string table;
    std::vector<std::string> sources;        ///< Directories and root files read
    std::size_t discovered = 0;              ///< Documents found, unparseable files counting as one
    std::size_t emitted = 0;                 ///< INSERT statements written
    std::map<ErrorCode, std::size_t> skipped;
    std::size_t fallbacks = 0;               ///< Values stored as text after failed coercion

    std::size_t SkippedTotal() const {
        std::size_t total = 0;
        for (const auto& [code, count] : skipped) total += count;
        return total;
    }
};

/// A skipped document, for the detailed listing.
struct SkippedRecord {
    std::string table;
    std::string origin;  ///< Source file (with array index) of the document
    Skip skip;
};

struct MigrationReport {
    std::vector<TableReport> tables;  ///< In processing order
    std::vector<SkippedRecord> skipped;
    std::vector<ExcludedSource> excluded;

    const TableReport* Find(std::string_view table) const {
        auto it = std::find_if(tables.begin(), tables.end(),
                               [&](const TableReport& t) { return t.table == table; });
        return it != tables.end() ? &*it : nullptr;
    }

    std::size_t TotalEmitted() const {
        std::size_t total = 0;
        for (const auto& t : tables) total += t.emitted;
        return total;
    }

    std::size_t TotalSkipped() const {
        std::size_t total = 0;
        for (const auto& t : tables) total += t.SkippedTotal();
        return total;
    }

    /// Human-readable summary, one line per table then one per excluded source.
    std::vector<std::string> SummaryLines() const {
        std::vector<std::string> lines;
        for (const auto& t : tables) {
            std::string reasons;
            for (const auto& [code, count] : t.skipped) {
                reasons += fmt::format("{}{}: {}", reasons.empty() ? " (" : ", ",
                                       error_name(code), count);
            }
            if (!reasons.empty()) reasons += ")";
            lines.push_back(fmt::format(
                "{}: {} discovered, {} emitted, {} skipped{}, {} fallbacks, {} source(s)",
                t.table, t.discovered, t.emitted, t.SkippedTotal(), reasons, t.fallbacks,
                t.sources.size()));
        }
        for (const auto& e : excluded) {
            lines.push_back(fmt::format(
                "{}: not migrated ({} {})", e.source,
                e.reason == ExclusionReason::Reserved ? "reserved table" : "unknown table",
                e.table));
        }
        return lines;
    }
};

}  // namespace kvmigrate
