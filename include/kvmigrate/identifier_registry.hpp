// SPDX-License-Identifier: MIT

// include/kvmigrate/identifier_registry.hpp
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>

namespace kvmigrate {

/// Per-table mapping from original identifiers to new surrogate keys.
///
/// Keys are handed out from 1 in order of first sight, so a table that
/// receives N distinct identifiers ends up with exactly the keys 1..N. Once a
/// table's rows are all processed it is sealed; its mapping is then final and
/// referrers can rely on Lookup() misses being permanent.
///
/// The registry lives for one run and is passed explicitly to whoever needs
/// it. Not thread-safe.
class IdentifierRegistry {
public:
    /// Return the key of @p original_id in @p table, allocating the next one
    /// on first sight.
    /// @throws std::logic_error if @p table is sealed.
    int64_t Assign(const std::string& table, const std::string& original_id) {
        if (IsSealed(table)) {
            throw std::logic_error("IdentifierRegistry: table '" + table + "' is sealed");
        }
        auto& entry = tables_[table];
        auto [it, inserted] = entry.keys.try_emplace(original_id, entry.next);
        if (inserted) {
            ++entry.next;
        }
        return it->second;
    }

    /// Surrogate key previously assigned to @p original_id, or std::nullopt.
    std::optional<int64_t> Lookup(std::string_view table, std::string_view original_id) const {
        auto it = tables_.find(table);
        if (it == tables_.end()) {
            return std::nullopt;
        }
        auto key = it->second.keys.find(original_id);
        if (key == it->second.keys.end()) {
            return std::nullopt;
        }
        return key->second;
    }

    bool Contains(std::string_view table, std::string_view original_id) const {
        return Lookup(table, original_id).has_value();
    }

    /// Number of keys assigned in @p table.
    std::size_t Count(std::string_view table) const {
        auto it = tables_.find(table);
        return it != tables_.end() ? it->second.keys.size() : 0;
    }

    /// Mark @p table complete. Further Assign() calls for it throw.
    void Seal(const std::string& table) { sealed_.insert(table); }

    bool IsSealed(std::string_view table) const { return sealed_.find(table) != sealed_.end(); }

private:
    struct TableKeys {
        std::map<std::string, int64_t, std::less<>> keys;
        int64_t next = 1;
    };

    std::map<std::string, TableKeys, std::less<>> tables_;
    std::set<std::string, std::less<>> sealed_;
};

}  // namespace kvmigrate
