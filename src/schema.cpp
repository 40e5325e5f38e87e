// SPDX-License-Identifier: MIT

#include "kvmigrate/schema.hpp"

#include <algorithm>
#include <cctype>

#include <fmt/format.h>

namespace kvmigrate {

namespace {

std::string ToUpper(std::string_view s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        result += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return result;
}

bool Contains(const std::string& haystack, std::string_view needle) {
    return haystack.find(needle) != std::string::npos;
}

char FoldCase(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

}  // namespace

bool SameIdentifier(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(),
                      [](char x, char y) { return FoldCase(x) == FoldCase(y); });
}

bool IdentifierLess::operator()(std::string_view a, std::string_view b) const {
    return std::lexicographical_compare(
        a.begin(), a.end(), b.begin(), b.end(),
        [](char x, char y) { return FoldCase(x) < FoldCase(y); });
}

// Order of the checks matters: "CHARINT" and even "FLOATING POINT" are INTEGER.
ColumnType ColumnTypeFromDeclared(std::string_view declared) {
    auto upper = ToUpper(declared);
    if (Contains(upper, "INT")) return ColumnType::Integer;
    if (Contains(upper, "CHAR") || Contains(upper, "CLOB") || Contains(upper, "TEXT")) {
        return ColumnType::Text;
    }
    if (upper.empty() || Contains(upper, "BLOB")) return ColumnType::Blob;
    if (Contains(upper, "REAL") || Contains(upper, "FLOA") || Contains(upper, "DOUB")) {
        return ColumnType::Real;
    }
    return ColumnType::Numeric;
}

std::string_view ColumnTypeName(ColumnType type) {
    switch (type) {
        case ColumnType::Integer: return "integer";
        case ColumnType::Real: return "real";
        case ColumnType::Text: return "text";
        case ColumnType::Blob: return "blob";
        case ColumnType::Numeric: return "numeric";
    }
    return "";  // Unreachable
}

const Column* TableDef::FindColumn(std::string_view name) const {
    auto it = std::find_if(columns_.begin(), columns_.end(),
                           [&](const Column& c) { return SameIdentifier(c.name, name); });
    return it != columns_.end() ? &*it : nullptr;
}

const Column* TableDef::SurrogateKey() const {
    const Column* key = nullptr;
    for (const auto& column : columns_) {
        if (!column.primary_key) continue;
        if (key) return nullptr;  // Composite keys are migrated as ordinary columns
        key = &column;
    }
    if (key && key->autoincrement && key->type == ColumnType::Integer) {
        return key;
    }
    return nullptr;
}

const ForeignKey* TableDef::ForeignKeyFor(std::string_view column) const {
    auto it = std::find_if(foreign_keys_.begin(), foreign_keys_.end(),
                           [&](const ForeignKey& fk) { return fk.column == column; });
    return it != foreign_keys_.end() ? &*it : nullptr;
}

bool TableDef::IsSelfReferencing() const {
    return std::any_of(foreign_keys_.begin(), foreign_keys_.end(),
                       [&](const ForeignKey& fk) { return SameIdentifier(fk.referenced_table, name_); });
}

void SchemaModel::AddTable(TableDef table) {
    auto name = table.name();
    tables_.insert_or_assign(std::move(name), std::move(table));
}

const TableDef* SchemaModel::Find(std::string_view name) const {
    auto it = tables_.find(name);
    return it != tables_.end() ? &it->second : nullptr;
}

std::vector<std::string> SchemaModel::TableNames() const {
    std::vector<std::string> names;
    names.reserve(tables_.size());
    for (const auto& [name, table] : tables_) {
        names.push_back(name);
    }
    return names;
}

std::set<std::string> SchemaModel::DependenciesOf(std::string_view table) const {
    std::set<std::string> deps;
    if (const auto* def = Find(table)) {
        for (const auto& fk : def->foreign_keys()) {
            deps.insert(fk.referenced_table);
        }
    }
    return deps;
}

std::vector<std::string> SchemaModel::RelationshipSummary() const {
    std::vector<std::string> lines;
    for (const auto& [name, table] : tables_) {
        for (const auto& fk : table.foreign_keys()) {
            std::string target_column = fk.referenced_column;
            if (target_column.empty()) {
                const auto* target = Find(fk.referenced_table);
                const auto* key = target ? target->SurrogateKey() : nullptr;
                target_column = key ? key->name : "<primary key>";
            }
            lines.push_back(fmt::format("{}.{} -> {}.{}", name, fk.column,
                                        fk.referenced_table, target_column));
        }
    }
    return lines;
}

}  // namespace kvmigrate
