// SPDX-License-Identifier: MIT

#include "kvmigrate/record_transformer.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <limits>
#include <optional>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "kvmigrate/log.hpp"

namespace kvmigrate {

namespace {

constexpr double kInt64Bound = 9223372036854775808.0;  // 2^63

std::optional<int64_t> ParseInteger(std::string_view s) {
    int64_t v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return v;
}

std::optional<double> ParseReal(std::string_view s) {
    double v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size() || !std::isfinite(v)) return std::nullopt;
    return v;
}

std::optional<int64_t> IntegralDouble(double d) {
    if (!std::isfinite(d) || std::trunc(d) != d || d < -kInt64Bound || d >= kInt64Bound) {
        return std::nullopt;
    }
    return static_cast<int64_t>(d);
}

// Exact integer value of a JSON number, if it has one that fits int64.
std::optional<int64_t> ExactInteger(const Value& v) {
    switch (v.kind()) {
        case Value::Kind::Int:
            return v.AsInt();
        case Value::Kind::Uint:
            if (v.AsUint() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return std::nullopt;
            }
            return static_cast<int64_t>(v.AsUint());
        case Value::Kind::Double:
            return IntegralDouble(v.AsDouble());
        default:
            return std::nullopt;
    }
}

Coerced AsText(const Value& v, bool fallback) {
    if (v.IsString()) return {SqlLiteral::Text(v.AsString()), fallback};
    return {SqlLiteral::Text(ToJson(v)), fallback};
}

Coerced ToInteger(const Value& v) {
    if (v.IsBool()) return {SqlLiteral::Integer(v.AsBool() ? 1 : 0)};
    if (auto i = ExactInteger(v)) return {SqlLiteral::Integer(*i)};
    if (v.IsString()) {
        const auto& s = v.AsString();
        if (s == "true") return {SqlLiteral::Integer(1)};
        if (s == "false") return {SqlLiteral::Integer(0)};
        if (auto i = ParseInteger(s)) return {SqlLiteral::Integer(*i)};
        if (auto d = ParseReal(s)) {
            if (auto i = IntegralDouble(*d)) return {SqlLiteral::Integer(*i)};
        }
    }
    return AsText(v, true);
}

Coerced ToReal(const Value& v) {
    if (v.IsNumber()) return {SqlLiteral::Real(v.ToDouble())};
    if (v.IsBool()) return {SqlLiteral::Real(v.AsBool() ? 1.0 : 0.0)};
    if (v.IsString()) {
        if (auto d = ParseReal(v.AsString())) return {SqlLiteral::Real(*d)};
    }
    return AsText(v, true);
}

// Numbers keep their exact form: integers stay integers
Coerced ToNumber(const Value& v) {
    if (auto i = ExactInteger(v); i && v.kind() != Value::Kind::Double) {
        return {SqlLiteral::Integer(*i)};
    }
    if (v.IsNumber()) return {SqlLiteral::Real(v.ToDouble())};
    return {SqlLiteral::Integer(v.AsBool() ? 1 : 0)};
}

}  // namespace

const SqlLiteral* Row::Find(std::string_view column) const {
    auto it = std::find_if(cells.begin(), cells.end(),
                           [&](const auto& cell) { return cell.first == column; });
    return it != cells.end() ? &it->second : nullptr;
}

Coerced Coerce(const Value& value, ColumnType type) {
    if (value.IsNull()) return {SqlLiteral::Null()};

    switch (type) {
        case ColumnType::Integer:
            return ToInteger(value);
        case ColumnType::Real:
            return ToReal(value);
        case ColumnType::Text:
            return AsText(value, false);
        case ColumnType::Blob:
            if (value.IsArray() || value.IsObject()) return {SqlLiteral::Blob(ToJson(value))};
            if (value.IsString()) return {SqlLiteral::Text(value.AsString())};
            return ToNumber(value);
        case ColumnType::Numeric:
            if (value.IsNumber() || value.IsBool()) return ToNumber(value);
            if (value.IsString()) {
                const auto& s = value.AsString();
                if (auto i = ParseInteger(s)) return {SqlLiteral::Integer(*i)};
                if (auto d = ParseReal(s)) return {SqlLiteral::Real(*d)};
                return {SqlLiteral::Text(s)};
            }
            return AsText(value, true);
    }
    return AsText(value, true);  // Unreachable
}

bool RecordTransformer::IsRekeyed(const ForeignKey& fk) const {
    if (!participating_.contains(fk.referenced_table)) return false;
    const auto* parent = schema_.Find(fk.referenced_table);
    const auto* key = parent ? parent->SurrogateKey() : nullptr;
    return key && (fk.referenced_column.empty() || fk.referenced_column == key->name);
}

std::expected<Row, Skip> RecordTransformer::Transform(const std::string& table,
                                                      const Value& document) {
    auto logger = log::Get(log::kTransformLogger);

    const auto* def = schema_.Find(table);
    if (!def) {
        return std::unexpected(Skip{ErrorCode::UnknownTable,
                                    fmt::format("{} is not a destination table", table)});
    }

    const auto* key = def->SurrogateKey();
    std::string original_id;
    if (key) {
        const auto* id_value = document.Find(key->name);
        auto id = id_value ? IdentifierOf(*id_value) : std::nullopt;
        if (!id) {
            return std::unexpected(Skip{
                ErrorCode::MissingIdentifier,
                fmt::format("{}: document has no identifier in column {}", table, key->name)});
        }
        original_id = std::move(*id);
        if (registry_.Contains(table, original_id)) {
            return std::unexpected(Skip{
                ErrorCode::DuplicateIdentifier,
                fmt::format("{}: identifier {} was already migrated", table, original_id),
                original_id});
        }
    }

    Row row;
    std::size_t key_cell = 0;
    for (const auto& column : def->columns()) {
        if (key && column.name == key->name) {
            key_cell = row.cells.size();
            row.cells.emplace_back(column.name, SqlLiteral::Null());
            continue;
        }

        const auto* value = document.Find(column.name);
        const auto* fk = def->ForeignKeyFor(column.name);

        if (fk && IsRekeyed(*fk)) {
            if (!value || value->IsNull()) {
                row.cells.emplace_back(column.name, SqlLiteral::Null());
                continue;
            }
            auto parent_id = IdentifierOf(*value);
            auto parent_key = parent_id ? registry_.Lookup(fk->referenced_table, *parent_id)
                                        : std::nullopt;
            if (!parent_key) {
                auto shown = parent_id ? *parent_id : ToJson(*value);
                return std::unexpected(Skip{
                    ErrorCode::MissingParent,
                    fmt::format("{} {}: {} references missing {} {}", table,
                                original_id.empty() ? "(no id)" : original_id, column.name,
                                fk->referenced_table, shown),
                    original_id, column.name, fk->referenced_table,
                    fk->referenced_table == table});
            }
            row.cells.emplace_back(column.name, SqlLiteral::Integer(*parent_key));
            continue;
        }

        if (!value) {
            // The destination default applies to omitted columns
            if (!column.default_value) {
                row.cells.emplace_back(column.name, SqlLiteral::Null());
            }
            continue;
        }

        auto coerced = Coerce(*value, column.type);
        if (coerced.fallback) {
            logger->warn("{} {}: value of {} does not fit {} column, stored as text", table,
                         original_id.empty() ? "(no id)" : original_id, column.name,
                         ColumnTypeName(column.type));
            row.fallbacks.push_back(column.name);
        }
        row.cells.emplace_back(column.name, std::move(coerced.literal));
    }

    if (key) {
        row.cells[key_cell].second = SqlLiteral::Integer(registry_.Assign(table, original_id));
        return row;
    }

    auto signature = RowSignature(*def, row);
    if (!emitted_rows_[table].insert(signature).second) {
        return std::unexpected(Skip{
            ErrorCode::DuplicateIdentifier,
            fmt::format("{}: row ({}) was already migrated", table, signature),
            signature});
    }
    return row;
}

std::string RecordTransformer::RowSignature(const TableDef& def, const Row& row) {
    std::vector<std::string> parts;
    for (const auto& column : def.columns()) {
        if (!column.primary_key) continue;
        const auto* cell = row.Find(column.name);
        if (!cell || cell->IsNull()) {
            parts.clear();
            break;
        }
        parts.push_back(cell->Render());
    }
    if (!parts.empty()) {
        return fmt::format("{}", fmt::join(parts, ", "));
    }
    for (const auto& [name, literal] : row.cells) {
        parts.push_back(fmt::format("{}={}", QuoteIdentifier(name), literal.Render()));
    }
    return fmt::format("{}", fmt::join(parts, ", "));
}

}  // namespace kvmigrate
