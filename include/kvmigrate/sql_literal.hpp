// SPDX-License-Identifier: MIT

// include/kvmigrate/sql_literal.hpp
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace kvmigrate {

/// Double every single quote, for use inside a '...' literal.
std::string EscapeSqlString(std::string_view s);

/// Wrap an identifier in double quotes, doubling embedded double quotes.
std::string QuoteIdentifier(std::string_view ident);

/// Uppercase hex digits of @p bytes, two per byte.
std::string HexEncode(std::string_view bytes);

/// A value ready to be written into an INSERT statement.
///
/// Rendering never lets the payload escape its literal: text is quoted with
/// doubled single quotes, and text carrying NUL bytes (which SQLite would
/// truncate inside a quoted literal) is written as a cast hex blob.
class SqlLiteral {
public:
    enum class Kind { Null, Integer, Real, Text, Blob };

    /// Raw bytes, rendered as X'...'
    struct Bytes {
        std::string data;
        bool operator==(const Bytes&) const = default;
    };

    SqlLiteral() = default;

    static SqlLiteral Null() { return SqlLiteral(); }
    static SqlLiteral Integer(int64_t v) { return SqlLiteral(Data(v)); }
    static SqlLiteral Real(double v) { return SqlLiteral(Data(v)); }
    static SqlLiteral Text(std::string s) { return SqlLiteral(Data(std::move(s))); }
    static SqlLiteral Blob(std::string bytes) { return SqlLiteral(Data(Bytes{std::move(bytes)})); }

    Kind kind() const { return static_cast<Kind>(data_.index()); }
    bool IsNull() const { return kind() == Kind::Null; }

    int64_t AsInteger() const { return std::get<int64_t>(data_); }
    double AsReal() const { return std::get<double>(data_); }
    const std::string& AsText() const { return std::get<std::string>(data_); }
    const std::string& AsBlob() const { return std::get<Bytes>(data_).data; }

    /// SQL text of the literal, e.g. NULL, 42, 1.5, 'it''s', X'00FF'.
    std::string Render() const;

    bool operator==(const SqlLiteral&) const = default;

private:
    using Data = std::variant<std::monostate, int64_t, double, std::string, Bytes>;

    explicit SqlLiteral(Data data) : data_(std::move(data)) {}

    Data data_;
};

/// Shortest round-trip text of a double that SQLite reads back as REAL.
/// Non-finite values have no literal and render as NULL.
std::string FormatReal(double v);

}  // namespace kvmigrate
