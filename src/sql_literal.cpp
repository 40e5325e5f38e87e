// SPDX-License-Identifier: MIT

#include "kvmigrate/sql_literal.hpp"

#include <cmath>

#include <fmt/format.h>

namespace kvmigrate {

std::string EscapeSqlString(std::string_view s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        if (c == '\'') {
            result += "''";  // Double single quote
        } else {
            result += c;
        }
    }
    return result;
}

std::string QuoteIdentifier(std::string_view ident) {
    std::string result;
    result.reserve(ident.size() + 2);
    result += '"';
    for (char c : ident) {
        if (c == '"') {
            result += '"';  // Double the quote
        }
        result += c;
    }
    result += '"';
    return result;
}

std::string HexEncode(std::string_view bytes) {
    static constexpr char kDigits[] = "0123456789ABCDEF";
    std::string hex;
    hex.reserve(bytes.size() * 2);
    for (char c : bytes) {
        auto b = static_cast<unsigned char>(c);
        hex += kDigits[b >> 4];
        hex += kDigits[b & 0x0F];
    }
    return hex;
}

std::string FormatReal(double v) {
    if (!std::isfinite(v)) {
        return "NULL";
    }
    auto text = fmt::format("{}", v);
    // "3" would be read back as INTEGER
    if (text.find_first_of(".e") == std::string::npos) {
        text += ".0";
    }
    return text;
}

std::string SqlLiteral::Render() const {
    switch (kind()) {
        case Kind::Null:
            return "NULL";
        case Kind::Integer:
            return fmt::format("{}", AsInteger());
        case Kind::Real:
            return FormatReal(AsReal());
        case Kind::Text: {
            const auto& text = AsText();
            if (text.find('\0') != std::string::npos) {
                return fmt::format("CAST(X'{}' AS TEXT)", HexEncode(text));
            }
            return fmt::format("'{}'", EscapeSqlString(text));
        }
        case Kind::Blob:
            return fmt::format("X'{}'", HexEncode(AsBlob()));
    }
    return "NULL";  // Unreachable
}

}  // namespace kvmigrate
