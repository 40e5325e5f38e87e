// SPDX-License-Identifier: MIT

// tests/sql_literal_test.cpp
#include <gtest/gtest.h>

#include <limits>
#include <string>
#include <utility>

#include <sqlite3.h>

#include "kvmigrate/sql_literal.hpp"
#include "test_support.hpp"

namespace kvmigrate {
namespace {

TEST(SqlLiteralTest, EscapeSqlString) {
    EXPECT_EQ(EscapeSqlString("plain"), "plain");
    EXPECT_EQ(EscapeSqlString("it's"), "it''s");
    EXPECT_EQ(EscapeSqlString("''"), "''''");
}

TEST(SqlLiteralTest, QuoteIdentifier) {
    EXPECT_EQ(QuoteIdentifier("account"), "\"account\"");
    EXPECT_EQ(QuoteIdentifier("odd\"name"), "\"odd\"\"name\"");
    EXPECT_EQ(QuoteIdentifier("select"), "\"select\"");
}

TEST(SqlLiteralTest, HexEncode) {
    EXPECT_EQ(HexEncode(std::string("\x00\xff\x10", 3)), "00FF10");
    EXPECT_EQ(HexEncode("{}"), "7B7D");
}

TEST(SqlLiteralTest, Render) {
    EXPECT_EQ(SqlLiteral::Null().Render(), "NULL");
    EXPECT_EQ(SqlLiteral::Integer(-42).Render(), "-42");
    EXPECT_EQ(SqlLiteral::Real(1.5).Render(), "1.5");
    EXPECT_EQ(SqlLiteral::Real(3.0).Render(), "3.0");
    EXPECT_EQ(SqlLiteral::Text("O'Brien").Render(), "'O''Brien'");
    EXPECT_EQ(SqlLiteral::Text("line1\nline2").Render(), "'line1\nline2'");
    EXPECT_EQ(SqlLiteral::Blob("{\"a\":1}").Render(), "X'7B2261223A317D'");
    EXPECT_EQ(SqlLiteral::Text(std::string("a\0b", 3)).Render(), "CAST(X'610062' AS TEXT)");
}

TEST(SqlLiteralTest, FormatReal) {
    EXPECT_EQ(FormatReal(0.1), "0.1");
    EXPECT_EQ(FormatReal(-2.0), "-2.0");
    EXPECT_EQ(FormatReal(1e300), "1e+300");
    EXPECT_EQ(FormatReal(std::numeric_limits<double>::quiet_NaN()), "NULL");
}

TEST(SqlLiteralTest, Equality) {
    EXPECT_EQ(SqlLiteral::Integer(1), SqlLiteral::Integer(1));
    EXPECT_NE(SqlLiteral::Integer(1), SqlLiteral::Real(1.0));
    EXPECT_NE(SqlLiteral::Text("x"), SqlLiteral::Blob("x"));
    EXPECT_TRUE(SqlLiteral().IsNull());
}

// Evaluate a rendered literal in SQLite and return (typeof, raw bytes)
std::pair<std::string, std::string> Evaluate(const std::string& literal) {
    test::TestDatabase db;
    auto sql = "SELECT typeof(v), v FROM (SELECT " + literal + " AS v)";
    sqlite3_stmt* stmt = nullptr;
    EXPECT_EQ(sqlite3_prepare_v2(db.get(), sql.c_str(), -1, &stmt, nullptr), SQLITE_OK) << sql;
    EXPECT_EQ(sqlite3_step(stmt), SQLITE_ROW);
    std::string type = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
    const auto* bytes = static_cast<const char*>(sqlite3_column_blob(stmt, 1));
    std::string value = bytes ? std::string(bytes, sqlite3_column_bytes(stmt, 1)) : "";
    EXPECT_EQ(sqlite3_step(stmt), SQLITE_DONE) << "literal spilled into extra rows";
    sqlite3_finalize(stmt);
    return {type, value};
}

TEST(SqlLiteralTest, HostileTextReadsBackExactly) {
    const std::string inputs[] = {
        "'; DROP TABLE account; --",
        "\"); DELETE FROM project; --",
        "quote ' and '' double",
        "multi\nline\r\ntext",
        std::string("nul\0inside'", 11),
        "unicode \xC3\xA9\xE2\x82\xAC",
        "",
    };
    for (const auto& input : inputs) {
        auto [type, value] = Evaluate(SqlLiteral::Text(input).Render());
        EXPECT_EQ(type, "text") << input;
        EXPECT_EQ(value, input);
    }
}

TEST(SqlLiteralTest, NumbersAndBlobsReadBack) {
    EXPECT_EQ(Evaluate(SqlLiteral::Integer(9223372036854775807).Render()).first, "integer");
    EXPECT_EQ(Evaluate(SqlLiteral::Integer(9223372036854775807).Render()).second,
              "9223372036854775807");
    EXPECT_EQ(Evaluate(SqlLiteral::Real(2.0).Render()).first, "real");
    EXPECT_EQ(Evaluate(SqlLiteral::Real(0.1).Render()).second, "0.1");

    auto [type, bytes] = Evaluate(SqlLiteral::Blob(std::string("\x00\x01'", 3)).Render());
    EXPECT_EQ(type, "blob");
    EXPECT_EQ(bytes, std::string("\x00\x01'", 3));
}

}  // namespace
}  // namespace kvmigrate
