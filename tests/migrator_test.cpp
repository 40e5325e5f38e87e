// SPDX-License-Identifier: MIT

// tests/migrator_test.cpp
#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <sstream>
#include <string>

#include "kvmigrate/json_parser.hpp"
#include "kvmigrate/migrator.hpp"
#include "test_support.hpp"

namespace kvmigrate {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::UnorderedElementsAre;

constexpr const char* kAccountProjectSchema = R"(
    CREATE TABLE account (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        name TEXT
    );
    CREATE TABLE project (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        name TEXT,
        account_id INTEGER REFERENCES account(id)
    );
)";

class MigratorTest : public ::testing::Test {
protected:
    std::filesystem::path Database() const { return dir_ / "database.sqlite"; }
    std::filesystem::path Export() const { return dir_ / "export"; }
    std::filesystem::path Output() const { return dir_ / "migrated_data.sql"; }

    void Document(const std::string& relative, const std::string& json) {
        test::WriteFile(Export() / relative, json);
    }

    MigrationConfig Config() const {
        MigrationConfig config;
        config.database_path = Database();
        config.export_root = Export();
        config.output_path = Output();
        return config;
    }

    // Run in memory and return the script
    std::expected<MigrationReport, Error> RunToString(const MigrationConfig& config,
                                                      std::string& script) {
        SqliteSchemaSource source(config.database_path.string());
        Migrator migrator(source, config);
        std::ostringstream out;
        auto report = migrator.Run(out);
        script = out.str();
        return report;
    }

    test::TempDir dir_;
};

TEST_F(MigratorTest, RewritesForeignKeysInDependencyOrder) {
    test::CreateDatabase(Database(), kAccountProjectSchema);
    Document("account/a1.json", R"({"id": "a1", "name": "Acme"})");
    Document("project__something_0000000001/p1.json",
             R"({"id": "p1", "name": "Demo", "account_id": "a1"})");

    auto report = RunMigration(Config());
    ASSERT_TRUE(report.has_value()) << report.error().message;

    ASSERT_EQ(report->tables.size(), 2u);
    EXPECT_EQ(report->tables[0].table, "account");
    EXPECT_EQ(report->tables[1].table, "project");

    auto script = test::ReadFile(Output());
    EXPECT_THAT(script, HasSubstr(
        R"(INSERT INTO "account" ("id", "name") VALUES (1, 'Acme');)"));
    EXPECT_THAT(script, HasSubstr(
        R"(INSERT INTO "project" ("id", "name", "account_id") VALUES (1, 'Demo', 1);)"));
    EXPECT_LT(script.find("INSERT INTO \"account\""), script.find("INSERT INTO \"project\""));
    EXPECT_EQ(script.find("'a1'"), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(Output().string() + ".tmp"));
}

TEST_F(MigratorTest, MissingParentIsReported) {
    test::CreateDatabase(Database(), kAccountProjectSchema);
    Document("account/a1.json", R"({"id": "a1", "name": "Acme"})");
    Document("project__something_0000000001/p1.json",
             R"({"id": "p1", "name": "Demo", "account_id": "missing"})");

    auto report = RunMigration(Config());
    ASSERT_TRUE(report.has_value());

    const auto* project = report->Find("project");
    ASSERT_NE(project, nullptr);
    EXPECT_EQ(project->discovered, 1u);
    EXPECT_EQ(project->emitted, 0u);
    EXPECT_EQ(project->SkippedTotal(), 1u);
    EXPECT_EQ(project->skipped.at(ErrorCode::MissingParent), 1u);

    ASSERT_EQ(report->skipped.size(), 1u);
    const auto& skip = report->skipped[0];
    EXPECT_EQ(skip.table, "project");
    EXPECT_EQ(skip.skip.original_id, "p1");
    EXPECT_EQ(skip.skip.referenced_table, "account");

    auto script = test::ReadFile(Output());
    EXPECT_EQ(script.find("INSERT INTO \"project\""), std::string::npos);
    // Nothing is cleared for a table that receives no rows
    EXPECT_EQ(script.find("DELETE FROM \"project\""), std::string::npos);
}

TEST_F(MigratorTest, CycleIsFatalAndWritesNothing) {
    test::CreateDatabase(Database(), R"(
        CREATE TABLE a (id INTEGER PRIMARY KEY, b_id INTEGER REFERENCES b(id));
        CREATE TABLE b (id INTEGER PRIMARY KEY, a_id INTEGER REFERENCES a(id));
    )");
    Document("a/1.json", R"({"id": 1, "b_id": 1})");
    Document("b/1.json", R"({"id": 1, "a_id": 1})");

    auto report = RunMigration(Config());
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code, ErrorCode::CyclicDependency);
    EXPECT_THAT(report.error().involved, UnorderedElementsAre("a", "b"));
    EXPECT_FALSE(std::filesystem::exists(Output()));
    EXPECT_FALSE(std::filesystem::exists(Output().string() + ".tmp"));
}

TEST_F(MigratorTest, EventsAreSortedByCreated) {
    test::CreateDatabase(Database(), R"(
        CREATE TABLE event (id INTEGER PRIMARY KEY AUTOINCREMENT, name TEXT, created INTEGER);
    )");
    Document("events/a.json", R"({"id": "e1", "name": "third", "created": 300})");
    Document("events/b.json", R"({"id": "e2", "name": "first", "created": 100})");
    Document("events/c.json", R"([{"id": "e3", "name": "second", "created": 200}])");

    auto config = Config();
    config.overrides["events"] = "event";
    std::string script;
    auto report = RunToString(config, script);
    ASSERT_TRUE(report.has_value());

    EXPECT_THAT(script, HasSubstr("-- SQL statements for table: event (sorted by created)"));
    auto first = script.find("'first'");
    auto second = script.find("'second'");
    auto third = script.find("'third'");
    ASSERT_NE(first, std::string::npos);
    EXPECT_LT(first, second);
    EXPECT_LT(second, third);
    EXPECT_THAT(script, HasSubstr(R"(VALUES (1, 'first', 100);)"));
}

TEST_F(MigratorTest, ChronologicalOrderHandlesMixedTimestamps) {
    std::vector<SourceDocument> docs;
    for (const char* json : {R"({"n": 1, "t": "2024-02-01"})", R"({"n": 2, "t": 5})",
                             R"({"n": 3})", R"({"n": 4, "t": "2024-01-01"})",
                             R"({"n": 5, "t": 2.5})", R"({"n": 6})"}) {
        auto parsed = ParseDocument(json);
        ASSERT_TRUE(parsed.has_value());
        docs.push_back(SourceDocument{"", *parsed});
    }
    std::vector<const SourceDocument*> order;
    for (const auto& d : docs) order.push_back(&d);

    SortChronologically(order, "t");
    std::vector<int64_t> ns;
    for (const auto* d : order) ns.push_back(d->body.Find("n")->AsInt());
    EXPECT_THAT(ns, ElementsAre(3, 6, 5, 2, 4, 1));
}

TEST_F(MigratorTest, SelfReferencesGetASecondPass) {
    test::CreateDatabase(Database(), R"(
        CREATE TABLE folder (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            name TEXT,
            parent_id INTEGER REFERENCES folder(id)
        );
    )");
    Document("folder/1.json", R"({"id": "child", "name": "child", "parent_id": "root"})");
    Document("folder/2.json", R"({"id": "root", "name": "root", "parent_id": null})");
    Document("folder/3.json", R"({"id": "orphan", "name": "orphan", "parent_id": "nowhere"})");

    std::string script;
    auto report = RunToString(Config(), script);
    ASSERT_TRUE(report.has_value());

    const auto* folder = report->Find("folder");
    ASSERT_NE(folder, nullptr);
    EXPECT_EQ(folder->emitted, 2u);
    EXPECT_EQ(folder->skipped.at(ErrorCode::MissingParent), 1u);
    EXPECT_THAT(script, HasSubstr(
        R"(INSERT INTO "folder" ("id", "name", "parent_id") VALUES (1, 'root', NULL);)"));
    EXPECT_THAT(script, HasSubstr(
        R"(INSERT INTO "folder" ("id", "name", "parent_id") VALUES (2, 'child', 1);)"));
    EXPECT_LT(script.find("'root'"), script.find("'child'"));
}

TEST_F(MigratorTest, ReportCountsEveryDocument) {
    test::CreateDatabase(Database(), kAccountProjectSchema);
    Document("account/a.json", R"([{"id": 1}, {"id": 2}, {"id": 1}, {"name": "anonymous"}])");
    Document("account/broken.json", "{oops");
    Document("unknown_0001/x.json", R"({"id": 1})");
    Document("session/s.json", R"({"id": 1})");

    auto report = RunMigration(Config());
    ASSERT_TRUE(report.has_value());
    const auto* account = report->Find("account");
    ASSERT_NE(account, nullptr);
    EXPECT_EQ(account->discovered, 5u);
    EXPECT_EQ(account->emitted, 2u);
    EXPECT_EQ(account->skipped.at(ErrorCode::DuplicateIdentifier), 1u);
    EXPECT_EQ(account->skipped.at(ErrorCode::MissingIdentifier), 1u);
    EXPECT_EQ(account->skipped.at(ErrorCode::InvalidDocumentFormat), 1u);
    EXPECT_EQ(account->discovered, account->emitted + account->SkippedTotal());

    ASSERT_EQ(report->excluded.size(), 2u);
    EXPECT_EQ(report->excluded[0].source, "session");
    EXPECT_EQ(report->excluded[1].source, "unknown_0001");

    auto lines = report->SummaryLines();
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_THAT(lines[0], HasSubstr("account: 5 discovered, 2 emitted, 3 skipped"));
}

TEST_F(MigratorTest, OutputIsDeterministic) {
    test::CreateDatabase(Database(), kAccountProjectSchema);
    for (int i = 0; i < 5; ++i) {
        Document("account_000" + std::to_string(i) + "/doc.json",
                 R"({"id": "acc)" + std::to_string(i) + R"(", "name": "n"})");
        Document("project/p" + std::to_string(i) + ".json",
                 R"({"id": )" + std::to_string(i) + R"(, "account_id": "acc)" +
                     std::to_string(4 - i) + R"("})");
    }

    std::string first;
    std::string second;
    ASSERT_TRUE(RunToString(Config(), first).has_value());
    ASSERT_TRUE(RunToString(Config(), second).has_value());
    EXPECT_FALSE(first.empty());
    EXPECT_EQ(first, second);
}

TEST_F(MigratorTest, ScriptAppliesCleanlyAndIdempotently) {
    test::CreateDatabase(Database(), kAccountProjectSchema);
    Document("account/a.json", R"([{"id": "x", "name": "It's"}, {"id": "y", "name": "Y"}])");
    Document("project/p.json", R"([{"id": 10, "name": "one", "account_id": "y"},
                                   {"id": 11, "name": "two", "account_id": "x"},
                                   {"id": 12, "name": "three"}])");

    auto report = RunMigration(Config());
    ASSERT_TRUE(report.has_value());
    auto script = test::ReadFile(Output());

    test::TestDatabase db(Database().string());
    db.Exec("INSERT INTO account (name) VALUES ('stale');");
    db.Exec(script);
    db.Exec(script);

    EXPECT_TRUE(db.Column("PRAGMA foreign_key_check").empty());

    EXPECT_EQ(db.Scalar("SELECT COUNT(*) FROM account"), "2");
    EXPECT_EQ(db.Scalar("SELECT COUNT(*) FROM project"), "3");
    EXPECT_THAT(db.Column("SELECT id FROM account ORDER BY id"), ElementsAre("1", "2"));
    EXPECT_EQ(db.Scalar("SELECT name FROM account WHERE id = 1"), "It's");
    EXPECT_EQ(db.Scalar("SELECT a.name FROM project p JOIN account a ON a.id = p.account_id "
                        "WHERE p.name = 'two'"),
              "It's");
    EXPECT_EQ(db.Scalar("SELECT COUNT(*) FROM project WHERE account_id IS NULL"), "1");
    // The sequence restarts from the migrated rows
    db.Exec("INSERT INTO account (name) VALUES ('next');");
    EXPECT_EQ(db.Scalar("SELECT MAX(id) FROM account"), "3");
}

TEST_F(MigratorTest, RepeatedNaturalKeyIsMigratedOnce) {
    test::CreateDatabase(Database(), R"(
        CREATE TABLE option (key VARCHAR(255) PRIMARY KEY NOT NULL, value VARCHAR(255));
    )");
    Document("option/a.json", R"({"key": "telegram_alert", "value": "on"})");
    Document("option/b.json", R"({"key": "telegram_alert", "value": "on"})");
    Document("option/c.json", R"({"key": "email_alert", "value": "off"})");

    auto report = RunMigration(Config());
    ASSERT_TRUE(report.has_value());
    const auto* option = report->Find("option");
    ASSERT_NE(option, nullptr);
    EXPECT_EQ(option->emitted, 2u);
    EXPECT_EQ(option->skipped.at(ErrorCode::DuplicateIdentifier), 1u);

    test::TestDatabase db(Database().string());
    db.Exec(test::ReadFile(Output()));
    EXPECT_THAT(db.Column("SELECT key FROM option ORDER BY key"),
                ElementsAre("email_alert", "telegram_alert"));
}

TEST_F(MigratorTest, ForeignKeysDeclaredInOtherCaseAreRewritten) {
    test::CreateDatabase(Database(), R"(
        CREATE TABLE project (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            account_id INTEGER REFERENCES Account(id)
        );
        CREATE TABLE account (id INTEGER PRIMARY KEY AUTOINCREMENT, name TEXT);
    )");
    Document("Account_0001/a.json", R"({"id": "acc-9", "name": "Acme"})");
    Document("project/p.json", R"({"id": 5, "account_id": "acc-9"})");

    std::string script;
    auto report = RunToString(Config(), script);
    ASSERT_TRUE(report.has_value()) << report.error().message;
    ASSERT_EQ(report->tables.size(), 2u);
    EXPECT_EQ(report->tables[0].table, "account");
    EXPECT_THAT(script, HasSubstr(
        R"(INSERT INTO "project" ("id", "account_id") VALUES (1, 1);)"));

    test::TestDatabase db(Database().string());
    db.Exec("PRAGMA foreign_keys = ON;");
    db.Exec(script);
    EXPECT_EQ(db.Scalar("SELECT a.name FROM project p JOIN account a ON a.id = p.account_id"),
              "Acme");
}

TEST_F(MigratorTest, PlanningFailures) {
    auto missing_db = RunMigration(Config());
    ASSERT_FALSE(missing_db.has_value());
    EXPECT_EQ(missing_db.error().code, ErrorCode::SchemaUnavailable);

    test::CreateDatabase(Database(), kAccountProjectSchema);
    auto missing_export = RunMigration(Config());
    ASSERT_FALSE(missing_export.has_value());
    EXPECT_EQ(missing_export.error().code, ErrorCode::ExportUnavailable);
    EXPECT_FALSE(std::filesystem::exists(Output()));
}

TEST_F(MigratorTest, UnwritableOutput) {
    test::CreateDatabase(Database(), kAccountProjectSchema);
    Document("account/a.json", R"({"id": 1})");
    auto config = Config();
    config.output_path = dir_ / "no" / "such" / "dir" / "out.sql";

    auto report = RunMigration(config);
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code, ErrorCode::OutputUnavailable);
}

}  // namespace
}  // namespace kvmigrate
