// SPDX-License-Identifier: MIT

#include "kvmigrate/migrator.hpp"

#include <algorithm>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include <fmt/format.h>

#include "kvmigrate/dependency_resolver.hpp"
#include "kvmigrate/identifier_registry.hpp"
#include "kvmigrate/log.hpp"
#include "kvmigrate/record_transformer.hpp"
#include "kvmigrate/statement_emitter.hpp"

namespace kvmigrate {

namespace {

// 0: missing or null, 1: number, 2: string, 3: anything else
int TimestampRank(const Value* v) {
    if (!v || v->IsNull()) return 0;
    if (v->IsNumber()) return 1;
    if (v->IsString()) return 2;
    return 3;
}

// Records skips and tallies for one table
class TableRun {
public:
    TableRun(TableReport& report, std::vector<SkippedRecord>& skipped)
        : report_(report), skipped_(skipped) {}

    void Emitted(const Row& row) {
        ++report_.emitted;
        report_.fallbacks += row.fallbacks.size();
    }

    void Skipped(const std::string& origin, Skip skip) {
        auto logger = log::Get(log::kMigrateLogger);
        logger->warn("skipping {} ({}): {}", origin, error_name(skip.reason), skip.message);
        ++report_.skipped[skip.reason];
        skipped_.push_back(SkippedRecord{report_.table, origin, std::move(skip)});
    }

private:
    TableReport& report_;
    std::vector<SkippedRecord>& skipped_;
};

}  // namespace

void SortChronologically(std::vector<const SourceDocument*>& documents, const std::string& field) {
    std::stable_sort(documents.begin(), documents.end(),
                     [&](const SourceDocument* a, const SourceDocument* b) {
                         const auto* va = a->body.Find(field);
                         const auto* vb = b->body.Find(field);
                         int ra = TimestampRank(va);
                         int rb = TimestampRank(vb);
                         if (ra != rb) return ra < rb;
                         if (ra == 1) return va->ToDouble() < vb->ToDouble();
                         if (ra == 2) return va->AsString() < vb->AsString();
                         return false;
                     });
}

std::expected<MigrationReport, Error> Migrator::Run(std::ostream& out) {
    auto logger = log::Get(log::kMigrateLogger);

    auto schema = source_.Load();
    if (!schema) {
        logger->error("{}", schema.error().message);
        return std::unexpected(schema.error());
    }

    auto catalog = DiscoverSources(config_.export_root, config_.overrides, *schema);
    if (!catalog) {
        logger->error("{}", catalog.error().message);
        return std::unexpected(catalog.error());
    }

    std::set<std::string> tables;
    for (const auto& [table, group] : catalog->groups) {
        tables.insert(table);
    }
    auto graph = BuildDependencyGraph(*schema);
    auto plan = ResolveProcessingOrder(tables, graph);
    if (!plan) {
        return std::unexpected(plan.error());
    }

    IdentifierRegistry registry;
    RecordTransformer transformer(*schema, registry, tables);
    StatementEmitter emitter(schema->HasSequenceTable());
    MigrationReport report;
    report.excluded = catalog->excluded;

    for (const auto& table : plan->order) {
        for (const auto& parent : graph[table]) {
            if (parent != table && tables.contains(parent) && !registry.IsSealed(parent)) {
                throw std::logic_error(
                    fmt::format("{} processed before its parent table {}", table, parent));
            }
        }

        const auto& group = catalog->groups.at(table);
        auto& table_report = report.tables.emplace_back();
        table_report.table = table;
        table_report.sources = group.sources;
        table_report.discovered = group.documents.size() + group.failures.size();
        TableRun run(table_report, report.skipped);

        for (const auto& failure : group.failures) {
            run.Skipped(failure.path, Skip{failure.error.code, failure.error.message});
        }

        std::vector<const SourceDocument*> documents;
        documents.reserve(group.documents.size());
        for (const auto& document : group.documents) {
            documents.push_back(&document);
        }

        std::string note;
        if (auto it = config_.chronological.find(table); it != config_.chronological.end()) {
            SortChronologically(documents, it->second);
            note = fmt::format("sorted by {}", it->second);
        }
        emitter.BeginTable(table, note);

        bool self_referencing = plan->self_referencing.contains(table);
        std::vector<const SourceDocument*> deferred;
        for (const auto* document : documents) {
            auto row = transformer.Transform(table, document->body);
            if (row) {
                emitter.AddRow(*row);
                run.Emitted(*row);
            } else if (self_referencing && row.error().self_reference) {
                deferred.push_back(document);
            } else {
                run.Skipped(document->origin, std::move(row.error()));
            }
        }

        // Parents that appeared later in the table are registered by now
        if (!deferred.empty()) {
            logger->debug("{}: retrying {} rows with forward self references", table,
                          deferred.size());
        }
        for (const auto* document : deferred) {
            auto row = transformer.Transform(table, document->body);
            if (row) {
                emitter.AddRow(*row);
                run.Emitted(*row);
            } else {
                run.Skipped(document->origin, std::move(row.error()));
            }
        }

        registry.Seal(table);
        logger->info("{}: {} rows emitted, {} skipped", table, table_report.emitted,
                     table_report.SkippedTotal());
    }

    emitter.Write(out);
    return report;
}

std::expected<MigrationReport, Error> RunMigration(const MigrationConfig& config) {
    auto logger = log::Get(log::kMigrateLogger);

    SqliteSchemaSource source(config.database_path.string());
    Migrator migrator(source, config);

    std::ostringstream script;
    auto report = migrator.Run(script);
    if (!report) return report;

    const auto& output = config.output_path;
    auto staging = output;
    staging += ".tmp";
    auto output_failure = [&](std::string what) {
        std::error_code ignored;
        std::filesystem::remove(staging, ignored);
        auto message = fmt::format("cannot write {}: {}", output.string(), what);
        logger->error("{}", message);
        return std::unexpected(Error{ErrorCode::OutputUnavailable, message, {output.string()}});
    };

    {
        std::ofstream file(staging, std::ios::binary | std::ios::trunc);
        if (!file) return output_failure("cannot create file");
        file << script.str();
        file.flush();
        if (!file) return output_failure("write failed");
    }

    std::error_code ec;
    std::filesystem::rename(staging, output, ec);
    if (ec) return output_failure(ec.message());

    logger->info("wrote {} statements to {}", report->TotalEmitted(), output.string());
    return report;
}

}  // namespace kvmigrate
