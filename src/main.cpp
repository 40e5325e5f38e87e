// SPDX-License-Identifier: MIT

#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "kvmigrate/config.hpp"
#include "kvmigrate/log.hpp"
#include "kvmigrate/migrator.hpp"
#include "kvmigrate/schema_source.hpp"

using namespace kvmigrate;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFatal = 1;
constexpr int kExitUsage = 2;

int PrintRelationships(const MigrationConfig& config) {
    SqliteSchemaSource source(config.database_path.string());
    auto schema = source.Load();
    if (!schema) {
        log::Get()->error("{}", schema.error().message);
        return kExitFatal;
    }
    for (const auto& line : schema->RelationshipSummary()) {
        std::cout << line << '\n';
    }
    return kExitOk;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    auto cli = ParseCommandLine(args);
    if (!cli) {
        std::cerr << "Error: " << cli.error().message << "\n\n" << Usage(argv[0]);
        return kExitUsage;
    }
    if (cli->help) {
        std::cout << Usage(argv[0]);
        return kExitOk;
    }

    const auto& config = cli->config;
    if (auto logging = log::Init(config.logging); !logging) {
        std::cerr << "Error: " << logging.error().message << '\n';
        log::Shutdown();
        return kExitUsage;
    }

    int status = kExitOk;
    try {
        auto logger = log::Get();
        if (config.show_relationships) {
            status = PrintRelationships(config);
        } else {
            logger->info("migrating {} into {} (schema from {})", config.export_root.string(),
                         config.output_path.string(), config.database_path.string());
            auto report = RunMigration(config);
            if (!report) {
                logger->error("migration failed ({}): {}", error_name(report.error().code),
                              report.error().message);
                status = kExitFatal;
            } else {
                for (const auto& line : report->SummaryLines()) {
                    std::cout << line << '\n';
                }
                logger->info("{} rows emitted, {} skipped", report->TotalEmitted(),
                             report->TotalSkipped());
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << '\n';
        status = kExitFatal;
    }

    log::Shutdown();
    return status;
}
