// SPDX-License-Identifier: MIT

#include "kvmigrate/dependency_resolver.hpp"

#include <functional>
#include <queue>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "kvmigrate/log.hpp"

namespace kvmigrate {

namespace {

// Tables left over after Kahn's pass either sit on a cycle or depend on one.
// Peel off those no leftover table references until only cycles remain.
std::set<std::string> CycleMembers(std::set<std::string> remaining,
                                   const std::map<std::string, std::set<std::string>>& deps) {
    bool changed = true;
    while (changed) {
        changed = false;
        for (auto it = remaining.begin(); it != remaining.end();) {
            bool referenced = false;
            for (const auto& other : remaining) {
                if (other != *it && deps.at(other).contains(*it)) {
                    referenced = true;
                    break;
                }
            }
            if (referenced) {
                ++it;
            } else {
                it = remaining.erase(it);
                changed = true;
            }
        }
    }
    return remaining;
}

}  // namespace

DependencyGraph BuildDependencyGraph(const SchemaModel& schema) {
    DependencyGraph graph;
    for (const auto& name : schema.TableNames()) {
        graph[name] = schema.DependenciesOf(name);
    }
    return graph;
}

std::expected<ProcessingPlan, Error> ResolveProcessingOrder(const std::set<std::string>& tables,
                                                            const DependencyGraph& graph) {
    auto logger = log::Get(log::kResolverLogger);
    ProcessingPlan plan;

    // Induced subgraph: deps[t] holds the in-run tables t references
    std::map<std::string, std::set<std::string>> deps;
    std::map<std::string, std::vector<std::string>> dependents;
    for (const auto& table : tables) {
        auto& own = deps[table];
        auto it = graph.find(table);
        if (it == graph.end()) continue;
        for (const auto& target : it->second) {
            if (target == table) {
                plan.self_referencing.insert(table);
            } else if (tables.contains(target)) {
                own.insert(target);
                dependents[target].push_back(table);
            }
        }
    }

    std::map<std::string, std::size_t> in_degree;
    std::priority_queue<std::string, std::vector<std::string>, std::greater<>> ready;
    for (const auto& [table, own] : deps) {
        in_degree[table] = own.size();
        if (own.empty()) ready.push(table);
    }

    while (!ready.empty()) {
        auto table = ready.top();
        ready.pop();
        plan.order.push_back(table);
        for (const auto& dependent : dependents[table]) {
            if (--in_degree[dependent] == 0) ready.push(dependent);
        }
    }

    if (plan.order.size() != tables.size()) {
        std::set<std::string> remaining;
        for (const auto& [table, degree] : in_degree) {
            if (degree > 0) remaining.insert(table);
        }
        auto cycle = CycleMembers(std::move(remaining), deps);
        std::vector<std::string> involved(cycle.begin(), cycle.end());
        logger->error("circular foreign key dependency between tables: {}",
                      fmt::join(involved, ", "));
        return std::unexpected(Error{
            ErrorCode::CyclicDependency,
            fmt::format("circular foreign key dependency between tables: {}",
                        fmt::join(involved, ", ")),
            std::move(involved)});
    }

    for (const auto& table : plan.self_referencing) {
        logger->debug("{} references itself; unresolved rows get a second pass", table);
    }
    logger->info("processing order: {}", fmt::join(plan.order, " -> "));
    return plan;
}

}  // namespace kvmigrate
