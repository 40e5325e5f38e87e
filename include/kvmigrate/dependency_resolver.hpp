// SPDX-License-Identifier: MIT

// include/kvmigrate/dependency_resolver.hpp
#pragma once

#include <expected>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "kvmigrate/error.hpp"
#include "kvmigrate/schema.hpp"

namespace kvmigrate {

/// table -> tables it references through foreign keys (self edges included).
using DependencyGraph = std::map<std::string, std::set<std::string>>;

/// Build the reference graph of every table in @p schema.
DependencyGraph BuildDependencyGraph(const SchemaModel& schema);

/// Order in which the tables of one run are processed.
struct ProcessingPlan {
    std::vector<std::string> order;         ///< Every referenced table precedes its referrers
    std::set<std::string> self_referencing; ///< Tables with an edge to themselves
};

/// Order @p tables so that every table follows the tables it references.
///
/// Only the subgraph induced by @p tables is considered: edges to other
/// tables impose no constraint. Self edges are removed and the table is
/// recorded in ProcessingPlan::self_referencing. Among tables that are ready
/// at the same time the lexically smallest name goes first, so the order is a
/// pure function of its inputs.
///
/// @return The plan, or CyclicDependency naming the tables that form a cycle.
///         Tables that merely depend on a cycle are not named.
std::expected<ProcessingPlan, Error> ResolveProcessingOrder(const std::set<std::string>& tables,
                                                            const DependencyGraph& graph);

}  // namespace kvmigrate
