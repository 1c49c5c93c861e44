#pragma once

#include "graph/obligation_graph.hpp"

#include <string>
#include <vector>

namespace netclear {

/// Ordered parties [v0, ..., vk-1] with an edge between each consecutive
/// pair and from vk-1 back to v0. Length in edges equals size().
using Cycle = std::vector<PartyId>;

/// Rotate a cycle so it starts at the party whose name sorts first.
Cycle canonicalizeCycle(const ObligationGraph& graph, const Cycle& cycle);

/// Same, for cycles given by party name.
std::vector<std::string> canonicalizeCycle(const std::vector<std::string>& cycle);

/// Party names of a cycle, in order.
std::vector<std::string> cycleNames(const ObligationGraph& graph, const Cycle& cycle);

/// "A -> B -> C -> A"
std::string cycleToString(const ObligationGraph& graph, const Cycle& cycle);

} // namespace netclear
