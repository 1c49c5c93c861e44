#pragma once

#include "cycles/cycle.hpp"
#include "graph/obligation_graph.hpp"

#include <cstdint>
#include <optional>
#include <set>
#include <string>

namespace netclear {

/// Every token labeling an edge between some consecutive pair of the cycle
/// (wraparound included). Sorted, so per-cycle processing is deterministic.
std::set<std::string> tokensOnCycle(const ObligationGraph& graph, const Cycle& cycle);

/// The largest amount of `token` that can be canceled around `cycle`: the
/// minimum amount over the cycle's `token` edges. Empty when the cycle is
/// empty or some consecutive pair has no edge carrying `token`.
std::optional<uint64_t> calculateNettingAmount(const ObligationGraph& graph,
                                               const Cycle& cycle,
                                               const std::string& token);

/// Subtract `amount` from the `token` edge of every consecutive pair.
/// Every position is checked before any edge changes; a missing edge or an
/// edge holding less than `amount` throws NettingInvariantError and leaves
/// the graph untouched.
void applyNetting(ObligationGraph& graph, const Cycle& cycle,
                  const std::string& token, uint64_t amount);

} // namespace netclear
