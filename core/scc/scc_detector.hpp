#pragma once

#include "graph/obligation_graph.hpp"

#include <vector>

namespace netclear {

/// A strongly connected component: parties that can all reach each other.
using Scc = std::vector<PartyId>;

/// Tarjan's SCC algorithm over an ObligationGraph.
/// Runs on an explicit frame stack, so traversal depth is bounded by heap
/// memory rather than the call stack. Every party is tried as a root.
class SccDetector {
public:
    /// Components with at least two parties, in completion order.
    /// Members of each component are listed in stack-pop order.
    std::vector<Scc> detect(const ObligationGraph& graph) const;

    /// All components including singletons. Used by detect().
    std::vector<Scc> detectAll(const ObligationGraph& graph) const;
};

} // namespace netclear
