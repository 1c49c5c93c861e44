#pragma once

#include "cycles/cycle.hpp"
#include "cycles/exploration_budget.hpp"
#include "graph/obligation_graph.hpp"
#include "scc/scc_detector.hpp"

#include <cstddef>
#include <vector>

namespace netclear {

/// Bounded enumeration of simple directed cycles inside one SCC.
///
/// Each SCC member is tried as a start vertex and a depth-first search on an
/// explicit stack follows edges to members not already on the path, closing
/// a cycle whenever an edge returns to the start. Parallel edges with
/// different tokens lead to the same successor and are followed once; a
/// cycle is identified by its vertex sequence.
///
/// With dedupe_rotations, a search from `start` only enters members whose
/// name sorts after start's, so every cycle is found exactly once, already
/// in canonical rotation. Without it, every rotation is reported.
class CycleEnumerator {
public:
    CycleEnumerator(size_t max_cycle_length, bool dedupe_rotations = true)
        : max_cycle_length_(max_cycle_length), dedupe_rotations_(dedupe_rotations) {}

    /// Cycles of 1..max_cycle_length edges within `scc`. Charges every
    /// expansion and cycle to `budget`, which throws ExplorationLimitError
    /// once a bound is exceeded.
    std::vector<Cycle> enumerate(const ObligationGraph& graph, const Scc& scc,
                                 ExplorationBudget& budget) const;

    size_t maxCycleLength() const { return max_cycle_length_; }
    bool dedupesRotations() const { return dedupe_rotations_; }

private:
    size_t max_cycle_length_;
    bool dedupe_rotations_;
};

} // namespace netclear
