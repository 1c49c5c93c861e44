#include "cycles/cycle_enumerator.hpp"

#include <algorithm>
#include <unordered_map>

namespace netclear {

namespace {

struct Frame {
    size_t vertex;      // local index into the SCC
    size_t next_succ;
};

} // namespace

std::vector<Cycle> CycleEnumerator::enumerate(const ObligationGraph& graph, const Scc& scc,
                                              ExplorationBudget& budget) const {
    std::vector<Cycle> cycles;
    if (scc.empty() || max_cycle_length_ == 0) return cycles;

    // Local arena: SCC members get dense indices, ranked by party name.
    std::vector<PartyId> members(scc.begin(), scc.end());
    std::sort(members.begin(), members.end(), [&graph](PartyId a, PartyId b) {
        return graph.partyName(a) < graph.partyName(b);
    });
    std::unordered_map<PartyId, size_t> local;
    for (size_t i = 0; i < members.size(); i++) local.emplace(members[i], i);

    // Distinct successors inside the SCC, in edge order.
    std::vector<std::vector<size_t>> succ(members.size());
    for (size_t i = 0; i < members.size(); i++) {
        for (const Edge& e : graph.outgoing(members[i])) {
            auto it = local.find(e.to);
            if (it == local.end()) continue;
            auto& list = succ[i];
            if (std::find(list.begin(), list.end(), it->second) == list.end()) {
                list.push_back(it->second);
            }
        }
    }

    std::vector<bool> on_path(members.size(), false);
    std::vector<size_t> path;
    std::vector<Frame> frames;

    for (size_t start = 0; start < members.size(); start++) {
        path.assign(1, start);
        on_path[start] = true;
        frames.assign(1, {start, 0});

        while (!frames.empty()) {
            Frame& frame = frames.back();
            if (frame.next_succ >= succ[frame.vertex].size()) {
                on_path[frame.vertex] = false;
                path.pop_back();
                frames.pop_back();
                continue;
            }

            size_t w = succ[frame.vertex][frame.next_succ];
            frame.next_succ++;
            budget.recordExpansion();

            if (w == start) {
                budget.recordCycle();
                Cycle cycle;
                cycle.reserve(path.size());
                for (size_t idx : path) cycle.push_back(members[idx]);
                cycles.push_back(std::move(cycle));
                continue;
            }
            if (on_path[w] || path.size() >= max_cycle_length_) continue;
            if (dedupe_rotations_ && w < start) continue;

            on_path[w] = true;
            path.push_back(w);
            frames.push_back({w, 0});
        }
    }
    return cycles;
}

} // namespace netclear
