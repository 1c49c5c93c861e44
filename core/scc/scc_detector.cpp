#include "scc/scc_detector.hpp"

#include <algorithm>
#include <limits>

namespace netclear {

namespace {

constexpr size_t kUnvisited = std::numeric_limits<size_t>::max();

struct Frame {
    PartyId vertex;
    size_t next_edge;
};

} // namespace

std::vector<Scc> SccDetector::detect(const ObligationGraph& graph) const {
    std::vector<Scc> all = detectAll(graph);
    std::vector<Scc> result;
    for (Scc& scc : all) {
        if (scc.size() > 1) result.push_back(std::move(scc));
    }
    return result;
}

std::vector<Scc> SccDetector::detectAll(const ObligationGraph& graph) const {
    const size_t n = graph.partyCount();
    std::vector<size_t> index(n, kUnvisited);
    std::vector<size_t> lowlink(n, 0);
    std::vector<bool> on_stack(n, false);
    std::vector<PartyId> stack;
    std::vector<Frame> frames;
    std::vector<Scc> sccs;
    size_t next_index = 0;

    auto visit = [&](PartyId v) {
        index[v] = next_index;
        lowlink[v] = next_index;
        next_index++;
        stack.push_back(v);
        on_stack[v] = true;
        frames.push_back({v, 0});
    };

    for (PartyId root = 0; root < n; root++) {
        if (index[root] != kUnvisited) continue;
        visit(root);

        while (!frames.empty()) {
            Frame& frame = frames.back();
            PartyId v = frame.vertex;
            const std::vector<Edge>& edges = graph.outgoing(v);

            if (frame.next_edge < edges.size()) {
                PartyId w = edges[frame.next_edge].to;
                frame.next_edge++;
                if (index[w] == kUnvisited) {
                    // frame is invalidated by the push inside visit()
                    visit(w);
                } else if (on_stack[w]) {
                    lowlink[v] = std::min(lowlink[v], index[w]);
                }
                continue;
            }

            // All successors done: v is finished.
            frames.pop_back();
            if (lowlink[v] == index[v]) {
                Scc scc;
                PartyId w;
                do {
                    w = stack.back();
                    stack.pop_back();
                    on_stack[w] = false;
                    scc.push_back(w);
                } while (w != v);
                sccs.push_back(std::move(scc));
            }
            if (!frames.empty()) {
                PartyId parent = frames.back().vertex;
                lowlink[parent] = std::min(lowlink[parent], lowlink[v]);
            }
        }
    }
    return sccs;
}

} // namespace netclear
