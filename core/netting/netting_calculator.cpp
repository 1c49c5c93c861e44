#include "netting/netting_calculator.hpp"

#include "util/errors.hpp"

#include <algorithm>
#include <vector>

namespace netclear {

std::set<std::string> tokensOnCycle(const ObligationGraph& graph, const Cycle& cycle) {
    std::set<std::string> tokens;
    for (size_t i = 0; i < cycle.size(); i++) {
        PartyId from = cycle[i];
        PartyId to = cycle[(i + 1) % cycle.size()];
        for (const Edge& e : graph.outgoing(from)) {
            if (e.to == to) tokens.insert(e.token);
        }
    }
    return tokens;
}

std::optional<uint64_t> calculateNettingAmount(const ObligationGraph& graph,
                                               const Cycle& cycle,
                                               const std::string& token) {
    if (cycle.empty()) return std::nullopt;

    std::optional<uint64_t> min_amount;
    for (size_t i = 0; i < cycle.size(); i++) {
        const Edge* e = graph.findEdge(cycle[i], cycle[(i + 1) % cycle.size()], token);
        if (!e) return std::nullopt;
        min_amount = min_amount ? std::min(*min_amount, e->amount) : e->amount;
    }
    return min_amount;
}

void applyNetting(ObligationGraph& graph, const Cycle& cycle,
                  const std::string& token, uint64_t amount) {
    std::vector<Edge*> edges;
    edges.reserve(cycle.size());

    for (size_t i = 0; i < cycle.size(); i++) {
        PartyId from = cycle[i];
        PartyId to = cycle[(i + 1) % cycle.size()];
        Edge* e = graph.findEdge(from, to, token);
        if (!e) {
            throw NettingInvariantError("no " + token + " edge " + graph.partyName(from) +
                                        " -> " + graph.partyName(to));
        }
        if (e->amount < amount) {
            throw NettingInvariantError("cannot subtract " + std::to_string(amount) +
                                        " from " + graph.partyName(from) + " -> " +
                                        graph.partyName(to) + " holding " +
                                        std::to_string(e->amount) + " " + token);
        }
        edges.push_back(e);
    }

    for (Edge* e : edges) {
        e->amount -= amount;
    }
}

} // namespace netclear
