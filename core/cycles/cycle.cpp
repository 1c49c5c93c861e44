#include "cycles/cycle.hpp"

#include <algorithm>

namespace netclear {

namespace {

template <typename T, typename Less>
std::vector<T> rotateToMin(const std::vector<T>& cycle, Less less) {
    if (cycle.empty()) return cycle;
    auto smallest = std::min_element(cycle.begin(), cycle.end(), less);
    std::vector<T> rotated(cycle.begin(), cycle.end());
    std::rotate(rotated.begin(), rotated.begin() + (smallest - cycle.begin()), rotated.end());
    return rotated;
}

} // namespace

Cycle canonicalizeCycle(const ObligationGraph& graph, const Cycle& cycle) {
    return rotateToMin(cycle, [&graph](PartyId a, PartyId b) {
        return graph.partyName(a) < graph.partyName(b);
    });
}

std::vector<std::string> canonicalizeCycle(const std::vector<std::string>& cycle) {
    return rotateToMin(cycle, [](const std::string& a, const std::string& b) {
        return a < b;
    });
}

std::vector<std::string> cycleNames(const ObligationGraph& graph, const Cycle& cycle) {
    std::vector<std::string> names;
    names.reserve(cycle.size());
    for (PartyId p : cycle) names.push_back(graph.partyName(p));
    return names;
}

std::string cycleToString(const ObligationGraph& graph, const Cycle& cycle) {
    if (cycle.empty()) return "";
    std::string out;
    for (PartyId p : cycle) {
        out += graph.partyName(p);
        out += " -> ";
    }
    out += graph.partyName(cycle.front());
    return out;
}

} // namespace netclear
