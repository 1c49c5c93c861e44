#include "verification/conservation.hpp"

#include <set>

namespace netclear {

namespace {

FlowTotal plus(const FlowTotal& a, const FlowTotal& b) {
    FlowTotal r;
    r.low = a.low + b.low;
    r.high = a.high + b.high + (r.low < a.low ? 1 : 0);
    return r;
}

// Requires !(a < b).
FlowTotal minus(const FlowTotal& a, const FlowTotal& b) {
    FlowTotal r;
    r.low = a.low - b.low;
    r.high = a.high - b.high - (a.low < b.low ? 1 : 0);
    return r;
}

std::string toString(const FlowTotal& t) {
    if (t.high == 0) return std::to_string(t.low);
    return std::to_string(t.high) + "*2^64+" + std::to_string(t.low);
}

std::string describe(const Position& p) {
    if (!(p.inflow < p.outflow)) return "+" + toString(minus(p.inflow, p.outflow));
    return "-" + toString(minus(p.outflow, p.inflow));
}

} // namespace

void FlowTotal::add(uint64_t amount) {
    low += amount;
    if (low < amount) high++;
}

// in_a - out_a == in_b - out_b  <=>  in_a + out_b == in_b + out_a
bool Position::sameNet(const Position& other) const {
    return plus(inflow, other.outflow) == plus(other.inflow, outflow);
}

NetPositions computeNetPositions(const std::vector<Intent>& intents) {
    NetPositions positions;
    for (const Intent& intent : intents) {
        positions[intent.sender][intent.token].outflow.add(intent.amount);
        positions[intent.receiver][intent.token].inflow.add(intent.amount);
    }
    return positions;
}

std::vector<ConservationResult> checkConservation(const std::vector<Intent>& before,
                                                  const std::vector<Intent>& after) {
    NetPositions pre = computeNetPositions(before);
    NetPositions post = computeNetPositions(after);
    std::vector<ConservationResult> results;

    std::set<std::pair<std::string, std::string>> keys;
    for (const auto& [party, tokens] : pre)
        for (const auto& [token, _] : tokens) keys.emplace(party, token);
    for (const auto& [party, tokens] : post)
        for (const auto& [token, _] : tokens) keys.emplace(party, token);

    for (const auto& [party, token] : keys) {
        Position a, b;
        auto pit = pre.find(party);
        if (pit != pre.end() && pit->second.count(token)) a = pit->second.at(token);
        auto qit = post.find(party);
        if (qit != post.end() && qit->second.count(token)) b = qit->second.at(token);

        if (!a.sameNet(b)) {
            results.push_back({false, party, token,
                "Net position of " + party + " in " + token + " changed from " +
                describe(a) + " to " + describe(b)});
        }
    }

    if (results.empty()) {
        results.push_back({true, "", "", "All net positions conserved"});
    }
    return results;
}

} // namespace netclear
