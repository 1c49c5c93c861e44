#include "graph/obligation_graph.hpp"

#include <limits>
#include <stdexcept>

namespace netclear {

ObligationGraph ObligationGraph::fromIntents(const std::vector<Intent>& intents) {
    ObligationGraph g;
    for (const Intent& intent : intents) {
        g.addEdge(intent.sender, intent.receiver, intent.token, intent.amount);
    }
    return g;
}

// ─── Party operations ──────────────────────────────────────────

PartyId ObligationGraph::addParty(const std::string& name) {
    auto it = ids_.find(name);
    if (it != ids_.end()) return it->second;

    if (names_.size() >= std::numeric_limits<PartyId>::max()) {
        throw std::length_error("Too many parties in obligation graph");
    }
    PartyId id = static_cast<PartyId>(names_.size());
    names_.push_back(name);
    outgoing_.emplace_back();
    ids_.emplace(name, id);
    return id;
}

std::optional<PartyId> ObligationGraph::findParty(const std::string& name) const {
    auto it = ids_.find(name);
    if (it == ids_.end()) return std::nullopt;
    return it->second;
}

const std::string& ObligationGraph::partyName(PartyId id) const {
    checkParty(id);
    return names_[id];
}

void ObligationGraph::checkParty(PartyId id) const {
    if (id >= names_.size()) {
        throw std::out_of_range("Party not found: " + std::to_string(id));
    }
}

// ─── Edge operations ───────────────────────────────────────────

void ObligationGraph::addEdge(const std::string& from, const std::string& to,
                              const std::string& token, uint64_t amount) {
    PartyId f = addParty(from);
    PartyId t = addParty(to);
    addEdge(f, t, token, amount);
}

void ObligationGraph::addEdge(PartyId from, PartyId to,
                              const std::string& token, uint64_t amount) {
    checkParty(from);
    checkParty(to);

    Edge* existing = findEdge(from, to, token);
    if (existing) {
        if (amount > std::numeric_limits<uint64_t>::max() - existing->amount) {
            throw std::overflow_error("Edge amount overflow: " + names_[from] +
                                      " -> " + names_[to] + " " + token);
        }
        existing->amount += amount;
        return;
    }
    outgoing_[from].emplace_back(to, token, amount);
}

Edge* ObligationGraph::findEdge(PartyId from, PartyId to, const std::string& token) {
    if (from >= outgoing_.size()) return nullptr;
    for (Edge& e : outgoing_[from]) {
        if (e.to == to && e.token == token) return &e;
    }
    return nullptr;
}

const Edge* ObligationGraph::findEdge(PartyId from, PartyId to, const std::string& token) const {
    if (from >= outgoing_.size()) return nullptr;
    for (const Edge& e : outgoing_[from]) {
        if (e.to == to && e.token == token) return &e;
    }
    return nullptr;
}

const std::vector<Edge>& ObligationGraph::outgoing(PartyId from) const {
    checkParty(from);
    return outgoing_[from];
}

size_t ObligationGraph::edgeCount() const {
    size_t count = 0;
    for (const auto& edges : outgoing_) count += edges.size();
    return count;
}

size_t ObligationGraph::liveEdgeCount() const {
    size_t count = 0;
    for (const auto& edges : outgoing_) {
        for (const Edge& e : edges) {
            if (e.amount > 0) count++;
        }
    }
    return count;
}

uint64_t ObligationGraph::grossAmount() const {
    const uint64_t max = std::numeric_limits<uint64_t>::max();
    uint64_t total = 0;
    for (const auto& edges : outgoing_) {
        for (const Edge& e : edges) {
            if (e.amount > max - total) return max;
            total += e.amount;
        }
    }
    return total;
}

// ─── Extraction ────────────────────────────────────────────────

std::vector<Intent> ObligationGraph::toIntents() const {
    std::vector<Intent> intents;
    for (PartyId from = 0; from < outgoing_.size(); from++) {
        for (const Edge& e : outgoing_[from]) {
            if (e.amount == 0) continue;
            intents.emplace_back(names_[from], names_[e.to], e.token, e.amount);
        }
    }
    return intents;
}

// ─── Iteration ─────────────────────────────────────────────────

void ObligationGraph::forEachEdge(const std::function<void(PartyId, const Edge&)>& fn) const {
    for (PartyId from = 0; from < outgoing_.size(); from++) {
        for (const Edge& e : outgoing_[from]) {
            fn(from, e);
        }
    }
}

} // namespace netclear
