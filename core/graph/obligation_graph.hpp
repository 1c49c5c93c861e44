#pragma once

#include "graph/edge.hpp"
#include "graph/intent.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace netclear {

// ─── ObligationGraph ───────────────────────────────────────────
// Directed, token-labeled debt graph. Parties are interned into dense
// PartyId handles in first-seen order; each party owns an ordered list
// of outgoing edges. Built once per netting run, mutated in place by
// netting, then read back out with toIntents().
//
// Not thread-safe: a graph has a single writer.

class ObligationGraph {
public:
    ObligationGraph() = default;

    /// Build a graph by inserting every intent in order.
    static ObligationGraph fromIntents(const std::vector<Intent>& intents);

    // ── Party operations ──
    /// Intern a party name. Returns the existing id if already present.
    PartyId addParty(const std::string& name);
    std::optional<PartyId> findParty(const std::string& name) const;
    const std::string& partyName(PartyId id) const;
    size_t partyCount() const { return names_.size(); }

    // ── Edge operations ──
    /// Insert or merge the edge (from, to, token). An existing edge has
    /// `amount` added to it; otherwise a new edge is appended to `from`'s
    /// list. amount == 0 still registers both parties and the edge record.
    /// Throws std::overflow_error if the merged amount would not fit.
    void addEdge(const std::string& from, const std::string& to,
                 const std::string& token, uint64_t amount);
    void addEdge(PartyId from, PartyId to, const std::string& token, uint64_t amount);

    Edge* findEdge(PartyId from, PartyId to, const std::string& token);
    const Edge* findEdge(PartyId from, PartyId to, const std::string& token) const;

    const std::vector<Edge>& outgoing(PartyId from) const;

    /// Number of edge records, including ones netted down to zero.
    size_t edgeCount() const;
    /// Number of edges with a positive amount.
    size_t liveEdgeCount() const;
    /// Sum of all edge amounts, saturating at the largest uint64_t.
    uint64_t grossAmount() const;

    // ── Extraction ──
    /// Every edge with amount > 0, in party insertion order then edge order.
    std::vector<Intent> toIntents() const;

    // ── Iteration ──
    void forEachEdge(const std::function<void(PartyId, const Edge&)>& fn) const;

private:
    void checkParty(PartyId id) const;

    std::vector<std::string> names_;
    std::unordered_map<std::string, PartyId> ids_;
    std::vector<std::vector<Edge>> outgoing_;
};

} // namespace netclear
