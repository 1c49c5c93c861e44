#pragma once

#include "graph/intent.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace netclear {

/// Sum of u64 amounts held in two words, so it cannot overflow
/// (high counts carries out of low).
struct FlowTotal {
    uint64_t high = 0;
    uint64_t low = 0;

    void add(uint64_t amount);

    bool operator==(const FlowTotal& other) const {
        return high == other.high && low == other.low;
    }
    bool operator!=(const FlowTotal& other) const { return !(*this == other); }
    bool operator<(const FlowTotal& other) const {
        return high != other.high ? high < other.high : low < other.low;
    }
};

/// Gross flows of one token through one party.
struct Position {
    FlowTotal inflow;
    FlowTotal outflow;

    /// True when inflow - outflow is the same for both.
    bool sameNet(const Position& other) const;
};

/// party -> token -> flows
using NetPositions = std::map<std::string, std::map<std::string, Position>>;

/// Sum every intent into its sender's outflow and receiver's inflow.
NetPositions computeNetPositions(const std::vector<Intent>& intents);

/// Result of checking one (party, token) position.
struct ConservationResult {
    bool passed = false;
    std::string party;
    std::string token;
    std::string message;
};

/// Netting must leave each party's net position per token unchanged.
/// Returns one failing entry per changed position, or a single passing
/// entry when every position matches.
std::vector<ConservationResult> checkConservation(const std::vector<Intent>& before,
                                                  const std::vector<Intent>& after);

} // namespace netclear
