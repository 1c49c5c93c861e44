#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace netclear {

/// Dense handle of a party inside one ObligationGraph.
using PartyId = uint32_t;

/// A directed, token-labeled debt edge owned by its source party.
/// At most one edge exists per (from, to, token); duplicates merge additively.
struct Edge {
    PartyId to = 0;
    std::string token;
    uint64_t amount = 0;

    Edge() = default;
    Edge(PartyId to, std::string token, uint64_t amount)
        : to(to), token(std::move(token)), amount(amount) {}
};

} // namespace netclear
