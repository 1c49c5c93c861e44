#pragma once

#include <cstddef>
#include <stdexcept>

namespace netclear {

/// Netting run configuration.
struct NettingConfig {
    size_t max_cycle_length = 4;        // Edges per enumerated cycle
    size_t max_cycles = 100000;         // Cycles recorded per run, all SCCs
    size_t max_expansions = 10000000;   // DFS steps per run, all SCCs
    double budget_seconds = 0.0;        // Enumeration deadline; 0 = none
    bool dedupe_rotations = true;       // Report each cycle once, canonical rotation
    bool verify_conservation = false;   // Check net positions after netting

    /// Throws std::invalid_argument on an unusable configuration.
    void validate() const {
        if (max_cycle_length == 0)
            throw std::invalid_argument("max_cycle_length must be positive");
        if (max_cycles == 0)
            throw std::invalid_argument("max_cycles must be positive");
        if (max_expansions == 0)
            throw std::invalid_argument("max_expansions must be positive");
        if (budget_seconds < 0.0)
            throw std::invalid_argument("budget_seconds must not be negative");
    }
};

} // namespace netclear
