#pragma once

#include "util/errors.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace netclear {

/// Bounds the work cycle enumeration may do in one netting run.
/// Tracks recorded cycles, DFS expansions and wall-clock time.
/// max_seconds <= 0 disables the deadline.
class ExplorationBudget {
public:
    ExplorationBudget(size_t max_cycles, size_t max_expansions, double max_seconds = 0.0)
        : max_cycles_(max_cycles), max_expansions_(max_expansions),
          max_seconds_(max_seconds) {}

    void start() {
        start_time_ = std::chrono::steady_clock::now();
        cycles_ = 0;
        expansions_ = 0;
    }

    /// Count one DFS edge step. Throws ExplorationLimitError when spent.
    void recordExpansion() {
        if (expansions_ >= max_expansions_) {
            throw ExplorationLimitError(ExplorationLimit::Expansions,
                "more than " + std::to_string(max_expansions_) + " DFS expansions");
        }
        expansions_++;
        if (isTimeExhausted()) {
            throw ExplorationLimitError(ExplorationLimit::Deadline,
                "enumeration ran past " + std::to_string(max_seconds_) + "s");
        }
    }

    /// Count one recorded cycle. Throws ExplorationLimitError when spent.
    void recordCycle() {
        if (cycles_ >= max_cycles_) {
            throw ExplorationLimitError(ExplorationLimit::Cycles,
                "more than " + std::to_string(max_cycles_) + " cycles");
        }
        cycles_++;
    }

    double elapsedSeconds() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration<double>(now - start_time_).count();
    }

    size_t cycles() const { return cycles_; }
    size_t expansions() const { return expansions_; }
    bool isTimeExhausted() const { return max_seconds_ > 0.0 && elapsedSeconds() >= max_seconds_; }
    bool isCycleExhausted() const { return cycles_ >= max_cycles_; }
    bool isExpansionExhausted() const { return expansions_ >= max_expansions_; }

private:
    size_t max_cycles_;
    size_t max_expansions_;
    double max_seconds_;
    size_t cycles_ = 0;
    size_t expansions_ = 0;
    std::chrono::steady_clock::time_point start_time_ = std::chrono::steady_clock::now();
};

} // namespace netclear
