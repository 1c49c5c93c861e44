#pragma once

#include <stdexcept>
#include <string>

namespace netclear {

/// Raised when netting would break a graph invariant: subtracting more than an
/// edge holds, or netting a cycle position that has no edge for the token.
/// Indicates a defect in the caller, never a property of the input.
class NettingInvariantError : public std::logic_error {
public:
    explicit NettingInvariantError(const std::string& message)
        : std::logic_error("netting invariant violated: " + message) {}
};

/// Which exploration bound stopped cycle enumeration.
enum class ExplorationLimit {
    Cycles,
    Expansions,
    Deadline
};

inline const char* toString(ExplorationLimit limit) {
    switch (limit) {
        case ExplorationLimit::Cycles:     return "cycles";
        case ExplorationLimit::Expansions: return "expansions";
        case ExplorationLimit::Deadline:   return "deadline";
    }
    return "unknown";
}

/// Raised when cycle enumeration runs out of its configured budget.
class ExplorationLimitError : public std::runtime_error {
public:
    ExplorationLimitError(ExplorationLimit limit, const std::string& detail)
        : std::runtime_error(std::string("exploration limit exceeded (") +
                             toString(limit) + "): " + detail),
          limit_(limit) {}

    ExplorationLimit limit() const noexcept { return limit_; }

private:
    ExplorationLimit limit_;
};

} // namespace netclear
