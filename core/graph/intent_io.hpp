#pragma once

#include "graph/intent.hpp"

#include <istream>
#include <string>
#include <vector>

namespace netclear {

/// Read intents, one per line: `SENDER RECEIVER TOKEN AMOUNT`.
/// Blank lines and lines starting with '#' are skipped.
/// Throws std::invalid_argument naming the 1-based line on malformed input.
std::vector<Intent> parseIntents(std::istream& in);

/// "S -> R: AMOUNT TOKEN"
std::string formatIntent(const Intent& intent);

} // namespace netclear
