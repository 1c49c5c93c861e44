#include "graph/intent_io.hpp"

#include <cctype>
#include <sstream>
#include <stdexcept>

namespace netclear {

namespace {

bool parseAmount(const std::string& text, uint64_t& out) {
    if (text.empty()) return false;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    try {
        size_t pos = 0;
        unsigned long long v = std::stoull(text, &pos, 10);
        if (pos != text.size()) return false;
        out = static_cast<uint64_t>(v);
        return true;
    } catch (const std::out_of_range&) {
        return false;
    }
}

} // namespace

std::vector<Intent> parseIntents(std::istream& in) {
    std::vector<Intent> intents;
    std::string line;
    size_t line_no = 0;

    while (std::getline(in, line)) {
        line_no++;
        size_t first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') continue;

        std::istringstream fields(line);
        std::string sender, receiver, token, amount_text, extra;
        if (!(fields >> sender >> receiver >> token >> amount_text)) {
            throw std::invalid_argument("Line " + std::to_string(line_no) +
                                        ": expected SENDER RECEIVER TOKEN AMOUNT");
        }
        if (fields >> extra) {
            throw std::invalid_argument("Line " + std::to_string(line_no) +
                                        ": unexpected trailing field '" + extra + "'");
        }
        uint64_t amount = 0;
        if (!parseAmount(amount_text, amount)) {
            throw std::invalid_argument("Line " + std::to_string(line_no) +
                                        ": invalid amount '" + amount_text + "'");
        }
        intents.emplace_back(sender, receiver, token, amount);
    }
    return intents;
}

std::string formatIntent(const Intent& intent) {
    return intent.sender + " -> " + intent.receiver + ": " +
           std::to_string(intent.amount) + " " + intent.token;
}

} // namespace netclear
