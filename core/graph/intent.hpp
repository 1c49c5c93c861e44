#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace netclear {

/// One outstanding obligation: sender owes receiver `amount` of `token`.
/// Zero-amount intents carry no obligation and are never emitted.
struct Intent {
    std::string sender;
    std::string receiver;
    std::string token;
    uint64_t amount = 0;

    Intent() = default;
    Intent(std::string sender, std::string receiver, std::string token, uint64_t amount)
        : sender(std::move(sender)), receiver(std::move(receiver)),
          token(std::move(token)), amount(amount) {}

    bool operator==(const Intent& other) const {
        return sender == other.sender && receiver == other.receiver &&
               token == other.token && amount == other.amount;
    }
    bool operator!=(const Intent& other) const { return !(*this == other); }
};

} // namespace netclear
