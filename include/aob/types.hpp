#pragma once

#include <cstdint>
#include <string>
#include <vector>


namespace aob {

// Order side. The numeric value is the on-wire byte.
enum class Side : uint8_t {
    BID = 0, // Buy side
    ASK = 1  // Sell side
};
inline const char* to_string(Side side) {
    return (side == Side::BID) ? "BID" : "ASK";
}

[[nodiscard]] constexpr Side opposite(Side side) noexcept {
    return (side == Side::BID) ? Side::ASK : Side::BID;
}

// Validates a raw side byte read back from storage
[[nodiscard]] constexpr bool side_from_u8(uint8_t raw, Side& out) noexcept {
    switch (raw) {
        case 0: out = Side::BID; return true;
        case 1: out = Side::ASK; return true;
        default: return false;
    }
}


// Policy for an order crossing a resting order of the same originator.
// Interpreted by the matching layer only.
enum class SelfTradeBehavior : uint8_t {
    DECREMENT_TAKE = 0,
    CANCEL_PROVIDE = 1,
    ABORT_TRANSACTION = 2
};
inline const char* to_string(SelfTradeBehavior stb) {
    switch (stb) {
        case SelfTradeBehavior::DECREMENT_TAKE: return "DECREMENT_TAKE";
        case SelfTradeBehavior::CANCEL_PROVIDE: return "CANCEL_PROVIDE";
        case SelfTradeBehavior::ABORT_TRANSACTION: return "ABORT_TRANSACTION";
        default: return "UNKNOWN_SELF_TRADE_BEHAVIOR";
    }
}


// First byte of every account owned by the order book
enum class AccountTag : uint8_t {
    INITIALIZED = 0,
    MARKET = 1,
    EVENT_QUEUE = 2,
    BIDS = 3,
    ASKS = 4
};
inline const char* to_string(AccountTag tag) {
    switch (tag) {
        case AccountTag::INITIALIZED: return "INITIALIZED";
        case AccountTag::MARKET: return "MARKET";
        case AccountTag::EVENT_QUEUE: return "EVENT_QUEUE";
        case AccountTag::BIDS: return "BIDS";
        case AccountTag::ASKS: return "ASKS";
        default: return "UNKNOWN_ACCOUNT_TAG";
    }
}

[[nodiscard]] constexpr bool account_tag_from_u8(uint8_t raw, AccountTag& out) noexcept {
    if (raw > static_cast<uint8_t>(AccountTag::ASKS)) return false;
    out = static_cast<AccountTag>(raw);
    return true;
}


// Type definitions for clarity and consistency
using OrderId = unsigned __int128;       // price (high 64) | sequence (low 64)
using Price = std::uint64_t;             // Limit price in ticks
using Quantity = std::uint64_t;          // Base or quote quantity in lots
using SeqNum = std::uint64_t;            // Queue-wide discriminator
using CallbackInfo = std::vector<uint8_t>; // Opaque caller bytes echoed in events

// Hex rendering for logs (OrderId has no stream operator)
inline std::string to_hex(OrderId id) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string s(34, '0');
    s[1] = 'x';
    for (int i = 33; i >= 2; --i) {
        s[i] = digits[static_cast<unsigned>(id & 0xF)];
        id >>= 4;
    }
    return s;
}

} // namespace aob
