#pragma once

#include <cstdint>

#include "aob/types.hpp"


namespace aob {

// ============================================================================
//  Order identifiers
//  ---------------------------------------------------------------------------
//  A 128-bit key that the external price index compares numerically:
//
//      [ limit price : 64 ][ sequence : 64 ]
//
//  Bids store the bitwise complement of the sequence, asks store it raw.
//  With a shared, increasing sequence this gives:
//    • bids, sorted descending: higher price first, then earlier arrival
//    • asks, sorted ascending:  lower price first, then earlier arrival
//  The generator itself lives in EventQueue::gen_order_id(), because the
//  sequence counter is part of the persisted queue header.
// ============================================================================

[[nodiscard]] constexpr OrderId make_order_id(Price limit_price, SeqNum seq, Side side) noexcept {
    const OrderId upper = static_cast<OrderId>(limit_price) << 64;
    const uint64_t lower = (side == Side::BID) ? ~seq : seq;
    return upper | static_cast<OrderId>(lower);
}

[[nodiscard]] constexpr Price order_id_price(OrderId id) noexcept {
    return static_cast<Price>(id >> 64);
}

// Recovers the raw sequence the id was minted with
[[nodiscard]] constexpr SeqNum order_id_sequence(OrderId id, Side side) noexcept {
    const uint64_t lower = static_cast<uint64_t>(id);
    return (side == Side::BID) ? ~lower : lower;
}

static_assert(order_id_price(make_order_id(42, 7, Side::ASK)) == 42);
static_assert(order_id_sequence(make_order_id(42, 7, Side::BID), Side::BID) == 7);
static_assert(make_order_id(10, 1, Side::BID) > make_order_id(10, 2, Side::BID));
static_assert(make_order_id(10, 1, Side::ASK) < make_order_id(10, 2, Side::ASK));

} // namespace aob
