#pragma once

#include <cstdint>
#include <cstring>
#include <optional>
#include <ostream>
#include <span>

#include "aob/types.hpp"
#include "aob/constants.hpp"
#include "aob/status.hpp"
#include "aob/util/endian.hpp"


namespace aob {

// Per-order outcome returned through the register after a new order is
// processed. Fixed-width encoding so it always fits the default register:
//
//   [has_posted_id:1][posted_order_id:16][total_asset_qty:8][total_quote_qty:8][total_asset_qty_posted:8]
struct OrderSummary {
    static constexpr std::size_t ENCODED_SIZE = ORDER_SUMMARY_SIZE;

    std::optional<OrderId> posted_order_id;  // set when a remainder rests on the book
    Quantity total_asset_qty{0};             // matched + posted, base lots
    Quantity total_quote_qty{0};             // matched + posted, quote lots
    Quantity total_asset_qty_posted{0};      // resting part only

    bool operator==(const OrderSummary&) const = default;

    inline void encode(std::span<uint8_t> out) const noexcept {
        uint8_t* p = out.data();
        p[0] = posted_order_id.has_value() ? 1 : 0;
        util::store_le128(p + 1, posted_order_id.value_or(0));
        util::store_le64(p + 17, total_asset_qty);
        util::store_le64(p + 25, total_quote_qty);
        util::store_le64(p + 33, total_asset_qty_posted);
    }

    [[nodiscard]] static inline Status decode(std::span<const uint8_t> in, OrderSummary& out) noexcept {
        if (in.size() < ENCODED_SIZE) [[unlikely]] return Status::BUFFER_TOO_SMALL;
        const uint8_t* p = in.data();
        switch (p[0]) {
            case 0: out.posted_order_id.reset(); break;
            case 1: out.posted_order_id = util::load_le128(p + 1); break;
            default: return Status::CORRUPTED_DATA;
        }
        out.total_asset_qty = util::load_le64(p + 17);
        out.total_quote_qty = util::load_le64(p + 25);
        out.total_asset_qty_posted = util::load_le64(p + 33);
        return Status::OK;
    }

    inline void debug_dump(std::ostream& os) const {
        os << "[OrderSummary] posted_order_id="
           << (posted_order_id ? to_hex(*posted_order_id) : std::string("none"))
           << " total_asset_qty=" << total_asset_qty
           << " total_quote_qty=" << total_quote_qty
           << " total_asset_qty_posted=" << total_asset_qty_posted;
    }
};
static_assert(1 + 16 + 8 + 8 + 8 == OrderSummary::ENCODED_SIZE, "OrderSummary encoded size mismatch");

} // namespace aob
