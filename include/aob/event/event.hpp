#pragma once

#include <cstdint>
#include <ostream>
#include <variant>

#include "aob/types.hpp"


namespace aob {
namespace event {

// On-wire discriminant (first byte of every serialized event)
enum class Kind : uint8_t {
    FILL = 0,
    OUT = 1
};
inline const char* to_string(Kind kind) {
    return (kind == Kind::FILL) ? "FILL" : "OUT";
}

// A maker order was (partially) matched by a taker
struct Fill {
    Side         taker_side{Side::BID};
    OrderId      maker_order_id{0};
    Quantity     quote_size{0};
    Quantity     asset_size{0};
    CallbackInfo maker_callback_info;
    CallbackInfo taker_callback_info;

    bool operator==(const Fill&) const = default;
};

// An order left the book (cancelled, fully filled as maker, or expired)
struct Out {
    Side         side{Side::BID};
    OrderId      order_id{0};
    Quantity     asset_size{0};
    CallbackInfo callback_info;

    bool operator==(const Out&) const = default;
};

} // namespace event

using Event = std::variant<event::Fill, event::Out>;

[[nodiscard]] inline event::Kind kind_of(const Event& ev) noexcept {
    return std::holds_alternative<event::Fill>(ev) ? event::Kind::FILL : event::Kind::OUT;
}

namespace event {

inline void debug_dump(const Event& ev, std::ostream& os) {
    if (const auto* f = std::get_if<Fill>(&ev)) {
        os << "[Fill] taker_side=" << to_string(f->taker_side)
           << " maker_order_id=" << to_hex(f->maker_order_id)
           << " quote_size=" << f->quote_size
           << " asset_size=" << f->asset_size
           << " callback_info_len=" << f->maker_callback_info.size();
    } else {
        const auto& o = std::get<Out>(ev);
        os << "[Out] side=" << to_string(o.side)
           << " order_id=" << to_hex(o.order_id)
           << " asset_size=" << o.asset_size
           << " callback_info_len=" << o.callback_info.size();
    }
}

} // namespace event
} // namespace aob
