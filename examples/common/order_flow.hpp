#pragma once

#include <cstddef>
#include <cstdint>
#include <variant>

#include "aob.hpp"


namespace aob::examples {

    // Result of one simulated session
    struct OrderFlowResult {
        std::uint64_t recorded = 0;   // events accepted by the queue
        OrderSummary summary{};       // what the matching layer would return through the register
        bool back_pressure = false;   // stopped on EVENT_QUEUE_FULL
    };

    inline CallbackInfo make_callback_info(std::size_t len, std::uint64_t owner) {
        CallbackInfo info(len, 0);
        for (std::size_t i = 0; i < len; ++i) {
            info[i] = static_cast<uint8_t>((owner >> ((i % 8) * 8)) & 0xFF);
        }
        return info;
    }

    // Orders alternate bid / ask. Odd orders cross and produce a Fill against
    // the previous order; even orders produce an Out. Only Out orders count as
    // posted. Stops at the first back-pressure signal.
    [[nodiscard]] inline Status simulate_order_flow(EventQueue& queue, std::uint64_t orders, OrderFlowResult& out) {
        out = OrderFlowResult{};
        const std::size_t len = queue.callback_info_len();
        for (std::uint64_t i = 0; i < orders; ++i) {
            const Side side = (i % 2 == 0) ? Side::BID : Side::ASK;
            const Price price = 1000 + (i % 7);
            const Quantity qty = 10 + i;

            OrderId id = 0;
            Status status = queue.gen_order_id(price, side, id);
            if (status != Status::OK) {
                AOB_ERROR("Failed to mint order id: " << to_string(status));
                return status;
            }

            Event ev;
            if (i % 2 == 1) {
                ev = event::Fill{side, id, qty * price, qty,
                                 make_callback_info(len, i - 1),
                                 make_callback_info(len, i)};
            } else {
                ev = event::Out{side, id, qty, make_callback_info(len, i)};
            }

            status = queue.push_back(ev);
            if (status == Status::EVENT_QUEUE_FULL) {
                AOB_WARN("Back-pressure after " << out.recorded << " events, stopping order flow");
                out.back_pressure = true;
                return Status::OK;
            }
            if (status != Status::OK) {
                AOB_ERROR("Failed to record event: " << to_string(status));
                return status;
            }
            ++out.recorded;
            out.summary.total_asset_qty += qty;
            out.summary.total_quote_qty += qty * price;
            if (std::holds_alternative<event::Out>(ev)) {
                out.summary.posted_order_id = id;
                out.summary.total_asset_qty_posted += qty;
            }
        }
        return Status::OK;
    }

} // namespace aob::examples
