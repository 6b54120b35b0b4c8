#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>

#include "aob/constants.hpp"
#include "aob/status.hpp"
#include "aob/event/event.hpp"


namespace aob {
namespace event {

// ============================================================================
//  Event codec
//  ---------------------------------------------------------------------------
//  Fixed-shape little-endian records, no padding:
//
//    Fill: [0x00][taker_side:1][maker_order_id:16][quote_size:8][asset_size:8]
//          [maker_callback_info:L][taker_callback_info:L]
//    Out:  [0x01][side:1][order_id:16][asset_size:8][callback_info:L]
//
//  L (callback_info_len) is queue-wide and NOT stored in the record; the
//  decoder gets it out of band. Records shorter than the queue slot leave
//  the slot tail untouched (the queue zero-fills it).
// ============================================================================

[[nodiscard]] constexpr std::size_t fill_size(std::size_t callback_info_len) noexcept {
    return FILL_EVENT_BASE_LEN + 2 * callback_info_len;
}

[[nodiscard]] constexpr std::size_t out_size(std::size_t callback_info_len) noexcept {
    return OUT_EVENT_BASE_LEN + callback_info_len;
}

// Smallest slot able to hold either record kind
[[nodiscard]] constexpr std::size_t max_event_size(std::size_t callback_info_len) noexcept {
    return std::max(fill_size(callback_info_len), out_size(callback_info_len));
}

[[nodiscard]] inline std::size_t encoded_size(const Event& ev, std::size_t callback_info_len) noexcept {
    return (kind_of(ev) == Kind::FILL) ? fill_size(callback_info_len) : out_size(callback_info_len);
}

// Writes `ev` at the start of `out`.
//   INVALID_ARGUMENT  a callback string is not exactly callback_info_len bytes
//   BUFFER_TOO_SMALL  `out` cannot hold the record
[[nodiscard]] Status serialize(const Event& ev, std::size_t callback_info_len, std::span<uint8_t> out) noexcept;

// Reads one record from the start of `in`.
//   CORRUPTED_DATA    unknown discriminant or side byte
//   BUFFER_TOO_SMALL  `in` is shorter than the record
[[nodiscard]] Status deserialize(std::span<const uint8_t> in, std::size_t callback_info_len, Event& out);

} // namespace event
} // namespace aob
