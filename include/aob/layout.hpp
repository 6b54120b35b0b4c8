#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>

#include "aob/constants.hpp"
#include "aob/status.hpp"
#include "aob/event/codec.hpp"
#include "aob/event_queue/header.hpp"
#include "aob/log/logger.hpp"


namespace aob {

/*
================================================================================
Queue Layout Configuration
================================================================================

Describes the shape of one event queue account so that the orchestrator can
allocate it and build a matching header:

  callback_info_len   bytes of opaque caller data per order (market-wide)
  capacity            number of event slots
  register_size       register window, tag byte included

Derived values:

  event_size     = max(34 + 2L, 26 + L)
  account_size   = 37 + register_size + capacity * event_size
  max_capacity   = (SIZE_MAX - 37 - register_size) / event_size

The slot size is the largest record for L, so Fill and Out share one slot
shape and capacity is exact (no slack bytes).
================================================================================
*/
struct Layout {
    std::size_t   callback_info_len{0};
    std::uint64_t capacity{0};
    std::uint32_t register_size{DEFAULT_REGISTER_SIZE};

    [[nodiscard]] constexpr std::uint64_t event_size() const noexcept {
        return event::max_event_size(callback_info_len);
    }

    [[nodiscard]] constexpr std::size_t account_size() const noexcept {
        return EVENT_QUEUE_HEADER_LEN + register_size + static_cast<std::size_t>(capacity * event_size());
    }

    // Largest capacity whose account_size() fits in size_t
    [[nodiscard]] constexpr std::uint64_t max_capacity() const noexcept {
        const std::size_t reserved = EVENT_QUEUE_HEADER_LEN + register_size;
        return static_cast<std::uint64_t>((std::numeric_limits<std::size_t>::max() - reserved) / event_size());
    }

    [[nodiscard]] inline EventQueueHeader make_header() const noexcept {
        EventQueueHeader h = EventQueueHeader::for_layout(callback_info_len);
        h.register_size = register_size;
        return h;
    }

    [[nodiscard]] inline Status validate() const noexcept {
        if (capacity == 0) {
            AOB_WARN("[!!] Layout capacity must be at least one slot");
            return Status::INVALID_LAYOUT;
        }
        if (register_size == 0) {
            AOB_WARN("[!!] Layout register_size must hold at least the tag byte");
            return Status::INVALID_LAYOUT;
        }
        if (capacity > max_capacity()) {
            AOB_WARN("[!!] Layout capacity " << capacity << " overflows the account size (max " << max_capacity() << ")");
            return Status::INVALID_LAYOUT;
        }
        return Status::OK;
    }
};

static_assert(Layout{0, 1, DEFAULT_REGISTER_SIZE}.event_size() == FILL_EVENT_BASE_LEN);
static_assert(Layout{32, 3, DEFAULT_REGISTER_SIZE}.account_size() == 37 + 42 + 3 * 98);

} // namespace aob
