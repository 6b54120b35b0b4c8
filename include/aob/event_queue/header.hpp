#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <span>

#include "aob/types.hpp"
#include "aob/constants.hpp"
#include "aob/status.hpp"


namespace aob {

// Event queue account header.
// Persisted packed, little-endian, in declaration order (37 bytes). During a
// call sequence the queue works on a detached copy; writing it back to the
// account is the orchestrator's decision (EventQueue::write_header()).
//
// Account layout:
//   [ header : 37 ][ register : register_size ][ slot 0 ][ slot 1 ] ... [ slack ]
struct EventQueueHeader {
    AccountTag tag{AccountTag::EVENT_QUEUE};
    uint64_t   head{0};        // slot index of the oldest pending event
    uint64_t   count{0};       // number of pending events
    uint64_t   event_size{0};  // bytes per slot, fixed for the life of the queue
    SeqNum     seq_num{0};     // shared by order ids and pushes
    uint32_t   register_size{DEFAULT_REGISTER_SIZE};

    // Field offsets inside the persisted header
    static constexpr std::size_t TAG_OFFSET = 0;
    static constexpr std::size_t HEAD_OFFSET = 1;
    static constexpr std::size_t COUNT_OFFSET = 9;
    static constexpr std::size_t EVENT_SIZE_OFFSET = 17;
    static constexpr std::size_t SEQ_NUM_OFFSET = 25;
    static constexpr std::size_t REGISTER_SIZE_OFFSET = 33;

    // Default header with the slot size required by `callback_info_len`
    [[nodiscard]] static EventQueueHeader for_layout(std::size_t callback_info_len) noexcept;

    // Bytes available for slots in an account of `account_len` bytes (0 if too small)
    [[nodiscard]] inline uint64_t buf_len(std::size_t account_len) const noexcept {
        const uint64_t reserved = EVENT_QUEUE_HEADER_LEN + static_cast<uint64_t>(register_size);
        return (account_len > reserved) ? (account_len - reserved) : 0;
    }

    [[nodiscard]] inline uint64_t capacity(std::size_t account_len) const noexcept {
        return (event_size == 0) ? 0 : buf_len(account_len) / event_size;
    }

    [[nodiscard]] Status serialize(std::span<uint8_t> out) const noexcept;
    [[nodiscard]] static Status deserialize(std::span<const uint8_t> in, EventQueueHeader& out) noexcept;

    bool operator==(const EventQueueHeader&) const = default;

    inline void debug_dump(std::ostream& os) const {
        os << "[EventQueueHeader] tag=" << to_string(tag)
           << " head=" << head
           << " count=" << count
           << " event_size=" << event_size
           << " seq_num=" << seq_num
           << " register_size=" << register_size;
    }
};
static_assert(EventQueueHeader::REGISTER_SIZE_OFFSET + sizeof(uint32_t) == EVENT_QUEUE_HEADER_LEN,
              "EventQueueHeader persisted size mismatch");

} // namespace aob
