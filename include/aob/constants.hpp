#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>

#include "aob/types.hpp"


namespace aob {

// Persisted event queue header: tag(1) head(8) count(8) event_size(8) seq_num(8) register_size(4)
constexpr std::size_t EVENT_QUEUE_HEADER_LEN = 37;

// Register payload written by the matching layer after each order
constexpr std::size_t ORDER_SUMMARY_SIZE = 41;
// One extra byte for the register's own tag
constexpr std::uint32_t DEFAULT_REGISTER_SIZE = ORDER_SUMMARY_SIZE + 1;

// Fixed part of each serialized event (callback info excluded)
constexpr std::size_t FILL_EVENT_BASE_LEN = 1 + 1 + 16 + 8 + 8; // tag, side, id, quote, asset
constexpr std::size_t OUT_EVENT_BASE_LEN = 1 + 1 + 16 + 8;      // tag, side, id, asset

// Order ids are refused once the counter reaches this value
constexpr SeqNum SEQ_NUM_LIMIT = std::numeric_limits<SeqNum>::max();

namespace snapshot {

constexpr std::uint16_t SNAPSHOT_MAGIC = 0x5141;   // "AQ" (little-endian)
constexpr std::uint8_t  SNAPSHOT_VERSION = 0x01;   // Snapshot format version 1
constexpr std::size_t   MAX_IMAGE_SIZE = std::size_t{1} << 30; // 1 GiB, sanity bound on load

} // namespace snapshot

} // namespace aob
