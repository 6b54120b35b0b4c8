#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "aob/status.hpp"
#include "aob/account.hpp"
#include "aob/snapshot/header.hpp"


namespace aob {
namespace snapshot {

// ============================================================================
//  Queue snapshots
//  ---------------------------------------------------------------------------
//  A snapshot file is a 64-byte snapshot::Header followed by a verbatim copy
//  of one event queue account (queue header, register and slots). It is an
//  inspection / fixture format: written in one pass, no fsync, no in-place
//  updates. The hosting environment stays responsible for durability.
// ============================================================================

struct Snapshot {
    Header header{};
    std::vector<uint8_t> image;
};

// Writes `account` to `path` (truncating). Takes a shared borrow for the copy.
[[nodiscard]] Status write_snapshot(const std::string& path, const Account& account, uint32_t callback_info_len);

// Reads and fully verifies a snapshot (header checksum, structure, image checksum).
[[nodiscard]] Status read_snapshot(const std::string& path, Snapshot& out);

} // namespace snapshot
} // namespace aob
