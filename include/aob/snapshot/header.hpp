#pragma once

#include <cstdint>
#include <cstring>
#include <cstddef>
#include <type_traits>

#include <xxhash.h>

#include "aob/constants.hpp"
#include "aob/status.hpp"
#include "aob/util/endian.hpp"
#include "aob/log/logger.hpp"


namespace aob {
namespace snapshot {

// Snapshot file header (fixed size: 64 bytes, aligned to cache line).
// Precedes the raw account image in every snapshot file.
// Purpose:
// - Identify the format and version.
// - Carry the market-wide callback_info_len needed to decode events.
// - Detect truncated or altered images before they reach the queue.
struct alignas(64) Header {
    uint16_t magic_le;                //  0: 2B  - 'AQ'
    uint8_t  version_le;              //  2: 1B
    uint8_t  header_size_le;          //  3: 1B  - sizeof(Header)
    uint32_t callback_info_len_le;    //  4: 4B
    uint64_t image_size_le;           //  8: 8B  - account bytes following the header
    uint64_t image_checksum_le;       // 16: 8B  - XXH64 of the image
    uint64_t created_ts_ns_le;        // 24: 8B  - wall clock, ns since epoch
    uint64_t checksum_le;             // 32: 8B  - XXH64 of this header (excluding this field)
    uint8_t  pad_[24];                // 40: 24B

    // -------------------------------
    // Accessors (auto endian convert)
    // -------------------------------
    [[nodiscard]] inline uint16_t magic() const noexcept { return util::from_le16(magic_le); }
    inline void set_magic(uint16_t v) noexcept { magic_le = util::to_le16(v); }

    [[nodiscard]] inline uint8_t version() const noexcept { return version_le; }
    inline void set_version(uint8_t v) noexcept { version_le = v; }

    [[nodiscard]] inline uint8_t header_size() const noexcept { return header_size_le; }
    inline void set_header_size(uint8_t v) noexcept { header_size_le = v; }

    [[nodiscard]] inline uint32_t callback_info_len() const noexcept { return util::from_le32(callback_info_len_le); }
    inline void set_callback_info_len(uint32_t v) noexcept { callback_info_len_le = util::to_le32(v); }

    [[nodiscard]] inline uint64_t image_size() const noexcept { return util::from_le64(image_size_le); }
    inline void set_image_size(uint64_t v) noexcept { image_size_le = util::to_le64(v); }

    [[nodiscard]] inline uint64_t image_checksum() const noexcept { return util::from_le64(image_checksum_le); }
    inline void set_image_checksum(uint64_t v) noexcept { image_checksum_le = util::to_le64(v); }

    [[nodiscard]] inline uint64_t created_ts_ns() const noexcept { return util::from_le64(created_ts_ns_le); }
    inline void set_created_ts_ns(uint64_t v) noexcept { created_ts_ns_le = util::to_le64(v); }

    [[nodiscard]] inline uint64_t checksum() const noexcept { return util::from_le64(checksum_le); }
    inline void set_checksum(uint64_t v) noexcept { checksum_le = util::to_le64(v); }

    // ---------------------------------------------------------------------------
    inline void reset() noexcept {
        std::memset(this, 0, sizeof(Header));
    }

    // Two stack-only XXH64 calls: bytes before the checksum field seed the
    // hash of the bytes after it.
    [[nodiscard]] static inline uint64_t compute_checksum(const Header& header) noexcept {
        const auto* bytes = reinterpret_cast<const uint8_t*>(&header);
        constexpr size_t checksum_offset = offsetof(Header, checksum_le);
        constexpr size_t checksum_size = sizeof(uint64_t);
        uint64_t hash1 = XXH64(bytes, checksum_offset, 0);
        return XXH64(bytes + checksum_offset + checksum_size, sizeof(Header) - checksum_offset - checksum_size, hash1);
    }

    [[nodiscard]] static inline uint64_t compute_image_checksum(const uint8_t* image, size_t size) noexcept {
        return XXH64(image, size, 0);
    }

    [[nodiscard]] inline bool validate_data() const noexcept {
        if (magic() != SNAPSHOT_MAGIC) {
            AOB_TRACE("[!!] Invalid snapshot magic: expected " << std::hex << SNAPSHOT_MAGIC << ", found " << magic() << std::dec);
            return false;
        }
        if (version() != SNAPSHOT_VERSION) {
            AOB_TRACE("[!!] Invalid snapshot version: expected " << static_cast<int>(SNAPSHOT_VERSION) << ", found " << static_cast<int>(version()));
            return false;
        }
        if (header_size() != sizeof(Header)) {
            AOB_TRACE("[!!] Invalid snapshot header size: expected " << sizeof(Header) << ", found " << static_cast<int>(header_size()));
            return false;
        }
        if (image_size() < EVENT_QUEUE_HEADER_LEN || image_size() > MAX_IMAGE_SIZE) {
            AOB_TRACE("[!!] Invalid snapshot image size: " << image_size());
            return false;
        }
        return true;
    }

    [[nodiscard]] inline Status validate_checksum() const noexcept {
        uint64_t computed = compute_checksum(*this);
        if (checksum() != computed) {
            AOB_TRACE("[!!] Snapshot header checksum mismatch: expected " << checksum() << ", computed " << computed);
            return Status::HEADER_CHECKSUM_MISMATCH;
        }
        return Status::OK;
    }

    // Checksum first, then structure
    [[nodiscard]] inline Status verify() const noexcept {
        Status status = validate_checksum();
        if (status != Status::OK) return status;
        if (!validate_data()) return Status::CORRUPTED_DATA;
        return Status::OK;
    }

    inline void finalize(const uint8_t* image, size_t size) noexcept {
        set_image_size(size);
        set_image_checksum(compute_image_checksum(image, size));
        set_checksum(compute_checksum(*this));
    }
};

// ======================================================
// Layout validation (prevent ABI drift)
// ======================================================
static_assert(sizeof(Header) == 64, "Header must be exactly 64 bytes");
static_assert(alignof(Header) == 64, "Header must align to 64 bytes");
static_assert(offsetof(Header, magic_le) == 0, "offset magic");
static_assert(offsetof(Header, version_le) == 2, "offset version");
static_assert(offsetof(Header, header_size_le) == 3, "offset header_size");
static_assert(offsetof(Header, callback_info_len_le) == 4, "offset callback_info_len");
static_assert(offsetof(Header, image_size_le) == 8, "offset image_size");
static_assert(offsetof(Header, image_checksum_le) == 16, "offset image_checksum");
static_assert(offsetof(Header, created_ts_ns_le) == 24, "offset created_ts_ns");
static_assert(offsetof(Header, checksum_le) == 32, "offset checksum");
static_assert(std::is_standard_layout_v<Header>, "Header must have standard layout");
static_assert(std::is_trivially_copyable_v<Header>, "Header must be trivially copyable");

} // namespace snapshot
} // namespace aob
