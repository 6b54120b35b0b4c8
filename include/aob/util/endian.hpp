#pragma once

#include <cstdint>
#include <cstring>

#include "aob/types.hpp"


// -------------------------------------------------------------
// Little-endian load/store helpers for persisted queue layouts
// -------------------------------------------------------------
// Canonical storage format: LITTLE-ENDIAN, unaligned.
// Every multi-byte integer in an account or snapshot goes through
// store_leXX() / load_leXX(); never memcpy a host integer directly.
// -------------------------------------------------------------

#if defined(__BYTE_ORDER__) && defined(__ORDER_LITTLE_ENDIAN__) && defined(__ORDER_BIG_ENDIAN__)
#  define AOB_HOST_IS_LITTLE_ENDIAN (__BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__)
#else
#  error "Cannot determine host endianness"
#endif


namespace aob {
namespace util {

inline constexpr uint16_t to_le16(uint16_t x) noexcept {
#if AOB_HOST_IS_LITTLE_ENDIAN
    return x;
#else
    return __builtin_bswap16(x);
#endif
}

inline constexpr uint32_t to_le32(uint32_t x) noexcept {
#if AOB_HOST_IS_LITTLE_ENDIAN
    return x;
#else
    return __builtin_bswap32(x);
#endif
}

inline constexpr uint64_t to_le64(uint64_t x) noexcept {
#if AOB_HOST_IS_LITTLE_ENDIAN
    return x;
#else
    return __builtin_bswap64(x);
#endif
}

inline constexpr uint16_t from_le16(uint16_t x) noexcept { return to_le16(x); }
inline constexpr uint32_t from_le32(uint32_t x) noexcept { return to_le32(x); }
inline constexpr uint64_t from_le64(uint64_t x) noexcept { return to_le64(x); }

// ---- unaligned stores ----
inline void store_le16(uint8_t* dst, uint16_t v) noexcept {
    v = to_le16(v);
    std::memcpy(dst, &v, sizeof(v));
}

inline void store_le32(uint8_t* dst, uint32_t v) noexcept {
    v = to_le32(v);
    std::memcpy(dst, &v, sizeof(v));
}

inline void store_le64(uint8_t* dst, uint64_t v) noexcept {
    v = to_le64(v);
    std::memcpy(dst, &v, sizeof(v));
}

// Low 64 bits first, so the whole 16 bytes read as one LE integer
inline void store_le128(uint8_t* dst, OrderId v) noexcept {
    store_le64(dst, static_cast<uint64_t>(v));
    store_le64(dst + 8, static_cast<uint64_t>(v >> 64));
}

// ---- unaligned loads ----
[[nodiscard]] inline uint16_t load_le16(const uint8_t* src) noexcept {
    uint16_t v;
    std::memcpy(&v, src, sizeof(v));
    return from_le16(v);
}

[[nodiscard]] inline uint32_t load_le32(const uint8_t* src) noexcept {
    uint32_t v;
    std::memcpy(&v, src, sizeof(v));
    return from_le32(v);
}

[[nodiscard]] inline uint64_t load_le64(const uint8_t* src) noexcept {
    uint64_t v;
    std::memcpy(&v, src, sizeof(v));
    return from_le64(v);
}

[[nodiscard]] inline OrderId load_le128(const uint8_t* src) noexcept {
    const OrderId lo = load_le64(src);
    const OrderId hi = load_le64(src + 8);
    return (hi << 64) | lo;
}

} // namespace util
} // namespace aob
