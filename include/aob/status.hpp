#pragma once

#include <cstdint>


namespace aob {

/*
===============================================================================
 aob::Status
===============================================================================

Result of every fallible operation in the event queue core.

Ordinary results (handled by the immediate caller):
  - EVENT_QUEUE_EMPTY  nothing to pop / peek
  - EVENT_QUEUE_FULL   back-pressure: the event was not written and is still
                       owned by the caller

Fatal results (the enclosing operation must abort):
  - CORRUPTED_DATA          storage no longer matches the declared layout
  - REGISTER_UNINITIALIZED  a register value was required but none was written
  - *_CHECKSUM_MISMATCH     snapshot integrity failure
===============================================================================
*/
enum class Status : uint8_t {
    OK = 0,
    // ---- queue results ----
    EVENT_QUEUE_EMPTY,
    EVENT_QUEUE_FULL,
    // ---- data / contract failures ----
    CORRUPTED_DATA,
    REGISTER_UNINITIALIZED,
    REGISTER_OVERFLOW,
    SEQUENCE_EXHAUSTED,
    // ---- caller errors ----
    INVALID_LAYOUT,
    INVALID_ARGUMENT,
    BUFFER_TOO_SMALL,
    BUFFER_BORROWED,
    // ---- snapshot I/O ----
    OPEN_FAILED,
    READ_FAILED,
    WRITE_FAILED,
    CLOSE_FAILED,
    HEADER_CHECKSUM_MISMATCH,
    IMAGE_CHECKSUM_MISMATCH
};

static inline const char* to_string(Status status) noexcept {
    switch (status) {
        case Status::OK: return "Ok";
        case Status::EVENT_QUEUE_EMPTY: return "Event Queue Empty";
        case Status::EVENT_QUEUE_FULL: return "Event Queue Full";
        case Status::CORRUPTED_DATA: return "Corrupted Data";
        case Status::REGISTER_UNINITIALIZED: return "Register Uninitialized";
        case Status::REGISTER_OVERFLOW: return "Register Overflow";
        case Status::SEQUENCE_EXHAUSTED: return "Sequence Exhausted";
        case Status::INVALID_LAYOUT: return "Invalid Layout";
        case Status::INVALID_ARGUMENT: return "Invalid Argument";
        case Status::BUFFER_TOO_SMALL: return "Buffer Too Small";
        case Status::BUFFER_BORROWED: return "Buffer Borrowed";
        case Status::OPEN_FAILED: return "Open Failed";
        case Status::READ_FAILED: return "Read Failed";
        case Status::WRITE_FAILED: return "Write Failed";
        case Status::CLOSE_FAILED: return "Close Failed";
        case Status::HEADER_CHECKSUM_MISMATCH: return "Header Checksum Mismatch";
        case Status::IMAGE_CHECKSUM_MISMATCH: return "Image Checksum Mismatch";
        default: return "Unknown Status";
    }
}

// Unrecoverable: the caller must terminate the enclosing operation
[[nodiscard]] constexpr bool is_fatal(Status status) noexcept {
    switch (status) {
        case Status::CORRUPTED_DATA:
        case Status::REGISTER_UNINITIALIZED:
        case Status::SEQUENCE_EXHAUSTED:
        case Status::HEADER_CHECKSUM_MISMATCH:
        case Status::IMAGE_CHECKSUM_MISMATCH:
            return true;
        default:
            return false;
    }
}

} // namespace aob
