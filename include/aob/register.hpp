#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <utility>

#include "aob/status.hpp"
#include "aob/log/logger.hpp"


namespace aob {

/*
===============================================================================
Register
===============================================================================

A single-slot, explicitly tagged optional value kept in a fixed byte window
right after the queue header. It is the return channel of a call boundary
that cannot return values directly: the matching layer writes a summary, the
privileged caller reads it back after the call.

Window layout:

    [ tag : 1 ][ payload : T::ENCODED_SIZE ][ zero fill ... ]

    tag 0 = Uninitialized (payload ignored)
    tag 1 = Initialized

Any other tag is treated as corrupted storage.
===============================================================================
*/

enum class RegisterTag : uint8_t {
    UNINITIALIZED = 0,
    INITIALIZED = 1
};

// A type that can live in a register: fixed encoded size, explicit codec
template <typename T>
concept RegisterValue =
    std::default_initializable<T> &&
    std::copyable<T> &&
    requires(const T& value, T& dst, std::span<uint8_t> out, std::span<const uint8_t> in) {
        { T::ENCODED_SIZE } -> std::convertible_to<std::size_t>;
        { value.encode(out) } -> std::same_as<void>;
        { T::decode(in, dst) } -> std::same_as<Status>;
    };


template <RegisterValue T>
class Register {
public:
    static constexpr std::size_t ENCODED_SIZE = 1 + T::ENCODED_SIZE;

    Register() noexcept = default;

    [[nodiscard]] static Register initialized(T value) {
        Register r;
        r.tag_ = RegisterTag::INITIALIZED;
        r.value_ = std::move(value);
        return r;
    }

    [[nodiscard]] inline RegisterTag tag() const noexcept { return tag_; }
    [[nodiscard]] inline bool is_initialized() const noexcept { return tag_ == RegisterTag::INITIALIZED; }

    // nullptr when Uninitialized
    [[nodiscard]] inline const T* get() const noexcept {
        return is_initialized() ? &value_ : nullptr;
    }

    // The caller requires a value. An empty register here means the call
    // sequence that should have produced it never wrote one.
    [[nodiscard]] inline Status unwrap(T& out) const noexcept {
        if (!is_initialized()) [[unlikely]] {
            AOB_FATAL("[!!] Register read as initialized but holds no value");
            return Status::REGISTER_UNINITIALIZED;
        }
        out = value_;
        return Status::OK;
    }

    // Writes tag + payload and zero-fills the rest of the window
    [[nodiscard]] Status encode(std::span<uint8_t> window) const noexcept {
        if (window.size() < ENCODED_SIZE) [[unlikely]] {
            AOB_WARN("[!!] Register window too small: need " << ENCODED_SIZE << ", have " << window.size());
            return Status::REGISTER_OVERFLOW;
        }
        std::memset(window.data(), 0, window.size());
        window[0] = static_cast<uint8_t>(tag_);
        if (is_initialized()) {
            value_.encode(window.subspan(1, T::ENCODED_SIZE));
        }
        return Status::OK;
    }

    [[nodiscard]] static Status decode(std::span<const uint8_t> window, Register& out) noexcept {
        if (window.empty()) [[unlikely]] {
            return Status::BUFFER_TOO_SMALL;
        }
        switch (window[0]) {
            case static_cast<uint8_t>(RegisterTag::UNINITIALIZED):
                out = Register{};
                return Status::OK;
            case static_cast<uint8_t>(RegisterTag::INITIALIZED): {
                if (window.size() < ENCODED_SIZE) [[unlikely]] {
                    return Status::BUFFER_TOO_SMALL;
                }
                T value{};
                Status status = T::decode(window.subspan(1, T::ENCODED_SIZE), value);
                if (status != Status::OK) return status;
                out = initialized(std::move(value));
                return Status::OK;
            }
            default:
                AOB_ERROR("[!!] Corrupted register: unknown tag " << static_cast<int>(window[0]));
                return Status::CORRUPTED_DATA;
        }
    }

    bool operator==(const Register& other) const {
        if (tag_ != other.tag_) return false;
        return !is_initialized() || value_ == other.value_;
    }

private:
    RegisterTag tag_{RegisterTag::UNINITIALIZED};
    T value_{};
};

} // namespace aob
