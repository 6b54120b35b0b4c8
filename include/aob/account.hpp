#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>


namespace aob {

// ============================================================================
//  class Account
//  ---------------------------------------------------------------------------
//  Caller-owned byte region backing one event queue (header, register and
//  slots). The queue never owns or resizes it.
//
//  Borrow discipline (checked at runtime, single-threaded):
//    • any number of shared borrows, or
//    • exactly one exclusive borrow,
//  never both. A failed borrow yields an empty guard; the queue maps it to
//  Status::BUFFER_BORROWED. Guards release on destruction.
//
//  Thread safety: none. The orchestrator sequences every access.
// ============================================================================
class Account {
public:
    class Borrow;
    class BorrowMut;

    explicit Account(std::size_t size) : data_(size, 0) {}
    explicit Account(std::vector<uint8_t> image) : data_(std::move(image)) {}

    // Guards point back into the account
    Account(const Account&) = delete;
    Account& operator=(const Account&) = delete;
    Account(Account&&) = delete;
    Account& operator=(Account&&) = delete;

    [[nodiscard]] inline std::size_t size() const noexcept { return data_.size(); }

    [[nodiscard]] inline bool is_borrowed() const noexcept { return state_ != 0; }
    [[nodiscard]] inline bool is_borrowed_mut() const noexcept { return state_ == EXCLUSIVE; }
    [[nodiscard]] inline int32_t shared_borrows() const noexcept { return state_ > 0 ? state_ : 0; }

    [[nodiscard]] inline Borrow try_borrow() const noexcept;
    [[nodiscard]] inline BorrowMut try_borrow_mut() noexcept;

    // Read-only view of the bytes
    class Borrow {
    public:
        Borrow() noexcept = default;
        Borrow(const Borrow&) = delete;
        Borrow& operator=(const Borrow&) = delete;
        Borrow(Borrow&& other) noexcept : owner_(std::exchange(other.owner_, nullptr)) {}
        Borrow& operator=(Borrow&& other) noexcept {
            if (this != &other) {
                release_();
                owner_ = std::exchange(other.owner_, nullptr);
            }
            return *this;
        }
        ~Borrow() { release_(); }

        [[nodiscard]] explicit operator bool() const noexcept { return owner_ != nullptr; }
        [[nodiscard]] inline std::span<const uint8_t> bytes() const noexcept {
            return owner_ ? std::span<const uint8_t>(owner_->data_) : std::span<const uint8_t>{};
        }

    private:
        friend class Account;
        explicit Borrow(const Account* owner) noexcept : owner_(owner) {}

        inline void release_() noexcept {
            if (owner_) {
                --owner_->state_;
                owner_ = nullptr;
            }
        }

        const Account* owner_{nullptr};
    };

    // Exclusive mutable view of the bytes
    class BorrowMut {
    public:
        BorrowMut() noexcept = default;
        BorrowMut(const BorrowMut&) = delete;
        BorrowMut& operator=(const BorrowMut&) = delete;
        BorrowMut(BorrowMut&& other) noexcept : owner_(std::exchange(other.owner_, nullptr)) {}
        BorrowMut& operator=(BorrowMut&& other) noexcept {
            if (this != &other) {
                release_();
                owner_ = std::exchange(other.owner_, nullptr);
            }
            return *this;
        }
        ~BorrowMut() { release_(); }

        [[nodiscard]] explicit operator bool() const noexcept { return owner_ != nullptr; }
        [[nodiscard]] inline std::span<uint8_t> bytes() const noexcept {
            return owner_ ? std::span<uint8_t>(owner_->data_) : std::span<uint8_t>{};
        }

    private:
        friend class Account;
        explicit BorrowMut(Account* owner) noexcept : owner_(owner) {}

        inline void release_() noexcept {
            if (owner_) {
                owner_->state_ = 0;
                owner_ = nullptr;
            }
        }

        Account* owner_{nullptr};
    };

private:
    static constexpr int32_t EXCLUSIVE = -1;

    std::vector<uint8_t> data_;
    mutable int32_t state_{0}; // >0: shared borrows, -1: exclusive
};


inline Account::Borrow Account::try_borrow() const noexcept {
    if (state_ == EXCLUSIVE) [[unlikely]] return Borrow{};
    ++state_;
    return Borrow{this};
}

inline Account::BorrowMut Account::try_borrow_mut() noexcept {
    if (state_ != 0) [[unlikely]] return BorrowMut{};
    state_ = EXCLUSIVE;
    return BorrowMut{this};
}

} // namespace aob
