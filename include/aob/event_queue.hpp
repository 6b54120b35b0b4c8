#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <type_traits>

#include "aob/types.hpp"
#include "aob/constants.hpp"
#include "aob/status.hpp"
#include "aob/account.hpp"
#include "aob/order_id.hpp"
#include "aob/register.hpp"
#include "aob/event/event.hpp"
#include "aob/event/codec.hpp"
#include "aob/event_queue/header.hpp"
#include "aob/log/logger.hpp"


namespace aob {

// ============================================================================
//  class EventQueue
//  ----------------------------------------------------------------------------
//  Fixed-capacity circular log of Fill / Out events stored inside a borrowed
//  Account, plus the register and the order id generator.
//
//  Responsibilities:
//  -----------------
//      • Append matching outcomes (push_back) and drain them in FIFO order
//        (peek_front, pop_front, pop_n).
//      • Mint order ids that encode price-time priority (gen_order_id).
//      • Carry one out-of-band return value per call sequence (register).
//
//  Bookkeeping:
//  ------------
//      • head/count over slot indices: slot i lives at
//          EVENT_QUEUE_HEADER_LEN + register_size + i * event_size
//        and indices wrap at capacity = floor(buf_len / event_size), so the
//        header and register regions are never used as slots.
//      • head/count (not head/tail) keeps "empty" and "full" distinct.
//      • The header is a detached copy; the queue never writes it back on
//        its own. Call write_header() when the call sequence completes.
//
//  Back-pressure:
//  --------------
//      • push_back on a full queue returns EVENT_QUEUE_FULL and writes
//        nothing; the event stays with the caller.
//
//  Thread Safety:
//  --------------
//      • Not thread-safe. Every slice access takes a scoped Account borrow
//        and fails with BUFFER_BORROWED if the borrow discipline is violated.
// ============================================================================
class EventQueue {
public:
    // Validates the layout and clears the register. Use at the start of
    // every queue-mutating call sequence.
    [[nodiscard]] static Status attach(Account& account, const EventQueueHeader& header,
                                       std::size_t callback_info_len, std::optional<EventQueue>& out);

    // Validates the layout only. Used by the privileged caller to read the
    // register written by the previous call sequence.
    [[nodiscard]] static Status reopen(Account& account, const EventQueueHeader& header,
                                       std::size_t callback_info_len, std::optional<EventQueue>& out);

    // Structural checks shared by attach() and reopen()
    [[nodiscard]] static Status check_layout(std::size_t account_len, const EventQueueHeader& header,
                                             std::size_t callback_info_len) noexcept;

    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;
    EventQueue(EventQueue&&) noexcept = default;
    EventQueue& operator=(EventQueue&&) noexcept = default;

    // Accessors
    [[nodiscard]] inline const EventQueueHeader& header() const noexcept { return header_; }
    [[nodiscard]] inline std::size_t callback_info_len() const noexcept { return callback_info_len_; }
    [[nodiscard]] inline uint64_t buf_len() const noexcept { return header_.buf_len(account_->size()); }
    [[nodiscard]] inline uint64_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] inline uint64_t size() const noexcept { return header_.count; }
    [[nodiscard]] inline bool empty() const noexcept { return header_.count == 0; }
    [[nodiscard]] inline bool full() const noexcept { return header_.count == capacity_; }

    // ---- order ids ----
    [[nodiscard]] Status gen_order_id(Price limit_price, Side side, OrderId& out) noexcept;

    // ---- circular buffer ----
    [[nodiscard]] Status push_back(const Event& ev) noexcept;
    [[nodiscard]] Status peek_front(Event& out) const;
    [[nodiscard]] Status peek_at(uint64_t index, Event& out) const;
    [[nodiscard]] Status pop_front(Event& out);
    uint64_t pop_n(uint64_t n) noexcept;
    [[nodiscard]] Status revert_pushes(uint64_t desired_count) noexcept;

    // Visits pending events front to back. `fn(const Event&)` may return
    // bool (false stops the walk) or void.
    template <typename Fn>
    [[nodiscard]] Status for_each(Fn&& fn) const {
        for (uint64_t i = 0; i < header_.count; ++i) {
            Event ev;
            Status status = decode_slot_(slot_at_(i), ev);
            if (status != Status::OK) return status;
            if constexpr (std::is_same_v<std::invoke_result_t<Fn&, const Event&>, bool>) {
                if (!fn(static_cast<const Event&>(ev))) break;
            } else {
                fn(static_cast<const Event&>(ev));
            }
        }
        return Status::OK;
    }

    // ---- register ----
    template <RegisterValue T>
    [[nodiscard]] Status write_to_register(const T& value) noexcept {
        auto borrow = account_->try_borrow_mut();
        if (!borrow) [[unlikely]] return borrow_failed_("write_to_register");
        return Register<T>::initialized(value).encode(register_window_(borrow.bytes()));
    }

    [[nodiscard]] Status clear_register() noexcept;

    template <RegisterValue T>
    [[nodiscard]] Status read_register(Register<T>& out) const noexcept {
        auto borrow = account_->try_borrow();
        if (!borrow) [[unlikely]] return borrow_failed_("read_register");
        return Register<T>::decode(register_window_(borrow.bytes()), out);
    }

    // Persists the detached header into the account prefix
    [[nodiscard]] Status write_header() noexcept;

private:
    EventQueue(Account& account, const EventQueueHeader& header, std::size_t callback_info_len) noexcept;

    [[nodiscard]] inline uint64_t slot_at_(uint64_t index) const noexcept {
        return (header_.head + index) % capacity_;
    }

    [[nodiscard]] inline std::size_t slot_offset_(uint64_t slot) const noexcept {
        return EVENT_QUEUE_HEADER_LEN + header_.register_size + static_cast<std::size_t>(slot * header_.event_size);
    }

    template <typename Bytes>
    [[nodiscard]] inline auto register_window_(Bytes bytes) const noexcept {
        return bytes.subspan(EVENT_QUEUE_HEADER_LEN, header_.register_size);
    }

    [[nodiscard]] Status decode_slot_(uint64_t slot, Event& out) const;
    [[nodiscard]] Status borrow_failed_(const char* op) const noexcept;

    Account* account_;
    EventQueueHeader header_;
    std::size_t callback_info_len_;
    uint64_t capacity_; // fixed: accounts never resize
};

} // namespace aob
