#include "aob/event_queue.hpp"

#include <algorithm>
#include <cstring>


namespace aob {

EventQueue::EventQueue(Account& account, const EventQueueHeader& header, std::size_t callback_info_len) noexcept
    : account_(&account)
    , header_(header)
    , callback_info_len_(callback_info_len)
    , capacity_(header.capacity(account.size()))
{
}

Status EventQueue::check_layout(std::size_t account_len, const EventQueueHeader& header,
                                std::size_t callback_info_len) noexcept {
    if (header.tag != AccountTag::EVENT_QUEUE) {
        AOB_ERROR("[!!] Account is not an event queue (tag " << to_string(header.tag) << ")");
        return Status::INVALID_LAYOUT;
    }
    if (header.register_size == 0) {
        AOB_ERROR("[!!] Event queue register window must hold at least its tag byte");
        return Status::INVALID_LAYOUT;
    }
    const std::size_t min_event_size = event::max_event_size(callback_info_len);
    if (header.event_size < min_event_size) {
        AOB_ERROR("[!!] Event slot too small: event_size=" << header.event_size
                  << ", required=" << min_event_size << " for callback_info_len=" << callback_info_len);
        return Status::INVALID_LAYOUT;
    }
    const uint64_t capacity = header.capacity(account_len);
    if (capacity == 0) {
        AOB_ERROR("[!!] Account of " << account_len << " bytes holds no event slot (event_size="
                  << header.event_size << ", register_size=" << header.register_size << ")");
        return Status::BUFFER_TOO_SMALL;
    }
    if (header.count > capacity || header.head >= capacity) {
        AOB_ERROR("[!!] Event queue header out of bounds: head=" << header.head
                  << ", count=" << header.count << ", capacity=" << capacity);
        return Status::CORRUPTED_DATA;
    }
    return Status::OK;
}

Status EventQueue::attach(Account& account, const EventQueueHeader& header,
                          std::size_t callback_info_len, std::optional<EventQueue>& out) {
    Status status = reopen(account, header, callback_info_len, out);
    if (status != Status::OK) return status;
    status = out->clear_register();
    if (status != Status::OK) {
        out.reset();
        return status;
    }
    return Status::OK;
}

Status EventQueue::reopen(Account& account, const EventQueueHeader& header,
                          std::size_t callback_info_len, std::optional<EventQueue>& out) {
    Status status = check_layout(account.size(), header, callback_info_len);
    if (status != Status::OK) return status;
    out.emplace(EventQueue{account, header, callback_info_len});
    AOB_DEBUG("Event queue opened: capacity=" << out->capacity() << ", count=" << header.count
              << ", seq_num=" << header.seq_num);
    return Status::OK;
}

// ---------------------------------------------------------------------------
// Order ids
// ---------------------------------------------------------------------------
Status EventQueue::gen_order_id(Price limit_price, Side side, OrderId& out) noexcept {
    if (header_.seq_num == SEQ_NUM_LIMIT) [[unlikely]] {
        AOB_FATAL("[!!] Event queue sequence exhausted, refusing to mint order id");
        return Status::SEQUENCE_EXHAUSTED;
    }
    const SeqNum seq = header_.seq_num++;
    out = make_order_id(limit_price, seq, side);
    return Status::OK;
}

// ---------------------------------------------------------------------------
// Circular buffer
// ---------------------------------------------------------------------------
Status EventQueue::push_back(const Event& ev) noexcept {
    if (full()) [[unlikely]] {
        AOB_TRACE("[!!] Event queue full (capacity " << capacity_ << "), rejecting " << event::to_string(kind_of(ev)));
        return Status::EVENT_QUEUE_FULL;
    }
    if (header_.seq_num == SEQ_NUM_LIMIT) [[unlikely]] {
        AOB_FATAL("[!!] Event queue sequence exhausted, refusing to push");
        return Status::SEQUENCE_EXHAUSTED;
    }
    auto borrow = account_->try_borrow_mut();
    if (!borrow) [[unlikely]] return borrow_failed_("push_back");

    const uint64_t slot = slot_at_(header_.count);
    auto window = borrow.bytes().subspan(slot_offset_(slot), header_.event_size);
    Status status = event::serialize(ev, callback_info_len_, window);
    if (status != Status::OK) return status;
    // Zero the slot tail so stale bytes of a longer record never linger
    const std::size_t used = event::encoded_size(ev, callback_info_len_);
    std::memset(window.data() + used, 0, window.size() - used);

    ++header_.count;
    ++header_.seq_num;
    return Status::OK;
}

Status EventQueue::peek_front(Event& out) const {
    if (header_.count == 0) return Status::EVENT_QUEUE_EMPTY;
    return decode_slot_(header_.head, out);
}

Status EventQueue::peek_at(uint64_t index, Event& out) const {
    if (header_.count == 0) return Status::EVENT_QUEUE_EMPTY;
    if (index >= header_.count) [[unlikely]] return Status::INVALID_ARGUMENT;
    return decode_slot_(slot_at_(index), out);
}

Status EventQueue::pop_front(Event& out) {
    if (header_.count == 0) return Status::EVENT_QUEUE_EMPTY;
    Status status = decode_slot_(header_.head, out);
    if (status != Status::OK) return status;
    --header_.count;
    header_.head = (header_.head + 1) % capacity_;
    return Status::OK;
}

uint64_t EventQueue::pop_n(uint64_t n) noexcept {
    const uint64_t dropped = std::min(header_.count, n);
    header_.count -= dropped;
    header_.head = (header_.head + dropped) % capacity_;
    return dropped;
}

// Rolls back count only; seq_num never decreases
Status EventQueue::revert_pushes(uint64_t desired_count) noexcept {
    if (desired_count > header_.count) [[unlikely]] {
        AOB_WARN("[!!] revert_pushes: desired_count " << desired_count << " exceeds count " << header_.count);
        return Status::INVALID_ARGUMENT;
    }
    header_.count = desired_count;
    return Status::OK;
}

// ---------------------------------------------------------------------------
// Register / header persistence
// ---------------------------------------------------------------------------
Status EventQueue::clear_register() noexcept {
    auto borrow = account_->try_borrow_mut();
    if (!borrow) [[unlikely]] return borrow_failed_("clear_register");
    auto window = register_window_(borrow.bytes());
    std::memset(window.data(), 0, window.size());
    window[0] = static_cast<uint8_t>(RegisterTag::UNINITIALIZED);
    return Status::OK;
}

Status EventQueue::write_header() noexcept {
    auto borrow = account_->try_borrow_mut();
    if (!borrow) [[unlikely]] return borrow_failed_("write_header");
    return header_.serialize(borrow.bytes());
}

// ---------------------------------------------------------------------------
// Internal helpers
// ---------------------------------------------------------------------------
Status EventQueue::decode_slot_(uint64_t slot, Event& out) const {
    auto borrow = account_->try_borrow();
    if (!borrow) [[unlikely]] return borrow_failed_("decode");
    auto window = borrow.bytes().subspan(slot_offset_(slot), header_.event_size);
    Status status = event::deserialize(window, callback_info_len_, out);
    if (status != Status::OK) {
        AOB_ERROR("[!!] Failed to decode event slot " << slot << " (head=" << header_.head
                  << ", count=" << header_.count << "): " << to_string(status));
    }
    return status;
}

Status EventQueue::borrow_failed_(const char* op) const noexcept {
    AOB_WARN("[!!] " << op << ": event queue account already borrowed"
             << (account_->is_borrowed_mut() ? " mutably" : ""));
    return Status::BUFFER_BORROWED;
}

} // namespace aob
