#include "aob/event_queue/header.hpp"

#include "aob/event/codec.hpp"
#include "aob/util/endian.hpp"
#include "aob/log/logger.hpp"


namespace aob {

EventQueueHeader EventQueueHeader::for_layout(std::size_t callback_info_len) noexcept {
    EventQueueHeader h{};
    h.event_size = event::max_event_size(callback_info_len);
    return h;
}

Status EventQueueHeader::serialize(std::span<uint8_t> out) const noexcept {
    if (out.size() < EVENT_QUEUE_HEADER_LEN) [[unlikely]] {
        return Status::BUFFER_TOO_SMALL;
    }
    uint8_t* p = out.data();
    p[TAG_OFFSET] = static_cast<uint8_t>(tag);
    util::store_le64(p + HEAD_OFFSET, head);
    util::store_le64(p + COUNT_OFFSET, count);
    util::store_le64(p + EVENT_SIZE_OFFSET, event_size);
    util::store_le64(p + SEQ_NUM_OFFSET, seq_num);
    util::store_le32(p + REGISTER_SIZE_OFFSET, register_size);
    return Status::OK;
}

Status EventQueueHeader::deserialize(std::span<const uint8_t> in, EventQueueHeader& out) noexcept {
    if (in.size() < EVENT_QUEUE_HEADER_LEN) [[unlikely]] {
        return Status::BUFFER_TOO_SMALL;
    }
    const uint8_t* p = in.data();
    AccountTag tag{};
    if (!account_tag_from_u8(p[TAG_OFFSET], tag)) [[unlikely]] {
        AOB_ERROR("[!!] Corrupted event queue header: unknown account tag " << static_cast<int>(p[TAG_OFFSET]));
        return Status::CORRUPTED_DATA;
    }
    out.tag = tag;
    out.head = util::load_le64(p + HEAD_OFFSET);
    out.count = util::load_le64(p + COUNT_OFFSET);
    out.event_size = util::load_le64(p + EVENT_SIZE_OFFSET);
    out.seq_num = util::load_le64(p + SEQ_NUM_OFFSET);
    out.register_size = util::load_le32(p + REGISTER_SIZE_OFFSET);
    return Status::OK;
}

} // namespace aob
