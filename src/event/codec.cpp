#include "aob/event/codec.hpp"

#include <cstring>

#include "aob/util/endian.hpp"
#include "aob/log/logger.hpp"


namespace aob {
namespace event {

namespace {

// Forward-only cursor over a window already checked to be large enough
class Writer {
public:
    explicit Writer(uint8_t* dst) noexcept : p_(dst) {}

    inline void u8(uint8_t v) noexcept { *p_++ = v; }
    inline void u64(uint64_t v) noexcept { util::store_le64(p_, v); p_ += 8; }
    inline void u128(OrderId v) noexcept { util::store_le128(p_, v); p_ += 16; }
    inline void bytes(const CallbackInfo& b) noexcept {
        if (!b.empty()) std::memcpy(p_, b.data(), b.size());
        p_ += b.size();
    }

private:
    uint8_t* p_;
};

class Reader {
public:
    explicit Reader(const uint8_t* src) noexcept : p_(src) {}

    inline uint8_t u8() noexcept { return *p_++; }
    inline uint64_t u64() noexcept { uint64_t v = util::load_le64(p_); p_ += 8; return v; }
    inline OrderId u128() noexcept { OrderId v = util::load_le128(p_); p_ += 16; return v; }
    inline CallbackInfo bytes(std::size_t n) {
        CallbackInfo b(p_, p_ + n);
        p_ += n;
        return b;
    }

private:
    const uint8_t* p_;
};

} // namespace


Status serialize(const Event& ev, std::size_t callback_info_len, std::span<uint8_t> out) noexcept {
    const std::size_t needed = encoded_size(ev, callback_info_len);
    if (out.size() < needed) [[unlikely]] {
        AOB_TRACE("[!!] Event window too small: need " << needed << ", have " << out.size());
        return Status::BUFFER_TOO_SMALL;
    }
    Writer w{out.data()};
    if (const auto* f = std::get_if<Fill>(&ev)) {
        if (f->maker_callback_info.size() != callback_info_len ||
            f->taker_callback_info.size() != callback_info_len) [[unlikely]] {
            AOB_WARN("[!!] Fill callback info length mismatch: expected " << callback_info_len
                     << ", maker=" << f->maker_callback_info.size()
                     << ", taker=" << f->taker_callback_info.size());
            return Status::INVALID_ARGUMENT;
        }
        w.u8(static_cast<uint8_t>(Kind::FILL));
        w.u8(static_cast<uint8_t>(f->taker_side));
        w.u128(f->maker_order_id);
        w.u64(f->quote_size);
        w.u64(f->asset_size);
        w.bytes(f->maker_callback_info);
        w.bytes(f->taker_callback_info);
        return Status::OK;
    }
    const auto& o = std::get<Out>(ev);
    if (o.callback_info.size() != callback_info_len) [[unlikely]] {
        AOB_WARN("[!!] Out callback info length mismatch: expected " << callback_info_len
                 << ", found " << o.callback_info.size());
        return Status::INVALID_ARGUMENT;
    }
    w.u8(static_cast<uint8_t>(Kind::OUT));
    w.u8(static_cast<uint8_t>(o.side));
    w.u128(o.order_id);
    w.u64(o.asset_size);
    w.bytes(o.callback_info);
    return Status::OK;
}


Status deserialize(std::span<const uint8_t> in, std::size_t callback_info_len, Event& out) {
    if (in.empty()) [[unlikely]] {
        return Status::BUFFER_TOO_SMALL;
    }
    const uint8_t tag = in[0];
    std::size_t needed = 0;
    switch (tag) {
        case static_cast<uint8_t>(Kind::FILL): needed = fill_size(callback_info_len); break;
        case static_cast<uint8_t>(Kind::OUT):  needed = out_size(callback_info_len); break;
        default:
            AOB_ERROR("[!!] Corrupted event record: unknown discriminant " << static_cast<int>(tag));
            return Status::CORRUPTED_DATA;
    }
    if (in.size() < needed) [[unlikely]] {
        AOB_TRACE("[!!] Event window too small: need " << needed << ", have " << in.size());
        return Status::BUFFER_TOO_SMALL;
    }

    Reader r{in.data() + 1};
    Side side{};
    const uint8_t raw_side = r.u8();
    if (!side_from_u8(raw_side, side)) [[unlikely]] {
        AOB_ERROR("[!!] Corrupted event record: invalid side byte " << static_cast<int>(raw_side));
        return Status::CORRUPTED_DATA;
    }

    if (tag == static_cast<uint8_t>(Kind::FILL)) {
        Fill f;
        f.taker_side = side;
        f.maker_order_id = r.u128();
        f.quote_size = r.u64();
        f.asset_size = r.u64();
        f.maker_callback_info = r.bytes(callback_info_len);
        f.taker_callback_info = r.bytes(callback_info_len);
        out = std::move(f);
    } else {
        Out o;
        o.side = side;
        o.order_id = r.u128();
        o.asset_size = r.u64();
        o.callback_info = r.bytes(callback_info_len);
        out = std::move(o);
    }
    return Status::OK;
}

} // namespace event
} // namespace aob
