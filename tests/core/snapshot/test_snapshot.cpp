/*
===============================================================================
 snapshot - Unit Tests
===============================================================================

Scope:
------
Snapshot files of an event queue account: write, read back, reopen the
queue from the image and reject altered files.

Covered Requirements:
---------------------
1. write -> read gives the same image and a queue that reopens with the
   same events and register value
2. A flipped image byte is an image checksum mismatch
3. A flipped header byte is a header checksum mismatch
4. Truncated and missing files are rejected
5. Snapshots refuse an exclusively borrowed account

===============================================================================
*/

#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>
#include <unistd.h>

#include "aob.hpp"
#include "common/test_check.hpp"

using namespace aob;


static std::string temp_path(const char* name) {
    return (std::filesystem::temp_directory_path() /
            (std::string("aob_") + name + "_" + std::to_string(::getpid()) + ".aqs")).string();
}

static std::vector<uint8_t> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

static void write_file(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

// Queue with two pending events, a register value and a persisted header
static void populate(Account& account, const Layout& layout, OrderSummary& summary) {
    std::optional<EventQueue> queue;
    TEST_CHECK_STATUS(EventQueue::attach(account, layout.make_header(), layout.callback_info_len, queue), Status::OK);

    OrderId maker = 0;
    OrderId taker = 0;
    TEST_CHECK_STATUS(queue->gen_order_id(700, Side::ASK, maker), Status::OK);
    TEST_CHECK_STATUS(queue->gen_order_id(701, Side::BID, taker), Status::OK);

    const CallbackInfo maker_cb(layout.callback_info_len, 0x11);
    const CallbackInfo taker_cb(layout.callback_info_len, 0x22);
    TEST_CHECK_STATUS(queue->push_back(event::Fill{Side::BID, maker, 700 * 3, 3, maker_cb, taker_cb}), Status::OK);
    TEST_CHECK_STATUS(queue->push_back(event::Out{Side::ASK, maker, 3, maker_cb}), Status::OK);

    summary.posted_order_id = taker;
    summary.total_asset_qty = 5;
    summary.total_quote_qty = 3505;
    summary.total_asset_qty_posted = 2;
    TEST_CHECK_STATUS(queue->write_to_register(summary), Status::OK);
    TEST_CHECK_STATUS(queue->write_header(), Status::OK);
}


// -----------------------------------------------------------------------------
// 1. Round trip
// -----------------------------------------------------------------------------
void test_write_read_reopen() {
    std::cout << "[TEST] Snapshot 1: write, read and reopen\n";

    const Layout layout{12, 4, DEFAULT_REGISTER_SIZE};
    Account account{layout.account_size()};
    OrderSummary summary;
    populate(account, layout, summary);

    const std::string path = temp_path("roundtrip");
    TEST_CHECK_STATUS(snapshot::write_snapshot(path, account, 12), Status::OK);

    snapshot::Snapshot snap;
    TEST_CHECK_STATUS(snapshot::read_snapshot(path, snap), Status::OK);
    TEST_CHECK(snap.header.magic() == snapshot::SNAPSHOT_MAGIC);
    TEST_CHECK(snap.header.callback_info_len() == 12);
    TEST_CHECK(snap.header.image_size() == layout.account_size());
    TEST_CHECK(snap.header.created_ts_ns() > 0);
    {
        auto borrow = account.try_borrow();
        const auto bytes = borrow.bytes();
        TEST_CHECK(std::vector<uint8_t>(bytes.begin(), bytes.end()) == snap.image);
    }

    EventQueueHeader header;
    TEST_CHECK_STATUS(EventQueueHeader::deserialize(snap.image, header), Status::OK);
    TEST_CHECK(header.count == 2);
    TEST_CHECK(header.seq_num == 4);

    Account restored{std::move(snap.image)};
    std::optional<EventQueue> queue;
    TEST_CHECK_STATUS(EventQueue::reopen(restored, header, snap.header.callback_info_len(), queue), Status::OK);

    Register<OrderSummary> reg;
    TEST_CHECK_STATUS(queue->read_register(reg), Status::OK);
    TEST_CHECK(reg.is_initialized());
    TEST_CHECK(*reg.get() == summary);

    Event ev;
    TEST_CHECK_STATUS(queue->pop_front(ev), Status::OK);
    TEST_CHECK(kind_of(ev) == event::Kind::FILL);
    TEST_CHECK(std::get<event::Fill>(ev).taker_callback_info == CallbackInfo(12, 0x22));
    TEST_CHECK_STATUS(queue->pop_front(ev), Status::OK);
    TEST_CHECK(kind_of(ev) == event::Kind::OUT);
    TEST_CHECK_STATUS(queue->pop_front(ev), Status::EVENT_QUEUE_EMPTY);

    std::remove(path.c_str());
    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// 2. + 3. Altered files
// -----------------------------------------------------------------------------
void test_altered_files() {
    std::cout << "[TEST] Snapshot 2: altered image and header bytes\n";

    const Layout layout{4, 2, DEFAULT_REGISTER_SIZE};
    Account account{layout.account_size()};
    OrderSummary summary;
    populate(account, layout, summary);

    const std::string path = temp_path("altered");
    TEST_CHECK_STATUS(snapshot::write_snapshot(path, account, 4), Status::OK);
    const std::vector<uint8_t> pristine = read_file(path);
    TEST_CHECK(pristine.size() == sizeof(snapshot::Header) + layout.account_size());

    snapshot::Snapshot snap;

    std::vector<uint8_t> bytes = pristine;
    bytes[sizeof(snapshot::Header) + EVENT_QUEUE_HEADER_LEN + DEFAULT_REGISTER_SIZE] ^= 0xFF;
    write_file(path, bytes);
    TEST_CHECK_STATUS(snapshot::read_snapshot(path, snap), Status::IMAGE_CHECKSUM_MISMATCH);

    bytes = pristine;
    bytes[offsetof(snapshot::Header, callback_info_len_le)] ^= 0x01;
    write_file(path, bytes);
    TEST_CHECK_STATUS(snapshot::read_snapshot(path, snap), Status::HEADER_CHECKSUM_MISMATCH);

    // Padding is covered by the header checksum too
    bytes = pristine;
    bytes[sizeof(snapshot::Header) - 1] ^= 0x80;
    write_file(path, bytes);
    TEST_CHECK_STATUS(snapshot::read_snapshot(path, snap), Status::HEADER_CHECKSUM_MISMATCH);

    write_file(path, pristine);
    TEST_CHECK_STATUS(snapshot::read_snapshot(path, snap), Status::OK);

    std::remove(path.c_str());
    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// 4. Truncated and missing files
// -----------------------------------------------------------------------------
void test_truncated_and_missing() {
    std::cout << "[TEST] Snapshot 3: truncated and missing files\n";

    const Layout layout{0, 2, DEFAULT_REGISTER_SIZE};
    Account account{layout.account_size()};
    OrderSummary summary;
    populate(account, layout, summary);

    const std::string path = temp_path("truncated");
    TEST_CHECK_STATUS(snapshot::write_snapshot(path, account, 0), Status::OK);
    const std::vector<uint8_t> pristine = read_file(path);

    snapshot::Snapshot snap;
    write_file(path, std::vector<uint8_t>(pristine.begin(), pristine.end() - 1));
    TEST_CHECK_STATUS(snapshot::read_snapshot(path, snap), Status::CORRUPTED_DATA);

    write_file(path, std::vector<uint8_t>(pristine.begin(), pristine.begin() + 10));
    TEST_CHECK_STATUS(snapshot::read_snapshot(path, snap), Status::READ_FAILED);

    std::remove(path.c_str());
    TEST_CHECK_STATUS(snapshot::read_snapshot(path, snap), Status::OPEN_FAILED);

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// 5. Borrowed account
// -----------------------------------------------------------------------------
void test_borrowed_account() {
    std::cout << "[TEST] Snapshot 4: exclusively borrowed account\n";

    Account account{Layout{0, 1, DEFAULT_REGISTER_SIZE}.account_size()};
    const std::string path = temp_path("borrowed");
    {
        auto writer = account.try_borrow_mut();
        TEST_CHECK_STATUS(snapshot::write_snapshot(path, account, 0), Status::BUFFER_BORROWED);
    }
    {
        auto reader = account.try_borrow();
        TEST_CHECK_STATUS(snapshot::write_snapshot(path, account, 0), Status::OK);
    }

    std::remove(path.c_str());
    std::cout << "[TEST] OK\n";
}


int main() {
    aob::log::Logger::instance().set_level(aob::log::Level::Trace);

    test_write_read_reopen();
    test_altered_files();
    test_truncated_and_missing();
    test_borrowed_account();

    std::cout << "\n[SNAPSHOT TESTS PASSED]\n";
    return 0;
}
