/*
===============================================================================
 Order flow driver - Unit Tests
===============================================================================

Covered Requirements:
---------------------
C1. Only resting (Out) orders set posted_order_id and total_asset_qty_posted
C2. Back-pressure stops the flow and the summary covers accepted events only
C3. An empty session posts nothing

===============================================================================
*/

#include <iostream>
#include <optional>

#include "aob.hpp"
#include "common/order_flow.hpp"
#include "common/test_check.hpp"

using namespace aob;

//
// C1. only resting (Out) orders are reported as posted in the summary.
//
void test_summary_counts_resting_orders_only() {
    std::cout << "[TEST] Group C1: only resting orders are posted\n";

    const Layout layout{2, 8, DEFAULT_REGISTER_SIZE};
    Account account{layout.account_size()};
    std::optional<EventQueue> queue;
    TEST_CHECK_STATUS(EventQueue::attach(account, layout.make_header(), 2, queue), Status::OK);

    examples::OrderFlowResult flow;
    TEST_CHECK_STATUS(examples::simulate_order_flow(*queue, 4, flow), Status::OK);
    TEST_CHECK(flow.recorded == 4);
    TEST_CHECK(!flow.back_pressure);

    TEST_CHECK(flow.summary.total_asset_qty == 10 + 11 + 12 + 13);
    TEST_CHECK(flow.summary.total_quote_qty == 10 * 1000 + 11 * 1001 + 12 * 1002 + 13 * 1003);
    TEST_CHECK(flow.summary.total_asset_qty_posted == 10 + 12);

    // Last resting order is #2 (bid at 1002); its id was minted from seq 4
    TEST_CHECK(flow.summary.posted_order_id.has_value());
    TEST_CHECK(*flow.summary.posted_order_id == make_order_id(1002, 4, Side::BID));

    // The crossing order after it produced a Fill and is not the posted id
    Event ev;
    TEST_CHECK_STATUS(queue->peek_at(3, ev), Status::OK);
    TEST_CHECK(kind_of(ev) == event::Kind::FILL);
    TEST_CHECK(std::get<event::Fill>(ev).maker_order_id != *flow.summary.posted_order_id);

    std::cout << "[TEST] OK\n";
}

//
// C2. the flow stops at back-pressure and the summary covers accepted events only.
//
void test_flow_stops_on_back_pressure() {
    std::cout << "[TEST] Group C2: back-pressure stops the flow\n";

    const Layout layout{0, 3, DEFAULT_REGISTER_SIZE};
    Account account{layout.account_size()};
    std::optional<EventQueue> queue;
    TEST_CHECK_STATUS(EventQueue::attach(account, layout.make_header(), 0, queue), Status::OK);

    examples::OrderFlowResult flow;
    TEST_CHECK_STATUS(examples::simulate_order_flow(*queue, 10, flow), Status::OK);
    TEST_CHECK(flow.back_pressure);
    TEST_CHECK(flow.recorded == 3);
    TEST_CHECK(queue->full());
    TEST_CHECK(flow.summary.total_asset_qty == 10 + 11 + 12);
    TEST_CHECK(flow.summary.total_asset_qty_posted == 10 + 12);

    std::cout << "[TEST] OK\n";
}

//
// C3. a session with no resting order posts nothing.
//
void test_empty_session() {
    std::cout << "[TEST] Group C3: empty session\n";

    const Layout layout{0, 2, DEFAULT_REGISTER_SIZE};
    Account account{layout.account_size()};
    std::optional<EventQueue> queue;
    TEST_CHECK_STATUS(EventQueue::attach(account, layout.make_header(), 0, queue), Status::OK);

    examples::OrderFlowResult flow;
    TEST_CHECK_STATUS(examples::simulate_order_flow(*queue, 0, flow), Status::OK);
    TEST_CHECK(flow.recorded == 0);
    TEST_CHECK(!flow.summary.posted_order_id.has_value());
    TEST_CHECK(flow.summary.total_asset_qty_posted == 0);

    std::cout << "[TEST] OK\n";
}

int main() {
    aob::log::Logger::instance().set_level(aob::log::Level::Trace);

    test_summary_counts_resting_orders_only();
    test_flow_stops_on_back_pressure();
    test_empty_session();

    std::cout << "\n[ORDER FLOW TESTS PASSED]\n";
    return 0;
}
