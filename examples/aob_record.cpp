// Records a simulated matching session into an event queue account and
// writes it out as a snapshot for aob_inspect.

#include <cstdlib>
#include <iostream>
#include <optional>

#include "aob.hpp"
#include "common/order_flow.hpp"
#include "common/cli/record_params.hpp"

using namespace aob;


int main(int argc, char** argv) {
    const auto params = examples::cli::record::configure(argc, argv,
        "aob - Event Queue Recorder\n"
        "Simulates order flow against a fresh event queue and writes a snapshot.\n");
    params.dump("=== Recorder Parameters ===", std::cout);

    const Layout layout{params.callback_len, params.capacity, DEFAULT_REGISTER_SIZE};
    if (layout.validate() != Status::OK) {
        return EXIT_FAILURE;
    }
    Account account{layout.account_size()};

    std::optional<EventQueue> queue;
    Status status = EventQueue::attach(account, layout.make_header(), layout.callback_info_len, queue);
    if (status != Status::OK) {
        AOB_ERROR("Failed to attach event queue: " << to_string(status));
        return EXIT_FAILURE;
    }

    examples::OrderFlowResult flow;
    status = examples::simulate_order_flow(*queue, params.orders, flow);
    if (status != Status::OK) {
        return EXIT_FAILURE;
    }

    const uint64_t drained = queue->pop_n(params.drain);

    status = queue->write_to_register(flow.summary);
    if (status == Status::OK) status = queue->write_header();
    if (status == Status::OK) status = snapshot::write_snapshot(params.output, account, params.callback_len);
    if (status != Status::OK) {
        AOB_ERROR("Failed to persist event queue: " << to_string(status));
        return EXIT_FAILURE;
    }

    std::cout << "Recorded " << flow.recorded << " events, drained " << drained
              << ", pending " << queue->size() << "/" << queue->capacity()
              << " -> " << params.output << std::endl;
    return EXIT_SUCCESS;
}
