// Prints the header, register and pending events of an event queue snapshot.

#include <cstdlib>
#include <iostream>
#include <optional>
#include <utility>

#include "aob.hpp"
#include "common/cli/inspect_params.hpp"

using namespace aob;


int main(int argc, char** argv) {
    const auto params = examples::cli::inspect::configure(argc, argv,
        "aob - Event Queue Inspector\n"
        "Verifies a snapshot and prints its queue state.\n");

    snapshot::Snapshot snap;
    Status status = snapshot::read_snapshot(params.snapshot_path, snap);
    if (status != Status::OK) {
        std::cerr << "Snapshot rejected: " << to_string(status) << std::endl;
        return EXIT_FAILURE;
    }
    const std::size_t callback_info_len = snap.header.callback_info_len();

    EventQueueHeader header;
    status = EventQueueHeader::deserialize(snap.image, header);
    if (status != Status::OK) {
        std::cerr << "Queue header rejected: " << to_string(status) << std::endl;
        return EXIT_FAILURE;
    }

    Account account{std::move(snap.image)};
    std::optional<EventQueue> queue;
    status = EventQueue::reopen(account, header, callback_info_len, queue);
    if (status != Status::OK) {
        std::cerr << "Queue layout rejected: " << to_string(status) << std::endl;
        return EXIT_FAILURE;
    }

    std::cout << "=== Snapshot ===\n"
              << "  File              : " << params.snapshot_path << "\n"
              << "  Created (ns)      : " << snap.header.created_ts_ns() << "\n"
              << "  Image size        : " << snap.header.image_size() << "\n"
              << "  Callback info len : " << callback_info_len << "\n";

    std::cout << "=== Queue ===\n  ";
    queue->header().debug_dump(std::cout);
    std::cout << "\n  capacity=" << queue->capacity()
              << " buf_len=" << queue->buf_len()
              << " full=" << (queue->full() ? "true" : "false") << "\n";

    if (params.show_register) {
        Register<OrderSummary> reg;
        status = queue->read_register(reg);
        std::cout << "=== Register ===\n  ";
        if (status != Status::OK) {
            std::cout << "unreadable: " << to_string(status) << "\n";
        } else if (const OrderSummary* summary = reg.get()) {
            summary->debug_dump(std::cout);
            std::cout << "\n";
        } else {
            std::cout << "uninitialized\n";
        }
    }

    std::cout << "=== Pending events ===\n";
    uint64_t printed = 0;
    status = queue->for_each([&](const Event& ev) {
        if (printed == params.max_events) return false;
        std::cout << "  #" << printed << " ";
        event::debug_dump(ev, std::cout);
        std::cout << "\n";
        ++printed;
        return true;
    });
    if (status != Status::OK) {
        std::cerr << "Event log corrupted: " << to_string(status) << std::endl;
        return EXIT_FAILURE;
    }
    if (printed < queue->size()) {
        std::cout << "  ... " << (queue->size() - printed) << " more\n";
    }
    return EXIT_SUCCESS;
}
