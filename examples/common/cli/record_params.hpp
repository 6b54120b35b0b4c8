#pragma once

#include <string>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string_view>

#include <CLI/CLI.hpp>

#include "common/logger.hpp"
#include "common/cli/validators.hpp"


namespace aob::examples::cli::record {

    struct Params {
        std::string output           = "event_queue.aqs";
        std::uint64_t capacity       = 16;
        std::uint32_t callback_len   = 32;
        std::uint64_t orders         = 24;
        std::uint64_t drain          = 0;
        std::string log_level        = "info";

        inline void dump(const std::string& header, std::ostream& os) const {
            os << header << ":\n"
               << "  Output        : " << output << "\n"
               << "  Capacity      : " << capacity << "\n"
               << "  Callback len  : " << callback_len << "\n"
               << "  Orders        : " << orders << "\n"
               << "  Drain         : " << drain << "\n"
               << "  Log Level     : " << log_level << "\n";
        }
    };

    [[nodiscard]]
    inline Params configure(int argc, char** argv, std::string_view description) {
        CLI::App app{std::string(description)};
        Params params{};
        app.add_option("-o,--output", params.output, "Snapshot file to write")->default_val(params.output);
        app.add_option("-c,--capacity", params.capacity, "Event slots in the queue")->check(CLI::Range(std::uint64_t{1}, std::uint64_t{1} << 20))->default_val(params.capacity);
        app.add_option("--callback-info-len", params.callback_len, "Bytes of callback info per order")->check(callback_info_len_validator)->default_val(params.callback_len);
        app.add_option("--orders", params.orders, "Number of simulated orders")->default_val(params.orders);
        app.add_option("--drain", params.drain, "Events to pop before writing the snapshot")->default_val(params.drain);
        app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->check(log_level_validator)->default_val(params.log_level);
        app.footer(
            "Orders alternate between bids and asks; every second order crosses\n"
            "and produces a Fill, the rest are cancelled and produce an Out.\n"
            "Recording stops at the first back-pressure signal."
        );
        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            std::exit(app.exit(e, std::cout, std::cerr));
        }
        set_log_level(params.log_level);
        return params;
    }

} // namespace aob::examples::cli::record
