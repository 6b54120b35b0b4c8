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


namespace aob::examples::cli::inspect {

    struct Params {
        std::string snapshot_path;
        std::uint64_t max_events = 32;
        bool show_register       = true;
        std::string log_level    = "warn";

        inline void dump(const std::string& header, std::ostream& os) const {
            os << header << ":\n"
               << "  Snapshot   : " << snapshot_path << "\n"
               << "  Max events : " << max_events << "\n"
               << "  Register   : " << (show_register ? "true" : "false") << "\n"
               << "  Log Level  : " << log_level << "\n";
        }
    };

    [[nodiscard]]
    inline Params configure(int argc, char** argv, std::string_view description) {
        CLI::App app{std::string(description)};
        Params params{};
        app.add_option("snapshot", params.snapshot_path, "Snapshot file to inspect")->required()->check(CLI::ExistingFile);
        app.add_option("-n,--max-events", params.max_events, "Maximum number of pending events to print")->default_val(params.max_events);
        app.add_option("--register", params.show_register, "Decode the register as an order summary")->default_val(params.show_register);
        app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->check(log_level_validator)->default_val(params.log_level);
        app.footer(
            "The register is read without clearing it, exactly as the\n"
            "privileged caller would after a matching call."
        );
        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            std::exit(app.exit(e, std::cout, std::cerr));
        }
        set_log_level(params.log_level);
        return params;
    }

} // namespace aob::examples::cli::inspect
