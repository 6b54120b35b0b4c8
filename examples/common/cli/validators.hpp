#pragma once

#include <stdexcept>
#include <string>

#include <CLI/CLI.hpp>

#include "aob/log/logger.hpp"


namespace aob::examples::cli {

// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        aob::log::Level lvl{};
        if (aob::log::parse_level(value, lvl)) {
            return {};
        }
        return "Log level must be one of: trace, debug, info, warn, error, fatal, off";
    },
    "Log level validator"
);


// -------------------------------------------------------------
// Callback info length validator (snapshot header stores it as u32)
// -------------------------------------------------------------
inline auto callback_info_len_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        try {
            auto n = std::stoull(value);
            if (n <= 1024) {
                return {};
            }
            return "Callback info length must be at most 1024 bytes";
        } catch (const std::exception&) {
            return "Callback info length must be a valid integer";
        }
    },
    "Callback info length validator"
);

} // namespace aob::examples::cli
