#pragma once

#include <string>

#include "aob/log/logger.hpp"


namespace aob::examples {

    // Unknown names fall back to info
    inline void set_log_level(const std::string& log_level) {
        using namespace aob::log;
        Level lvl = Level::Info;
        if (!parse_level(log_level, lvl)) {
            lvl = Level::Info;
        }
        Logger::instance().set_level(lvl);
    }

} // namespace aob::examples
