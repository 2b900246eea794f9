#pragma once

#include <string_view>

namespace duplex {
    constexpr auto log_level_variable = std::string_view("DUPLEX_LOG_LEVEL");

    auto configure_logging() -> void;
}
