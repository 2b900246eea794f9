#pragma once

#include <fmt/core.h>
#include <stdexcept>

namespace duplex {
    class error : public std::runtime_error {
        static auto format_message(
            fmt::string_view format,
            fmt::format_args args
        ) -> std::string {
            return fmt::vformat(format, args);
        }
    public:
        error(std::string_view what) : runtime_error(std::string(what)) {}

        template <typename... T>
        error(fmt::format_string<T...> format, T&&... args) :
            runtime_error(format_message(
                format,
                fmt::make_format_args(args...)
            ))
        {}
    };

    struct client_error : error {
        using error::error;
    };

    struct protocol_error : error {
        using error::error;
    };

    struct identity_error : error {
        using error::error;
    };

    struct config_error : error {
        using error::error;
    };

    struct stream_aborted : std::exception {
        auto what() const noexcept -> const char* override {
            return "Stream aborted";
        }
    };
}
