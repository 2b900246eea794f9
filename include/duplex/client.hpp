#pragma once

#include "request.h"

#include <array>
#include <span>
#include <vector>

namespace duplex {
    struct endpoint {
        std::string host = "localhost";
        std::string address = "127.0.0.1";
        std::uint16_t port = 4433;

        auto url(std::string_view path) const -> std::string;
    };

    constexpr auto default_paths = std::array<std::string_view, 4> {
        "/",
        "/test",
        "/health",
        "/unknown"
    };

    class client final {
        const endpoint target;
        const security_config security;
        duplex::connection* const connection;
    public:
        client(
            endpoint target,
            security_config security,
            duplex::connection& connection
        );

        auto get(std::string_view path) const -> ext::task<response>;

        auto run(std::span<const std::string_view> paths = default_paths)
            const -> ext::task<std::vector<response>>;
    };
}
