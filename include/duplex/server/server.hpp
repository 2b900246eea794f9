#pragma once

#include "config.hpp"
#include "session.hpp"

#include <netcore/netcore>

namespace duplex::server {
    class context {
        server::router router;
        session_options options;
        std::size_t sessions = 0;

        auto serve(netcore::ssl::socket&& client) -> ext::task<>;
    public:
        explicit context(const server::config& config);

        auto connection(netcore::ssl::socket&& client) -> ext::task<>;

        auto shutdown() -> void;
    };

    using ssl_context = netcore::ssl::server<context>;
    using listener = netcore::server<ssl_context>;

    enum class acceptor_state {
        idle,
        listening,
        closed
    };

    class acceptor {
        const server::config config;
        listener handle;
        acceptor_state state = acceptor_state::idle;
    public:
        acceptor(server::config&& config, const netcore::ssl::context& ssl);

        auto close() -> void;

        auto listen() -> ext::task<>;

        auto status() const noexcept -> acceptor_state;
    };
}
