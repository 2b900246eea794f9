#include <duplex/security.hpp>
#include <duplex/server/server.hpp>

#include <ext/scope>
#include <timber/timber>

namespace duplex::server {
    context::context(const server::config& config) :
        router(route_table(config.routes)),
        options {
            .buffer_size = config.buffer_size,
            .max_concurrent_streams = config.max_concurrent_streams
        }
    {}

    auto context::connection(netcore::ssl::socket&& client) -> ext::task<> {
        ++sessions;
        const auto deferred = ext::scope_exit([this] { --sessions; });

        try {
            co_await serve(std::forward<netcore::ssl::socket>(client));
        }
        catch (const std::exception& ex) {
            TIMBER_ERROR("Connection failed: {}", ex.what());
        }
        catch (...) {
            TIMBER_ERROR("Connection failed");
        }
    }

    auto context::serve(netcore::ssl::socket&& client) -> ext::task<> {
        const auto protocol = std::string(co_await client.accept());

        if (protocol != application_protocol) {
            TIMBER_WARNING(
                "Connection rejected: protocol {} not negotiated",
                application_protocol
            );
            co_return;
        }

        auto session = server::session(
            std::forward<netcore::ssl::socket>(client),
            router,
            options
        );

        TIMBER_DEBUG(
            "{} established ({} active session{})",
            session,
            sessions,
            sessions == 1 ? "" : "s"
        );

        co_await session.handle_connection();
    }

    auto context::shutdown() -> void {
        TIMBER_DEBUG(
            "Listener shutdown requested; {} session{} left to finish",
            sessions,
            sessions == 1 ? "" : "s"
        );
    }

    acceptor::acceptor(
        server::config&& config,
        const netcore::ssl::context& ssl
    ) :
        config(std::forward<server::config>(config)),
        handle(ssl, this->config)
    {
        this->config.validate();
    }

    auto acceptor::close() -> void {
        if (state != acceptor_state::listening) return;

        TIMBER_INFO("Closing listener on {}:{}", config.host, config.port);
        handle.close();
    }

    auto acceptor::listen() -> ext::task<> {
        state = acceptor_state::listening;
        const auto deferred = ext::scope_exit([this] {
            state = acceptor_state::closed;
        });

        co_await handle.listen(
            netcore::inet_socket {
                .host = config.host,
                .port = config.port
            },
            [this] {
                TIMBER_INFO(
                    "HTTP/2 server listening on {}:{}",
                    config.host,
                    config.port
                );
            }
        );
    }

    auto acceptor::status() const noexcept -> acceptor_state {
        return state;
    }
}
