#pragma once

#include "router.hpp"
#include "stream.hpp"

#include <netcore/netcore>
#include <nghttp2/nghttp2.h>

namespace duplex::server {
    struct session_options {
        std::size_t buffer_size = 8192;
        std::uint32_t max_concurrent_streams = 100;
    };

    auto submit_reset(
        nghttp2_session* handle,
        std::int32_t stream_id,
        std::uint32_t error_code
    ) -> void;

    class session {
        friend struct fmt::formatter<session>;

        stream streams;
        nghttp2_session* handle = nullptr;
        netcore::ssl::buffered_socket socket;
        const server::router* router = nullptr;
        std::uint32_t max_concurrent_streams = 0;
        ext::counter tasks;
        ext::continuation<> pending;
        bool wanted = false;
        bool closing = false;

        auto exchange(stream& stream) -> void;

        auto notify() noexcept -> void;

        auto recv() -> ext::task<>;

        auto respond(stream& stream) -> void;

        auto submit_settings() -> void;

        auto write_frames() -> ext::jtask<>;
    public:
        session(
            netcore::ssl::socket&& socket,
            const server::router& router,
            const session_options& options
        );

        session(const session&) = delete;

        session(session&&) = delete;

        ~session();

        auto operator=(const session&) -> session& = delete;

        auto operator=(session&&) -> session& = delete;

        auto handle_connection() -> ext::task<>;

        auto handle_request(stream& stream) -> ext::detached_task;

        auto make_stream(std::int32_t id) -> stream&;
    };
}

template <>
struct fmt::formatter<duplex::server::session> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const duplex::server::session& session, FormatContext& ctx) const {
        auto buffer = memory_buffer();
        auto out = std::back_inserter(buffer);

        format_to(out, "HTTP/2 Session ({})", ptr(session.handle));

        return formatter<std::string_view>::format(
            {buffer.data(), buffer.size()},
            ctx
        );
    }
};
