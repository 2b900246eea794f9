#pragma once

#include <duplex/error.h>

#include <curl/curl.h>
#include <ext/coroutine>
#include <netcore/netcore>

namespace duplex {
    struct connection_stats {
        std::size_t streams = 0;
        std::size_t connects = 0;
        std::size_t failures = 0;
    };

    class connection final {
        class watch {
            std::shared_ptr<netcore::runtime::event> event;
        public:
            explicit watch(curl_socket_t fd);

            auto fd() const noexcept -> curl_socket_t;

            [[nodiscard]]
            auto poll(int what) noexcept -> bool;

            auto ready() -> ext::task<int>;

            auto stop() const noexcept -> void;
        };

        struct transfer {
            ext::continuation<CURLcode> done;
        };

        friend struct fmt::formatter<connection>;

        static auto on_socket(
            CURL* easy,
            curl_socket_t fd,
            int what,
            void* userp,
            void* socketp
        ) -> int;

        static auto on_timer(CURLM* multi, long timeout_ms, void* userp)
            -> int;

        CURLM* multi;
        std::size_t in_flight = 0;
        connection_stats totals;
        netcore::timer timer;
        ext::continuation<long> deadline;
        ext::jtask<> timeouts;

        auto drive(curl_socket_t fd, int events = 0) -> void;

        auto finish(CURL* easy, CURLcode code) -> void;

        auto record(CURL* easy, CURLcode code) -> void;

        auto schedule(long timeout_ms) -> void;

        auto wait_timeouts() -> ext::jtask<>;

        auto watch_socket(watch socket, int what, bool& ok)
            -> ext::detached_task;

        template <typename T>
        auto option(CURLMoption opt, T value) -> void {
            const auto code = curl_multi_setopt(multi, opt, value);

            if (code != CURLM_OK) throw client_error(
                "failed to set curl multi option ({}): {}",
                static_cast<int>(opt),
                curl_multi_strerror(code)
            );
        }
    public:
        connection();

        connection(const connection&) = delete;

        connection(connection&&) = delete;

        ~connection();

        auto operator=(const connection&) -> connection& = delete;

        auto operator=(connection&&) -> connection& = delete;

        auto active() const noexcept -> std::size_t;

        auto perform(CURL* easy) -> ext::task<CURLcode>;

        auto stats() const noexcept -> const connection_stats&;
    };
}

template <>
struct fmt::formatter<duplex::connection> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const duplex::connection& conn, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "connection ({})", ptr(conn.multi));
    }
};
