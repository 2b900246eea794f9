#include <duplex/connection.hpp>
#include <duplex/response.h>
#include <duplex/security.hpp>

#include <cstdint>
#include <fmt/chrono.h>
#include <sys/epoll.h>
#include <timber/timber>

using std::chrono::milliseconds;

namespace {
    auto epoll_events(int what) noexcept -> std::uint32_t {
        switch (what) {
            case CURL_POLL_IN: return EPOLLIN;
            case CURL_POLL_OUT: return EPOLLOUT;
            case CURL_POLL_INOUT: return EPOLLIN | EPOLLOUT;
            default: return 0;
        }
    }

    auto curl_events(std::uint32_t ready, std::uint32_t wanted) noexcept
        -> int {
        const auto events = ready & wanted;
        auto result = 0;

        if (events & EPOLLIN) result |= CURL_CSELECT_IN;
        if (events & EPOLLOUT) result |= CURL_CSELECT_OUT;

        return result;
    }

    template <typename T>
    auto info(CURL* easy, CURLINFO what) noexcept -> T {
        T result {};
        curl_easy_getinfo(easy, what, &result);
        return result;
    }
}

namespace duplex {
    connection::watch::watch(curl_socket_t fd) :
        event(netcore::runtime::event::create(fd, EPOLLIN | EPOLLOUT))
    {}

    auto connection::watch::fd() const noexcept -> curl_socket_t {
        return event->fd();
    }

    auto connection::watch::poll(int what) noexcept -> bool {
        if (what == CURL_POLL_REMOVE) {
            stop();
            return true;
        }

        const auto events = epoll_events(what);

        if (events == 0) {
            TIMBER_ERROR("Socket ({}) unexpected curl poll value {}", fd(), what);
            return false;
        }

        event->events = events;
        return true;
    }

    auto connection::watch::ready() -> ext::task<int> {
        const std::uint32_t events = co_await event->out();
        co_return curl_events(events, event->events);
    }

    auto connection::watch::stop() const noexcept -> void {
        if (const auto error = event->remove()) {
            TIMBER_ERROR(
                "Socket ({}) could not leave the runtime: {}",
                fd(),
                error.message()
            );
        }

        event->cancel();
    }

    auto connection::on_socket(
        CURL* easy,
        curl_socket_t fd,
        int what,
        void* userp,
        void* socketp
    ) -> int {
        if (socketp) return static_cast<watch*>(socketp)->poll(what) ? 0 : -1;

        auto& self = *static_cast<connection*>(userp);
        auto ok = false;

        self.watch_socket(watch(fd), what, ok);
        return ok ? 0 : -1;
    }

    auto connection::on_timer(CURLM* multi, long timeout_ms, void* userp)
        -> int {
        static_cast<connection*>(userp)->schedule(timeout_ms);
        return 0;
    }

    connection::connection() :
        multi(curl_multi_init()),
        timer(netcore::timer::monotonic()),
        timeouts(wait_timeouts())
    {
        if (!multi) throw client_error("failed to create curl multi handle");

        option(CURLMOPT_SOCKETFUNCTION, on_socket);
        option(CURLMOPT_SOCKETDATA, this);
        option(CURLMOPT_TIMERFUNCTION, on_timer);
        option(CURLMOPT_TIMERDATA, this);

        option(CURLMOPT_PIPELINING, CURLPIPE_MULTIPLEX);
        option(CURLMOPT_MAX_HOST_CONNECTIONS, 1L);
    }

    connection::~connection() {
        if (in_flight > 0) {
            TIMBER_WARNING(
                "{} closed with {:L} transfer{} in flight",
                *this,
                in_flight,
                in_flight == 1 ? "" : "s"
            );
        }

        if (const auto code = curl_multi_cleanup(multi); code != CURLM_OK) {
            TIMBER_ERROR(
                "{} cleanup failed: {}",
                *this,
                curl_multi_strerror(code)
            );
        }

        TIMBER_DEBUG(
            "{} closed: {:L} streams over {:L} connection{}, {:L} failed",
            *this,
            totals.streams,
            totals.connects,
            totals.connects == 1 ? "" : "s",
            totals.failures
        );
    }

    auto connection::active() const noexcept -> std::size_t {
        return in_flight;
    }

    auto connection::drive(curl_socket_t fd, int events) -> void {
        auto running = 0;

        const auto code =
            curl_multi_socket_action(multi, fd, events, &running);

        if (code != CURLM_OK) throw client_error(
            "{} socket action failed: {}",
            *this,
            curl_multi_strerror(code)
        );

        auto queued = 0;

        while (auto* const message = curl_multi_info_read(multi, &queued)) {
            if (message->msg != CURLMSG_DONE) continue;
            finish(message->easy_handle, message->data.result);
        }
    }

    auto connection::finish(CURL* easy, CURLcode code) -> void {
        auto* const state = reinterpret_cast<transfer*>(
            info<char*>(easy, CURLINFO_PRIVATE)
        );

        if (const auto rc = curl_multi_remove_handle(multi, easy)) {
            TIMBER_ERROR(
                "{} failed to release transfer ({}): {}",
                *this,
                fmt::ptr(easy),
                curl_multi_strerror(rc)
            );
        }

        --in_flight;
        record(easy, code);

        if (!state) throw client_error(
            "transfer ({}) was not started by {}",
            fmt::ptr(easy),
            *this
        );

        state->done.resume(code);
    }

    auto connection::perform(CURL* easy) -> ext::task<CURLcode> {
        auto state = transfer();

        if (const auto rc = curl_easy_setopt(easy, CURLOPT_PRIVATE, &state)) {
            throw client_error(
                "failed to tag transfer: {}",
                curl_easy_strerror(rc)
            );
        }

        if (const auto rc = curl_multi_add_handle(multi, easy)) {
            throw client_error(
                "failed to add transfer to {}: {}",
                *this,
                curl_multi_strerror(rc)
            );
        }

        ++in_flight;

        const auto code = co_await state.done;
        const auto version = info<long>(easy, CURLINFO_HTTP_VERSION);

        if (code == CURLE_OK && version != CURL_HTTP_VERSION_2_0) {
            throw protocol_error(
                "{} did not negotiate {} (got {})",
                *this,
                application_protocol,
                http_version_name(version)
            );
        }

        co_return code;
    }

    auto connection::record(CURL* easy, CURLcode code) -> void {
        ++totals.streams;

        const auto connects = info<long>(easy, CURLINFO_NUM_CONNECTS);
        if (connects > 0) totals.connects += connects;

        if (code != CURLE_OK) {
            ++totals.failures;
            TIMBER_DEBUG(
                "{} stream failed: {}",
                *this,
                curl_easy_strerror(code)
            );
            return;
        }

        if (connects <= 0) return;

        const auto* const address = info<char*>(easy, CURLINFO_PRIMARY_IP);

        TIMBER_INFO(
            "{} connected to {}:{} using {}",
            *this,
            address ? address : "unknown",
            info<long>(easy, CURLINFO_PRIMARY_PORT),
            http_version_name(info<long>(easy, CURLINFO_HTTP_VERSION))
        );
    }

    auto connection::schedule(long timeout_ms) -> void {
        TIMBER_TRACE("{} timeout in {}", *this, milliseconds(timeout_ms));

        deadline.resume(timeout_ms);

        if (timeout_ms > 0) timer.set(milliseconds(timeout_ms));
        else if (timer.waiting()) timer.disarm();
    }

    auto connection::stats() const noexcept -> const connection_stats& {
        return totals;
    }

    auto connection::wait_timeouts() -> ext::jtask<> {
        while (true) {
            const auto timeout_ms = co_await deadline;

            if (timeout_ms < 0) continue;

            if (timeout_ms == 0) co_await netcore::yield();
            else if (!co_await timer.wait()) continue;

            drive(CURL_SOCKET_TIMEOUT);
        }
    }

    auto connection::watch_socket(watch socket, int what, bool& ok)
        -> ext::detached_task {
        const auto code = curl_multi_assign(multi, socket.fd(), &socket);

        if (code != CURLM_OK) {
            TIMBER_ERROR(
                "{} could not track socket ({}): {}",
                *this,
                socket.fd(),
                curl_multi_strerror(code)
            );
            co_return;
        }

        if (!(ok = socket.poll(what))) co_return;

        TIMBER_TRACE("{} watching socket ({})", *this, socket.fd());

        while (const auto events = co_await socket.ready()) {
            drive(socket.fd(), events);
        }

        TIMBER_TRACE("{} released socket ({})", *this, socket.fd());
    }
}
