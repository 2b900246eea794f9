#include <duplex/error.h>
#include <duplex/server/session.hpp>

#include <algorithm>
#include <array>
#include <timber/timber>
#include <vector>

using namespace std::literals;

namespace {
    using duplex::server::exchange_state;

    auto make_nv(
        std::string_view name,
        std::string_view value,
        std::uint8_t flags = NGHTTP2_NV_FLAG_NONE
    ) -> nghttp2_nv {
        return {
            .name = (std::uint8_t*) name.data(),
            .value = (std::uint8_t*) value.data(),
            .namelen = name.size(),
            .valuelen = value.size(),
            .flags = flags
        };
    }

    auto get_stream(nghttp2_session* handle, std::int32_t stream_id)
        -> duplex::server::stream* {
        return reinterpret_cast<duplex::server::stream*>(
            nghttp2_session_get_stream_user_data(handle, stream_id)
        );
    }

    auto data_source_read_callback(
        nghttp2_session* handle,
        std::int32_t stream_id,
        std::uint8_t* buf,
        std::size_t length,
        std::uint32_t* data_flags,
        nghttp2_data_source* source,
        void* user_data
    ) -> ssize_t {
        auto& stream = *reinterpret_cast<duplex::server::stream*>(source->ptr);
        auto& res = stream.response;

        const auto max = std::min(res.data.size() - res.written, length);
        const auto written = res.data.copy(
            reinterpret_cast<char*>(buf),
            max,
            res.written
        );

        res.written += written;

        if (res.written == res.data.size()) {
            *data_flags |= NGHTTP2_DATA_FLAG_EOF;
            stream.state = exchange_state::finished;

            TIMBER_TRACE("Stream ID {} finished", stream_id);
        }

        return static_cast<ssize_t>(written);
    }

    auto on_begin_headers_callback(
        nghttp2_session* handle,
        const nghttp2_frame* frame,
        void* user_data
    ) -> int {
        if (
            frame->hd.type != NGHTTP2_HEADERS ||
            frame->headers.cat != NGHTTP2_HCAT_REQUEST
        ) return 0;

        auto& session = *reinterpret_cast<duplex::server::session*>(user_data);
        auto& stream = session.make_stream(frame->hd.stream_id);

        nghttp2_session_set_stream_user_data(
            handle,
            frame->hd.stream_id,
            &stream
        );

        return 0;
    }

    auto on_data_chunk_recv_callback(
        nghttp2_session* handle,
        std::uint8_t flags,
        std::int32_t stream_id,
        const std::uint8_t* data,
        size_t len,
        void *user_data
    ) -> int {
        // Request bodies are not read; routing needs only the path.
        TIMBER_TRACE(
            "Stream ID {} discarded data chunk of {:L} bytes",
            stream_id,
            len
        );

        return 0;
    }

    auto on_header_callback(
        nghttp2_session* handle,
        const nghttp2_frame* frame,
        const std::uint8_t* name,
        std::size_t namelen,
        const std::uint8_t* value,
        std::size_t valuelen,
        std::uint8_t flags,
        void* user_data
    ) -> int {
        if (
            frame->hd.type != NGHTTP2_HEADERS ||
            frame->headers.cat != NGHTTP2_HCAT_REQUEST
        ) return 0;

        if (auto* stream = get_stream(handle, frame->hd.stream_id)) {
            stream->recv_header(
                std::string_view(
                    reinterpret_cast<const char*>(name),
                    namelen
                ),
                std::string_view(
                    reinterpret_cast<const char*>(value),
                    valuelen
                )
            );
        }

        return 0;
    }

    auto on_frame_recv_callback(
        nghttp2_session* handle,
        const nghttp2_frame* frame,
        void* user_data
    ) -> int {
        if (
            frame->hd.type != NGHTTP2_HEADERS ||
            frame->headers.cat != NGHTTP2_HCAT_REQUEST
        ) return 0;

        auto* const stream = get_stream(handle, frame->hd.stream_id);
        if (!stream) return 0;

        TIMBER_TRACE("Stream ID {} header frame complete", stream->id);

        auto& session = *reinterpret_cast<duplex::server::session*>(user_data);
        session.handle_request(*stream);

        return 0;
    }

    auto on_invalid_header_callback(
        nghttp2_session* session,
        const nghttp2_frame* frame,
        const std::uint8_t* name,
        std::size_t namelen,
        const std::uint8_t* value,
        std::size_t valuelen,
        std::uint8_t flags,
        void* user_data
    ) -> int {
        TIMBER_DEBUG(
            "Stream ID {} received invalid header ({}: {})",
            frame->hd.stream_id,
            std::string_view(
                reinterpret_cast<const char*>(name),
                namelen
            ),
            std::string_view(
                reinterpret_cast<const char*>(value),
                valuelen
            )
        );

        return 0;
    }

    auto on_stream_close(
        nghttp2_session* handle,
        std::int32_t stream_id,
        std::uint32_t error_code,
        void* user_data
    ) -> int {
        auto* const stream = get_stream(handle, stream_id);
        if (!stream) return 0;

        if (error_code != NGHTTP2_NO_ERROR) {
            TIMBER_DEBUG(
                "Stream ID {} reset by peer: {}",
                stream_id,
                nghttp2_http2_strerror(error_code)
            );
        }

        if (stream->active) stream->open = false;
        else delete stream;

        return 0;
    }
}

namespace duplex::server {
    auto submit_reset(
        nghttp2_session* handle,
        std::int32_t stream_id,
        std::uint32_t error_code
    ) -> void {
        const auto rv = nghttp2_submit_rst_stream(
            handle,
            NGHTTP2_FLAG_NONE,
            stream_id,
            error_code
        );

        if (rv != 0) {
            throw error(
                "Stream ID {} failed to submit reset: {}",
                stream_id,
                nghttp2_strerror(rv)
            );
        }
    }

    session::session(
        netcore::ssl::socket&& socket,
        const server::router& router,
        const session_options& options
    ) :
        socket(std::forward<netcore::ssl::socket>(socket), options.buffer_size),
        router(&router),
        max_concurrent_streams(options.max_concurrent_streams)
    {
        nghttp2_session_callbacks* callbacks = nullptr;

        if (const auto rv = nghttp2_session_callbacks_new(&callbacks)) {
            throw error("{}", nghttp2_strerror(rv));
        }

        nghttp2_session_callbacks_set_on_begin_headers_callback(
            callbacks,
            on_begin_headers_callback
        );

        nghttp2_session_callbacks_set_on_data_chunk_recv_callback(
            callbacks,
            on_data_chunk_recv_callback
        );

        nghttp2_session_callbacks_set_on_frame_recv_callback(
            callbacks,
            on_frame_recv_callback
        );

        nghttp2_session_callbacks_set_on_header_callback(
            callbacks,
            on_header_callback
        );

        nghttp2_session_callbacks_set_on_invalid_header_callback(
            callbacks,
            on_invalid_header_callback
        );

        nghttp2_session_callbacks_set_on_stream_close_callback(
            callbacks,
            on_stream_close
        );

        const auto rv = nghttp2_session_server_new(&handle, callbacks, this);
        nghttp2_session_callbacks_del(callbacks);

        if (rv != 0) throw error("{}", nghttp2_strerror(rv));

        TIMBER_TRACE("{} created for {}", *this, this->socket);
    }

    session::~session() {
        streams.delete_all();
        nghttp2_session_del(handle);

        TIMBER_TRACE("{} destroyed", *this);
    }

    auto session::exchange(stream& stream) -> void {
        if (!stream.open) throw stream_aborted();

        if (!stream.request.resolved()) {
            submit_reset(handle, stream.id, NGHTTP2_PROTOCOL_ERROR);
            notify();

            throw error(
                "Stream ID {} request is missing its method or path",
                stream.id
            );
        }

        TIMBER_DEBUG("{}", stream);
        TIMBER_INFO(
            "Got request for path: {}, protocol: {}",
            stream.request.path,
            stream.request.version
        );

        stream.state = exchange_state::routing;
        const auto body = router->find(stream.request.path);

        stream.state = exchange_state::responding;
        stream.response.send(body);

        respond(stream);
    }

    auto session::handle_connection() -> ext::task<> {
        submit_settings();

        auto writer = write_frames();

        try {
            co_await recv();
            TIMBER_DEBUG("{} closed by peer", *this);
        }
        catch (const netcore::eof&) {
            TIMBER_DEBUG("{} received unexpected EOF", *this);
        }
        catch (const std::exception& ex) {
            TIMBER_ERROR("{} transport error: {}", *this, ex.what());
        }

        co_await tasks.await();

        closing = true;
        notify();

        try {
            co_await writer;
        }
        catch (const std::exception& ex) {
            TIMBER_DEBUG("{} failed to write frames: {}", *this, ex.what());
        }
    }

    auto session::handle_request(stream& stream) -> ext::detached_task {
        const auto counter = tasks.increment();
        stream.active = true;

        // Leave nghttp2's callback before touching the session again.
        co_await netcore::yield();

        try {
            exchange(stream);
        }
        catch (const stream_aborted&) {
            stream.state = exchange_state::failed;
            TIMBER_DEBUG("Stream ID {} abandoned by peer", stream.id);
        }
        catch (const std::exception& ex) {
            stream.state = exchange_state::failed;
            TIMBER_ERROR("Stream ID {} exchange failed: {}", stream.id, ex.what());
        }
        catch (...) {
            stream.state = exchange_state::failed;
            TIMBER_ERROR("Stream ID {} exchange failed", stream.id);
        }

        stream.active = false;
        if (!stream.open) delete &stream;
    }

    auto session::make_stream(std::int32_t id) -> stream& {
        auto* stream = new server::stream(id);

        streams.link(*stream);

        return *stream;
    }

    auto session::notify() noexcept -> void {
        wanted = true;
        if (pending.awaiting()) pending.resume();
    }

    auto session::recv() -> ext::task<> {
        while (true) {
            const auto bytes = co_await socket.read();
            if (bytes.empty()) co_return;

            const auto rv = nghttp2_session_mem_recv(
                handle,
                reinterpret_cast<const std::uint8_t*>(bytes.data()),
                bytes.size()
            );

            if (rv < 0) throw error("{}", nghttp2_strerror(rv));

            // Always give the writer a chance after receiving so that
            // pending SETTINGS ACK and WINDOW_UPDATE frames go out.
            notify();

            if (
                !nghttp2_session_want_read(handle) &&
                !nghttp2_session_want_write(handle)
            ) co_return;
        }
    }

    auto session::respond(stream& stream) -> void {
        auto& res = stream.response;
        auto headers = std::vector<nghttp2_nv>();

        const auto status = fmt::to_string(res.status);
        headers.push_back(make_nv(":status", status));

        for (const auto& [name, value] : res.headers) {
            headers.push_back(make_nv(name, value));
        }

        auto provider = nghttp2_data_provider {
            .source = {
                .ptr = &stream,
            },
            .read_callback = data_source_read_callback
        };

        const auto rv = nghttp2_submit_response(
            handle,
            stream.id,
            headers.data(),
            headers.size(),
            &provider
        );

        if (rv != 0) {
            throw error(
                "Stream ID {} failed to submit response: {}",
                stream.id,
                nghttp2_strerror(rv)
            );
        }

        notify();
    }

    auto session::submit_settings() -> void {
        auto settings = std::array {
            nghttp2_settings_entry {
                NGHTTP2_SETTINGS_MAX_CONCURRENT_STREAMS,
                max_concurrent_streams
            }
        };

        const auto rv = nghttp2_submit_settings(
            handle,
            NGHTTP2_FLAG_NONE,
            settings.data(),
            settings.size()
        );

        if (rv != 0) throw error("{}", nghttp2_strerror(rv));
    }

    auto session::write_frames() -> ext::jtask<> {
        while (true) {
            wanted = false;

            const std::uint8_t* src = nullptr;

            while (const auto length = nghttp2_session_mem_send(handle, &src)) {
                if (length < 0) throw error("{}", nghttp2_strerror(length));
                co_await socket.write(src, length);
            }

            co_await socket.flush();

            if (closing) co_return;
            if (!wanted) co_await pending;
        }
    }
}
