#pragma once

#include "request.hpp"
#include "response.hpp"

#include <cstdint>
#include <fmt/format.h>

namespace duplex::server {
    enum class exchange_state {
        resolving,
        routing,
        responding,
        finished,
        failed
    };

    class stream {
        stream* next = this;
        stream* prev = this;

        auto unlink() noexcept -> void;
    public:
        const std::int32_t id;

        bool active = false;

        bool open = true;

        exchange_state state = exchange_state::resolving;

        server::request request;
        server::response response;

        stream();

        explicit stream(std::int32_t id);

        stream(const stream&) = delete;

        stream(stream&&) = delete;

        ~stream();

        auto operator=(const stream&) -> stream& = delete;

        auto operator=(stream&&) -> stream& = delete;

        auto delete_all() noexcept -> void;

        auto link(stream& other) noexcept -> void;

        auto recv_header(std::string_view name, std::string_view value) -> void;

        auto size() const noexcept -> std::size_t;
    };
}

template <>
struct fmt::formatter<duplex::server::exchange_state> :
    formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(duplex::server::exchange_state state, FormatContext& ctx) const {
        using enum duplex::server::exchange_state;

        auto name = std::string_view();

        switch (state) {
            case resolving: name = "resolving"; break;
            case routing: name = "routing"; break;
            case responding: name = "responding"; break;
            case finished: name = "finished"; break;
            case failed: name = "failed"; break;
        }

        return formatter<std::string_view>::format(name, ctx);
    }
};

template <>
struct fmt::formatter<duplex::server::stream> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const duplex::server::stream& stream, FormatContext& ctx) const {
        auto buffer = fmt::memory_buffer();
        auto out = std::back_inserter(buffer);

        format_to(
            out,
            "Stream ID: {}, Scheme: {}, Authority: {}\n{} {} {}",
            stream.id,
            stream.request.scheme,
            stream.request.authority,
            stream.request.method,
            stream.request.path,
            stream.request.version
        );

        if (!stream.request.query.empty()) {
            format_to(out, "\nQuery: {}", stream.request.query);
        }

        if (!stream.request.headers.empty()) {
            format_to(out, "\nHeaders ({}):", stream.request.headers.size());

            for (const auto& entry : stream.request.headers) {
                format_to(out, "\n\t{}: {}", entry.first, entry.second);
            }
        }

        return formatter<std::string_view>::format(
            {buffer.data(), buffer.size()},
            ctx
        );
    }
};
