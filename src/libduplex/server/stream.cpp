#include <duplex/server/stream.hpp>

#include <timber/timber>

using namespace std::literals;

namespace {
    namespace header {
        constexpr auto method = ":method"sv;
        constexpr auto path = ":path"sv;
        constexpr auto scheme = ":scheme"sv;
        constexpr auto authority = ":authority"sv;
    }
}

namespace duplex::server {
    stream::stream() : id(-1) {}

    stream::stream(std::int32_t id) : id(id) {
        TIMBER_TRACE("Stream ID {} opened", id);
    }

    stream::~stream() {
        unlink();

        if (id != -1) {
            TIMBER_TRACE("Stream ID {} closed ({})", id, state);
        }
    }

    auto stream::delete_all() noexcept -> void {
        auto* current = next;

        while (current != this) {
            auto* next = current->next;
            delete current;
            current = next;
        }
    }

    auto stream::link(stream& other) noexcept -> void {
        other.next = this;
        other.prev = prev;

        prev->next = &other;
        prev = &other;
    }

    auto stream::recv_header(
        std::string_view name,
        std::string_view value
    ) -> void {
        TIMBER_TRACE(
            "Stream ID {} received header '{}: {}'",
            id,
            name,
            value
        );

        if (name == header::method) request.method = value;
        else if (name == header::path) {
            const auto query = value.find('?');

            request.path = value.substr(0, query);
            if (query != std::string_view::npos) {
                request.query = value.substr(query + 1);
            }
        }
        else if (name == header::scheme) request.scheme = value;
        else if (name == header::authority) request.authority = value;
        else request.headers.insert_or_assign(
            std::string(name),
            std::string(value)
        );
    }

    auto stream::size() const noexcept -> std::size_t {
        std::size_t result = 0;

        for (
            const auto* current = next;
            current != this;
            current = current->next
        ) ++result;

        return result;
    }

    auto stream::unlink() noexcept -> void {
        next->prev = prev;
        prev->next = next;

        next = this;
        prev = this;
    }
}
