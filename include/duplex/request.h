#pragma once

#include "connection.hpp"
#include "response.h"
#include "security.hpp"

#include <cstdint>
#include <timber/timber>

namespace duplex {
    class request {
        friend struct fmt::formatter<request>;

        static auto write_string(
            char* ptr,
            std::size_t size,
            std::size_t nmemb,
            void* userdata
        ) noexcept -> std::size_t;

        CURL* handle;
        curl_slist* resolved = nullptr;
        std::string body;

        template <typename T>
        auto set(CURLoption option, T t) -> void {
            const auto result = curl_easy_setopt(handle, option, t);

            if (result != CURLE_OK) {
                throw client_error(
                    "failed to set curl option ({}): {}",
                    static_cast<int>(option),
                    curl_easy_strerror(result)
                );
            }
        }

        auto pre_perform() -> void;

        auto post_perform(
            CURLcode code,
            std::exception_ptr exception
        ) -> response;
    public:
        std::string_view method = "GET";
        std::string url;

        request();

        request(const request&) = delete;

        request(request&& other);

        ~request();

        auto operator=(const request&) -> request& = delete;

        auto operator=(request&& other) -> request&;

        auto resolve_to(
            std::string_view host,
            std::uint16_t port,
            std::string_view address
        ) -> void;

        auto security(const security_config& config) -> void;

        auto perform(connection& connection) -> ext::task<response>;
    };
}

template <>
struct fmt::formatter<duplex::request> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const duplex::request& request, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "request ({})", ptr(request.handle));
    }
};
