#pragma once

#include <curl/curl.h>
#include <fmt/format.h>
#include <optional>
#include <string>
#include <string_view>

namespace duplex {
    auto http_version_name(long version) noexcept -> std::string_view;

    struct status {
        long code = 0;

        status() = default;

        status(long code);

        operator long() const noexcept;

        auto ok() const noexcept -> bool;
    };

    class response {
        duplex::status code;
        std::optional<std::string> type;
        std::string body;
        long http_version = CURL_HTTP_VERSION_NONE;
        long connects = 0;
    public:
        response(CURL* handle, std::string&& body);

        auto content_type() const noexcept
            -> std::optional<std::string_view>;

        auto data() const& noexcept -> std::string_view;

        auto data() && noexcept -> std::string;

        auto multiplexed() const noexcept -> bool;

        auto new_connections() const noexcept -> long;

        auto ok() const noexcept -> bool;

        auto status() const noexcept -> duplex::status;

        auto version() const noexcept -> std::string_view;
    };
}

template <>
struct fmt::formatter<duplex::status> : formatter<long> {
    template <typename FormatContext>
    auto format(const duplex::status& status, FormatContext& ctx) const {
        return formatter<long>::format(status.code, ctx);
    }
};
