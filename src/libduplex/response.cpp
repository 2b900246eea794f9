#include <duplex/response.h>

namespace {
    auto read_header(CURL* handle, const char* name)
        -> std::optional<std::string> {
        curl_header* header = nullptr;

        const auto code =
            curl_easy_header(handle, name, 0, CURLH_HEADER, -1, &header);

        if (code == CURLHE_OK) return std::string(header->value);

        return std::nullopt;
    }

    template <typename T>
    auto read_info(CURL* handle, CURLINFO info) noexcept -> T {
        T result = 0;
        curl_easy_getinfo(handle, info, &result);
        return result;
    }
}

namespace duplex {
    auto http_version_name(long version) noexcept -> std::string_view {
        switch (version) {
            case CURL_HTTP_VERSION_1_0: return "HTTP/1.0";
            case CURL_HTTP_VERSION_1_1: return "HTTP/1.1";
            case CURL_HTTP_VERSION_2_0: return "HTTP/2";
            case CURL_HTTP_VERSION_3: return "HTTP/3";
            default: return "unknown";
        }
    }

    status::status(long code) : code(code) {}

    status::operator long() const noexcept { return code; }

    auto status::ok() const noexcept -> bool {
        return code >= 200 && code <= 299;
    }

    response::response(CURL* handle, std::string&& body) :
        code(read_info<long>(handle, CURLINFO_RESPONSE_CODE)),
        type(read_header(handle, "content-type")),
        body(std::forward<std::string>(body)),
        http_version(read_info<long>(handle, CURLINFO_HTTP_VERSION)),
        connects(read_info<long>(handle, CURLINFO_NUM_CONNECTS))
    {}

    auto response::content_type() const noexcept
        -> std::optional<std::string_view> {
        if (type) return *type;
        return std::nullopt;
    }

    auto response::data() const& noexcept -> std::string_view { return body; }

    auto response::data() && noexcept -> std::string { return std::move(body); }

    auto response::multiplexed() const noexcept -> bool {
        return http_version == CURL_HTTP_VERSION_2_0;
    }

    auto response::new_connections() const noexcept -> long {
        return connects;
    }

    auto response::ok() const noexcept -> bool { return code.ok(); }

    auto response::status() const noexcept -> duplex::status { return code; }

    auto response::version() const noexcept -> std::string_view {
        return http_version_name(http_version);
    }
}
