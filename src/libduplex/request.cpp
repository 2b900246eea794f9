#include <duplex/request.h>

#include <memory>
#include <utility>

namespace duplex {
    request::request() : handle(curl_easy_init()) {
        if (!handle) throw client_error("Failed to create curl easy handle");
    }

    request::request(request&& other) :
        handle(std::exchange(other.handle, nullptr)),
        resolved(std::exchange(other.resolved, nullptr)),
        body(std::move(other.body)),
        method(std::exchange(other.method, "GET")),
        url(std::move(other.url))
    {}

    request::~request() {
        curl_easy_cleanup(handle);
        curl_slist_free_all(resolved);
    }

    auto request::operator=(request&& other) -> request& {
        if (std::addressof(other) != this) {
            std::destroy_at(this);
            std::construct_at(this, std::move(other));
        }

        return *this;
    }

    auto request::perform(connection& connection) -> ext::task<response> {
        TIMBER_TRACE(
            "{} starting nonblocking transfer using {}",
            *this,
            connection
        );

        TIMBER_TIMER(
            fmt::format("{} nonblocking transfer took", *this),
            timber::level::trace
        );

        pre_perform();

        CURLcode code = CURLE_OK;
        auto exception = std::exception_ptr();

        try {
            code = co_await connection.perform(handle);
        }
        catch (...) {
            exception = std::current_exception();
        }

        co_return post_perform(code, exception);
    }

    auto request::post_perform(
        CURLcode code,
        std::exception_ptr exception
    ) -> response {
        if (exception) std::rethrow_exception(exception);

        if (code != CURLE_OK) {
            throw client_error(
                "curl: ({}) {}",
                static_cast<int>(code),
                curl_easy_strerror(code)
            );
        }

        auto res = response(handle, std::exchange(body, {}));

        TIMBER_DEBUG("{} {} {} {}", res.status(), method, url, res.version());

        return res;
    }

    auto request::pre_perform() -> void {
        body.clear();

        set(CURLOPT_CUSTOMREQUEST, method.data());
        set(CURLOPT_URL, url.c_str());
        set(CURLOPT_HTTPGET, 1L);

        set(CURLOPT_WRITEFUNCTION, write_string);
        set(CURLOPT_WRITEDATA, &body);
    }

    auto request::resolve_to(
        std::string_view host,
        std::uint16_t port,
        std::string_view address
    ) -> void {
        const auto entry = fmt::format("{}:{}:{}", host, port, address);

        resolved = curl_slist_append(resolved, entry.c_str());
        set(CURLOPT_RESOLVE, resolved);
    }

    auto request::security(const security_config& config) -> void {
        config.validate();

        if (config.offers(application_protocol)) {
            set(CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);

            // Wait for the shared connection rather than opening another
            // while its handshake is still in progress.
            set(CURLOPT_PIPEWAIT, 1L);
        }
        else set(CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);

        switch (config.verify) {
            case verification::accept_any:
                set(CURLOPT_SSL_VERIFYPEER, 0L);
                set(CURLOPT_SSL_VERIFYHOST, 0L);
                break;
            case verification::strict:
                set(CURLOPT_SSL_VERIFYPEER, 1L);
                set(CURLOPT_SSL_VERIFYHOST, 2L);

                if (config.trust_anchor) {
                    auto blob = curl_blob {
                        .data = const_cast<char*>(config.trust_anchor->data()),
                        .len = config.trust_anchor->size(),
                        .flags = CURL_BLOB_COPY
                    };

                    set(CURLOPT_CAINFO_BLOB, &blob);
                }
                break;
        }
    }

    auto request::write_string(
        char* ptr,
        std::size_t size,
        std::size_t nmemb,
        void* userdata
    ) noexcept -> std::size_t {
        const auto real_size = size * nmemb;
        auto& string = *reinterpret_cast<std::string*>(userdata);

        string.append(ptr, real_size);

        return real_size;
    }
}
