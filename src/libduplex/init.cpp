#include <duplex/error.h>
#include <duplex/init.h>

#include <curl/curl.h>
#include <timber/timber>

namespace duplex {
    init::init() {
        const auto code = curl_global_init(CURL_GLOBAL_ALL);

        if (code != CURLE_OK) {
            throw client_error(
                "curl failed to initialize: ({}) {}",
                static_cast<int>(code),
                curl_easy_strerror(code)
            );
        }

        TIMBER_TRACE("curl initialized: {}", curl_version());
    }

    init::~init() {
        curl_global_cleanup();
    }
}
