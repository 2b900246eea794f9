#pragma once

#include <string>
#include <string_view>
#include <unordered_map>

namespace duplex::server {
    struct request {
        std::string method;
        std::string path;
        std::string query;
        std::string scheme;
        std::string authority;
        std::string_view version = "HTTP/2";
        std::unordered_map<std::string, std::string> headers;

        auto resolved() const noexcept -> bool {
            return !method.empty() && !path.empty();
        }
    };
}
