#pragma once

#include <string>
#include <string_view>
#include <unordered_map>

namespace duplex::server {
    struct response {
        int status = 200;
        std::unordered_map<std::string, std::string> headers;
        std::string data;
        std::size_t written = 0;

        auto content_length(std::size_t length) -> void {
            headers.insert_or_assign("content-length", std::to_string(length));
        }

        auto content_type(std::string_view type) -> void {
            headers.insert_or_assign("content-type", std::string(type));
        }

        auto send(std::string_view text) -> void {
            content_type("text/plain");
            content_length(text.size());
            data = std::string(text);
        }
    };
}
