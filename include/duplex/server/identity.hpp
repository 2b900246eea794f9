#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace duplex::server {
    using der = std::vector<std::byte>;

    struct identity {
        std::vector<der> chain;
        der key;

        auto certificate_pem() const -> std::string;

        auto key_pem() const -> std::string;
    };

    auto make_server_identity(std::string_view hostname = "localhost")
        -> identity;

    auto load_server_identity(
        const std::filesystem::path& certificate,
        const std::filesystem::path& key
    ) -> identity;
}
