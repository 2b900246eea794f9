#pragma once

#include "identity.hpp"
#include "router.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>

namespace duplex::server {
    struct config {
        std::string host = "127.0.0.1";
        std::uint16_t port = 4433;

        std::string hostname = "localhost";

        std::size_t buffer_size = 8192;
        std::uint32_t max_concurrent_streams = 100;

        std::optional<std::filesystem::path> certificate;
        std::optional<std::filesystem::path> key;

        route_table routes = default_routes();

        static auto read(const std::filesystem::path& path) -> config;

        auto make_identity() const -> identity;

        auto validate() const -> void;
    };

    auto from_json(const nlohmann::json& json, config& config) -> void;
}
