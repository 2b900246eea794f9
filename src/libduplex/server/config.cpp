#include <duplex/error.h>
#include <duplex/server/config.hpp>

#include <cstdint>
#include <fstream>
#include <limits>
#include <timber/timber>

namespace fs = std::filesystem;

namespace {
    template <typename T>
    auto read_integer(const nlohmann::json& json, const char* key, T fallback)
        -> T {
        const auto it = json.find(key);
        if (it == json.end()) return fallback;

        if (!it->is_number_integer()) {
            throw duplex::config_error("'{}' must be an integer", key);
        }

        const auto value = it->get<std::int64_t>();

        if (
            value < 0 ||
            static_cast<std::uint64_t>(value) > std::numeric_limits<T>::max()
        ) {
            throw duplex::config_error("'{}' out of range: {}", key, value);
        }

        return static_cast<T>(value);
    }
}

namespace duplex::server {
    auto config::read(const fs::path& path) -> config {
        auto file = std::ifstream(path);
        if (!file) {
            throw config_error(R"(Failed to open config "{}")", path.native());
        }

        auto result = config();

        try {
            nlohmann::json::parse(file).get_to(result);
        }
        catch (const nlohmann::json::exception& ex) {
            throw config_error(
                R"(Invalid config "{}": {})",
                path.native(),
                ex.what()
            );
        }

        result.validate();

        TIMBER_DEBUG(R"(Read config "{}")", path.native());

        return result;
    }

    auto config::make_identity() const -> identity {
        if (certificate && key) {
            return load_server_identity(*certificate, *key);
        }

        return make_server_identity(hostname);
    }

    auto config::validate() const -> void {
        if (host.empty()) throw config_error("Listen host is empty");
        if (port == 0) throw config_error("Listen port must be nonzero");
        if (hostname.empty()) throw config_error("Host name is empty");
        if (buffer_size == 0) throw config_error("Buffer size is zero");

        if (max_concurrent_streams == 0) {
            throw config_error("Max concurrent streams must be nonzero");
        }

        if (certificate.has_value() != key.has_value()) {
            throw config_error(
                "TLS certificate and key must be configured together"
            );
        }

        for (const auto& [path, body] : routes) {
            if (path.empty() || path.front() != '/') {
                throw config_error("Route '{}' must start with '/'", path);
            }
        }
    }

    auto from_json(const nlohmann::json& json, config& config) -> void {
        if (const auto listen = json.find("listen"); listen != json.end()) {
            config.host = listen->value("host", config.host);
            config.port = read_integer(*listen, "port", config.port);
        }

        config.hostname = json.value("hostname", config.hostname);
        config.buffer_size =
            read_integer(json, "bufferSize", config.buffer_size);
        config.max_concurrent_streams = read_integer(
            json,
            "maxConcurrentStreams",
            config.max_concurrent_streams
        );

        if (const auto tls = json.find("tls"); tls != json.end()) {
            if (tls->contains("certificate")) {
                config.certificate =
                    tls->at("certificate").get<std::string>();
            }

            if (tls->contains("key")) {
                config.key = tls->at("key").get<std::string>();
            }
        }

        if (const auto routes = json.find("routes"); routes != json.end()) {
            config.routes.clear();

            for (const auto& [path, body] : routes->items()) {
                config.routes.emplace(path, body.get<std::string>());
            }
        }
    }
}
