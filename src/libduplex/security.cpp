#include <duplex/error.h>
#include <duplex/security.hpp>

#include <algorithm>
#include <fmt/ranges.h>
#include <timber/timber>

using namespace std::literals;

namespace {
    constexpr auto http_1_1 = "http/1.1"sv;
}

namespace duplex {
    auto security_config::validate() const -> void {
        if (protocols.empty()) {
            throw config_error("No application protocol identifiers given");
        }

        for (const auto& protocol : protocols) {
            if (protocol != application_protocol && protocol != http_1_1) {
                throw config_error(
                    "Unsupported application protocol '{}'",
                    protocol
                );
            }
        }
    }

    auto security_config::offers(std::string_view protocol) const noexcept
        -> bool {
        return std::find(protocols.begin(), protocols.end(), protocol) !=
            protocols.end();
    }

    auto make_client_security(verification verify) -> security_config {
        auto config = security_config {
            .verify = verify
        };

        if (verify == verification::accept_any) {
            TIMBER_WARNING(
                "Server certificate verification is disabled; "
                "use for local development only"
            );
        }

        TIMBER_DEBUG(
            "Client security: verify {}, protocols [{}]",
            config.verify,
            fmt::join(config.protocols, ", ")
        );

        return config;
    }
}
