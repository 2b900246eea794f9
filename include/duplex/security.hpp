#pragma once

#include <fmt/format.h>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace duplex {
    constexpr auto application_protocol = std::string_view("h2");

    enum class verification {
        strict,
        accept_any
    };

    struct security_config {
        verification verify = verification::strict;
        std::vector<std::string> protocols = {
            std::string(application_protocol)
        };
        std::optional<std::string> trust_anchor;

        auto validate() const -> void;

        auto offers(std::string_view protocol) const noexcept -> bool;
    };

    auto make_client_security(
        verification verify = verification::accept_any
    ) -> security_config;
}

template <>
struct fmt::formatter<duplex::verification> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(duplex::verification verify, FormatContext& ctx) const {
        return formatter<std::string_view>::format(
            verify == duplex::verification::strict ? "strict" : "accept-any",
            ctx
        );
    }
};
