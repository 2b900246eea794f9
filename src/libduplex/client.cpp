#include <duplex/client.hpp>

namespace duplex {
    auto endpoint::url(std::string_view path) const -> std::string {
        return fmt::format("https://{}:{}{}", host, port, path);
    }

    client::client(
        endpoint target,
        security_config security,
        duplex::connection& connection
    ) :
        target(std::move(target)),
        security(std::move(security)),
        connection(&connection)
    {
        this->security.validate();
    }

    auto client::get(std::string_view path) const -> ext::task<response> {
        auto req = request();

        req.method = "GET";
        req.url = target.url(path);
        req.resolve_to(target.host, target.port, target.address);
        req.security(security);

        co_return co_await req.perform(*connection);
    }

    auto client::run(std::span<const std::string_view> paths) const
        -> ext::task<std::vector<response>> {
        auto responses = std::vector<response>();
        responses.reserve(paths.size());

        fmt::print(
            "Connecting to server at {}:{}...\n",
            target.address,
            target.port
        );

        for (const auto path : paths) {
            fmt::print("\n--- Requesting {} ---\n", path);

            auto res = co_await get(path);

            fmt::print("Status: {}\n", res.status());
            fmt::print("Body: {}\n", res.data());

            responses.push_back(std::move(res));
        }

        co_return responses;
    }
}
