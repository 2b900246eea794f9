#pragma once

#include <map>
#include <string>
#include <string_view>

namespace duplex::server {
    constexpr auto not_found_body = std::string_view("404 Not Found");

    using route_table = std::map<std::string, std::string, std::less<>>;

    auto default_routes() -> route_table;

    class router {
        route_table routes;
    public:
        router();

        explicit router(route_table&& routes);

        auto find(std::string_view path) const noexcept -> std::string_view;

        auto size() const noexcept -> std::size_t;
    };
}
