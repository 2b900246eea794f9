#include <duplex/server/router.hpp>

#include <timber/timber>

namespace duplex::server {
    auto default_routes() -> route_table {
        return {
            {"/", "Hello from http2 server"},
            {"/test", "Hello from http2 test endpoint"},
            {"/health", "hello from http2 health check"}
        };
    }

    router::router() : router(default_routes()) {}

    router::router(route_table&& routes) :
        routes(std::forward<route_table>(routes))
    {
        for (const auto& [path, body] : this->routes) {
            TIMBER_TRACE("Route {} ({:L} bytes)", path, body.size());
        }
    }

    auto router::find(std::string_view path) const noexcept
        -> std::string_view {
        const auto result = routes.find(path);
        if (result == routes.end()) return not_found_body;
        return result->second;
    }

    auto router::size() const noexcept -> std::size_t {
        return routes.size();
    }
}
