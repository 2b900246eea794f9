#include <duplex/duplex>

#include <cstdlib>
#include <fmt/format.h>

namespace {
    auto request_defaults() -> void {
        const auto curl = duplex::init();

        auto connection = duplex::connection();
        const auto client = duplex::client(
            duplex::endpoint(),
            duplex::make_client_security(duplex::verification::accept_any),
            connection
        );

        netcore::run([&]() -> ext::task<> {
            co_await client.run();
        }());
    }
}

auto main() -> int {
    try {
        duplex::configure_logging();
        request_defaults();
    }
    catch (const std::exception& ex) {
        fmt::print(stderr, "duplex: {}\n", ex.what());
        return EXIT_FAILURE;
    }

    fmt::print("\nAll requests completed successfully!\n");
    return EXIT_SUCCESS;
}
