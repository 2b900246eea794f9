#include <duplex/duplex>

#include <cstdlib>
#include <fmt/format.h>

namespace {
    auto read_config(int argc, char** argv) -> duplex::server::config {
        if (argc > 2) throw duplex::config_error("usage: duplexd [config]");
        if (argc == 2) return duplex::server::config::read(argv[1]);

        return {};
    }

    auto serve(duplex::server::config&& config) -> void {
        const auto identity = config.make_identity();
        const auto ssl = duplex::server::make_server_ssl(identity);

        auto acceptor = duplex::server::acceptor(std::move(config), ssl);

        netcore::run(acceptor.listen());
    }
}

auto main(int argc, char** argv) -> int {
    try {
        duplex::configure_logging();
        serve(read_config(argc, argv));
    }
    catch (const std::exception& ex) {
        fmt::print(stderr, "duplexd: {}\n", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
