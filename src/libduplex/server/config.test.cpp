#include <duplex/duplex>

#include <fstream>
#include <gtest/gtest.h>

using duplex::server::config;
using json = nlohmann::json;

namespace fs = std::filesystem;

TEST(Config, Defaults) {
    const auto conf = config();

    EXPECT_EQ("127.0.0.1", conf.host);
    EXPECT_EQ(4433, conf.port);
    EXPECT_EQ("localhost", conf.hostname);
    EXPECT_EQ(8192, conf.buffer_size);
    EXPECT_EQ(100, conf.max_concurrent_streams);
    EXPECT_FALSE(conf.certificate);
    EXPECT_FALSE(conf.key);
    EXPECT_EQ(duplex::server::default_routes(), conf.routes);

    EXPECT_NO_THROW(conf.validate());
}

TEST(Config, MissingKeysKeepDefaults) {
    const auto conf = json::parse(R"({"listen": {"port": 8443}})")
        .get<config>();

    EXPECT_EQ("127.0.0.1", conf.host);
    EXPECT_EQ(8443, conf.port);
    EXPECT_EQ(duplex::server::default_routes(), conf.routes);
}

TEST(Config, FromJson) {
    const auto conf = json::parse(R"({
        "listen": {"host": "0.0.0.0", "port": 9000},
        "hostname": "duplex.test",
        "bufferSize": 4096,
        "maxConcurrentStreams": 16,
        "tls": {"certificate": "/etc/duplex/cert.pem", "key": "/etc/duplex/key.pem"},
        "routes": {"/ping": "pong"}
    })").get<config>();

    EXPECT_EQ("0.0.0.0", conf.host);
    EXPECT_EQ(9000, conf.port);
    EXPECT_EQ("duplex.test", conf.hostname);
    EXPECT_EQ(4096, conf.buffer_size);
    EXPECT_EQ(16, conf.max_concurrent_streams);
    EXPECT_EQ(fs::path("/etc/duplex/cert.pem"), conf.certificate);
    EXPECT_EQ(fs::path("/etc/duplex/key.pem"), conf.key);

    ASSERT_EQ(1, conf.routes.size());
    EXPECT_EQ("pong", conf.routes.at("/ping"));
}

TEST(Config, PortOutOfRange) {
    EXPECT_THROW(
        json::parse(R"({"listen": {"port": 70000}})").get<config>(),
        duplex::config_error
    );

    EXPECT_THROW(
        json::parse(R"({"listen": {"port": -1}})").get<config>(),
        duplex::config_error
    );

    EXPECT_THROW(
        json::parse(R"({"listen": {"port": "4433"}})").get<config>(),
        duplex::config_error
    );

    const auto conf = json::parse(R"({"listen": {"port": 65535}})")
        .get<config>();
    EXPECT_EQ(65535, conf.port);
}

TEST(Config, StreamLimitOutOfRange) {
    EXPECT_THROW(
        json::parse(R"({"maxConcurrentStreams": 4294967296})").get<config>(),
        duplex::config_error
    );

    EXPECT_THROW(
        json::parse(R"({"bufferSize": -8192})").get<config>(),
        duplex::config_error
    );
}

TEST(Config, ReadFileWithInvalidPort) {
    const auto path = fs::temp_directory_path() / "duplex-config-port.json";

    {
        auto file = std::ofstream(path);
        file << R"({"listen": {"port": 70000}})";
    }

    EXPECT_THROW(config::read(path), duplex::config_error);
    fs::remove(path);
}

TEST(Config, Validate) {
    auto conf = config();
    conf.port = 0;
    EXPECT_THROW(conf.validate(), duplex::config_error);

    conf = config();
    conf.max_concurrent_streams = 0;
    EXPECT_THROW(conf.validate(), duplex::config_error);

    conf = config();
    conf.certificate = "/etc/duplex/cert.pem";
    EXPECT_THROW(conf.validate(), duplex::config_error);

    conf = config();
    conf.routes.emplace("relative", "body");
    EXPECT_THROW(conf.validate(), duplex::config_error);
}

TEST(Config, ReadFile) {
    const auto path = fs::temp_directory_path() / "duplex-config-test.json";

    {
        auto file = std::ofstream(path);
        file << R"({"hostname": "duplex.test", "routes": {"/": "root"}})";
    }

    const auto conf = config::read(path);
    fs::remove(path);

    EXPECT_EQ("duplex.test", conf.hostname);
    EXPECT_EQ("root", conf.routes.at("/"));
}

TEST(Config, ReadInvalidFile) {
    const auto path = fs::temp_directory_path() / "duplex-config-invalid.json";

    {
        auto file = std::ofstream(path);
        file << "{ not json";
    }

    EXPECT_THROW(config::read(path), duplex::config_error);
    fs::remove(path);
}

TEST(Config, ReadMissingFile) {
    EXPECT_THROW(
        config::read("/nonexistent/duplex.json"),
        duplex::config_error
    );
}
