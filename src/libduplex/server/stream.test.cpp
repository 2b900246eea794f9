#include <duplex/duplex>
#include <duplex/server/stream.hpp>

#include <gtest/gtest.h>

using duplex::server::exchange_state;
using duplex::server::stream;

TEST(Stream, ResolveRequest) {
    auto s = stream(1);

    EXPECT_EQ(exchange_state::resolving, s.state);
    EXPECT_FALSE(s.request.resolved());

    s.recv_header(":method", "GET");
    s.recv_header(":scheme", "https");
    s.recv_header(":authority", "localhost:4433");
    s.recv_header(":path", "/health");
    s.recv_header("user-agent", "test");

    EXPECT_TRUE(s.request.resolved());
    EXPECT_EQ("GET", s.request.method);
    EXPECT_EQ("https", s.request.scheme);
    EXPECT_EQ("localhost:4433", s.request.authority);
    EXPECT_EQ("/health", s.request.path);
    EXPECT_EQ("HTTP/2", s.request.version);
    EXPECT_TRUE(s.request.query.empty());
    EXPECT_EQ("test", s.request.headers.at("user-agent"));
}

TEST(Stream, QueryExcludedFromPath) {
    auto s = stream(3);

    s.recv_header(":method", "GET");
    s.recv_header(":path", "/test?a=1&b=2");

    EXPECT_EQ("/test", s.request.path);
    EXPECT_EQ("a=1&b=2", s.request.query);
}

TEST(Stream, MissingPath) {
    auto s = stream(5);

    s.recv_header(":method", "GET");

    EXPECT_FALSE(s.request.resolved());
}

TEST(Stream, MissingMethod) {
    auto s = stream(7);

    s.recv_header(":path", "/");

    EXPECT_FALSE(s.request.resolved());
}

TEST(Stream, Ring) {
    auto root = stream();

    EXPECT_EQ(0, root.size());

    root.link(*new stream(1));
    root.link(*new stream(3));

    auto* third = new stream(5);
    root.link(*third);

    EXPECT_EQ(3, root.size());

    delete third;
    EXPECT_EQ(2, root.size());

    root.delete_all();
    EXPECT_EQ(0, root.size());
}

TEST(Response, Send) {
    auto res = duplex::server::response();

    res.send("404 Not Found");

    EXPECT_EQ(200, res.status);
    EXPECT_EQ("404 Not Found", res.data);
    EXPECT_EQ("text/plain", res.headers.at("content-type"));
    EXPECT_EQ("13", res.headers.at("content-length"));
}
