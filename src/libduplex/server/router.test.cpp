#include <duplex/duplex>

#include <gtest/gtest.h>

using namespace std::literals;

using duplex::server::not_found_body;

class RouterTest : public testing::Test {
protected:
    const duplex::server::router router;
};

TEST_F(RouterTest, DefaultRoutes) {
    EXPECT_EQ(3, router.size());

    EXPECT_EQ("Hello from http2 server"sv, router.find("/"));
    EXPECT_EQ("Hello from http2 test endpoint"sv, router.find("/test"));
    EXPECT_EQ("hello from http2 health check"sv, router.find("/health"));
}

TEST_F(RouterTest, Miss) {
    EXPECT_EQ(not_found_body, router.find("/unknown"));
    EXPECT_EQ(not_found_body, router.find("/nonexistent"));
    EXPECT_EQ(not_found_body, router.find(""));
}

TEST_F(RouterTest, TrailingSlash) {
    EXPECT_EQ(not_found_body, router.find("/test/"));
    EXPECT_EQ(not_found_body, router.find("/health/"));
}

TEST_F(RouterTest, CaseSensitive) {
    EXPECT_EQ(not_found_body, router.find("/TEST"));
    EXPECT_EQ(not_found_body, router.find("/Health"));
}

TEST_F(RouterTest, NoPrefixMatch) {
    EXPECT_EQ(not_found_body, router.find("/tes"));
    EXPECT_EQ(not_found_body, router.find("/testing"));
    EXPECT_EQ(not_found_body, router.find("//"));
}

TEST(Router, CustomTable) {
    const auto router = duplex::server::router(duplex::server::route_table {
        {"/a", "alpha"},
        {"/b", "beta"}
    });

    EXPECT_EQ(2, router.size());
    EXPECT_EQ("alpha"sv, router.find("/a"));
    EXPECT_EQ("beta"sv, router.find("/b"));
    EXPECT_EQ(not_found_body, router.find("/"));
}
