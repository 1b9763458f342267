#include <gtest/gtest.h>
#include "Url.hpp"

TEST(UrlTest, ParsesSchemeHostPortAndTarget)
{
    auto url = Url::parse("http://rail.example.com:8443/gtfs-rt/vehicles?agency=1");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->scheme, "http");
    EXPECT_EQ(url->host, "rail.example.com");
    EXPECT_EQ(url->port, "8443");
    EXPECT_EQ(url->target, "/gtfs-rt/vehicles?agency=1");
    EXPECT_FALSE(url->secure());
}

TEST(UrlTest, DefaultsPortAndPath)
{
    auto url = Url::parse("https://bus.example.com");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->port, "443");
    EXPECT_EQ(url->target, "/");
    EXPECT_TRUE(url->secure());
    EXPECT_EQ(url->str(), "https://bus.example.com/");
}

TEST(UrlTest, RejectsUnsupportedInput)
{
    EXPECT_FALSE(Url::parse("ftp://example.com/file").has_value());
    EXPECT_FALSE(Url::parse("not a url").has_value());
    EXPECT_FALSE(Url::parse("http://:80/").has_value());
    EXPECT_FALSE(Url::parse("http://host:abc/").has_value());
}

TEST(UrlTest, PercentEncodeKeepsOnlyUnreserved)
{
    EXPECT_EQ(percentEncode("safe-chars_123.~"), "safe-chars_123.~");
    EXPECT_EQ(percentEncode("http://a.b:8080/x?y=1&z=2"), "http%3A%2F%2Fa.b%3A8080%2Fx%3Fy%3D1%26z%3D2");
    EXPECT_EQ(percentEncode("a b"), "a%20b");
}

TEST(UrlTest, QueryParametersAreDecoded)
{
    auto params = parseQuery("/api/geofence?lat=33.7545&lng=-84.4025&note=a%20b+c&flag");
    EXPECT_EQ(params["lat"], "33.7545");
    EXPECT_EQ(params["lng"], "-84.4025");
    EXPECT_EQ(params["note"], "a b c");
    EXPECT_EQ(params.count("flag"), 1u);
    EXPECT_TRUE(parseQuery("/api/vehicles").empty());
}
