#include <gtest/gtest.h>
#include "engine/common/util.hpp"

using namespace quell::engine::common;

TEST(UtilTest, ParsesRealtimeUrl) {
  auto url = ParseUrl("wss://abc.supabase.co/realtime/v1/websocket?apikey=k&vsn=1.0.0");
  EXPECT_EQ(url.scheme, "wss");
  EXPECT_EQ(url.host, "abc.supabase.co");
  EXPECT_EQ(url.port, "443");
  EXPECT_EQ(url.path, "/realtime/v1/websocket?apikey=k&vsn=1.0.0");
  EXPECT_TRUE(url.IsSecure());
}

TEST(UtilTest, ExplicitPortAndDefaults) {
  auto url = ParseUrl("HTTP://localhost:8079");
  EXPECT_EQ(url.scheme, "http");
  EXPECT_EQ(url.host, "localhost");
  EXPECT_EQ(url.port, "8079");
  EXPECT_EQ(url.path, "/");
  EXPECT_FALSE(url.IsSecure());

  auto bare = ParseUrl("cache.upstash.io?x=1");
  EXPECT_EQ(bare.scheme, "https");
  EXPECT_EQ(bare.port, "443");
  EXPECT_EQ(bare.path, "/?x=1");
}

TEST(UtilTest, UrlEncodeKeepsUnreserved) {
  EXPECT_EQ(UrlEncode("abc-_.~123"), "abc-_.~123");
  EXPECT_EQ(UrlEncode("a b/c"), "a%20b%2Fc");
  EXPECT_EQ(UrlEncode("k=v&x"), "k%3Dv%26x");
}
