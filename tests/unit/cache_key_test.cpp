#include <gtest/gtest.h>
#include "engine/cache/cache_key.hpp"

using namespace quell::cache;

TEST(CacheKeyTest, SortsParametersByName) {
  std::map<std::string, std::string> params = {{"user_id", "42"}, {"limit", "20"}, {"cursor", "abc"}};
  EXPECT_EQ(MakeCacheKey("posts", "feed", params), "posts:feed:cursor:abc|limit:20|user_id:42");
}

TEST(CacheKeyTest, NoParametersKeepsTrailingSeparator) {
  EXPECT_EQ(MakeCacheKey("stories", "active"), "stories:active:");
}

TEST(CacheKeyTest, JsonParametersMatchStringForm) {
  nlohmann::json params = {{"user_id", "42"}, {"limit", 20}, {"include_reels", true}};
  EXPECT_EQ(MakeCacheKey("posts", "feed", params), "posts:feed:include_reels:true|limit:20|user_id:42");

  std::map<std::string, std::string> same = {{"limit", "20"}, {"user_id", "42"}, {"include_reels", "true"}};
  EXPECT_EQ(MakeCacheKey("posts", "feed", params), MakeCacheKey("posts", "feed", same));
}

TEST(CacheKeyTest, NonObjectJsonMeansNoParameters) {
  EXPECT_EQ(MakeCacheKey("reels", "trending", nlohmann::json::array()), "reels:trending:");
}

TEST(CacheKeyTest, PrefixCoversEveryKeyOfResource) {
  std::string prefix = MakeCachePrefix("posts");
  EXPECT_EQ(prefix, "posts:");
  std::string key = MakeCacheKey("posts", "by_id", std::map<std::string, std::string>{{"id", "7"}});
  EXPECT_EQ(key.compare(0, prefix.size(), prefix), 0);
  EXPECT_NE(MakeCacheKey("postsarchive", "all").compare(0, prefix.size(), prefix), 0);
}
