#include <gtest/gtest.h>
#include "engine/common/config_manager.hpp"
#include "engine/realtime/change_event.hpp"
#include "engine/realtime/supabase_realtime_feed.hpp"
#include "manual_scheduler.hpp"

using namespace quell::realtime;
using quell::engine::common::ConfigManager;
using quell::test::ManualScheduler;

TEST(SupabaseRealtimeFeedTest, TopicPerSubscription) {
  SubscriptionSpec spec;
  spec.table = "posts";
  EXPECT_EQ(SupabaseRealtimeFeed::TopicFor(3, spec), "realtime:posts-3");
  EXPECT_NE(SupabaseRealtimeFeed::TopicFor(3, spec), SupabaseRealtimeFeed::TopicFor(4, spec));
}

TEST(SupabaseRealtimeFeedTest, JoinMessageCarriesPostgresChanges) {
  SubscriptionSpec spec;
  spec.table = "comments";
  spec.filter = "post_id=eq.9";
  spec.event_kind = EventKind::INSERT;

  auto msg = SupabaseRealtimeFeed::BuildJoinMessage("realtime:comments-1", spec, "public", "key", "5");
  EXPECT_EQ(msg["topic"], "realtime:comments-1");
  EXPECT_EQ(msg["event"], "phx_join");
  EXPECT_EQ(msg["ref"], "5");
  EXPECT_EQ(msg["join_ref"], "5");
  EXPECT_EQ(msg["payload"]["access_token"], "key");

  const auto& changes = msg["payload"]["config"]["postgres_changes"];
  ASSERT_EQ(changes.size(), 1u);
  EXPECT_EQ(changes[0]["event"], "INSERT");
  EXPECT_EQ(changes[0]["schema"], "public");
  EXPECT_EQ(changes[0]["table"], "comments");
  EXPECT_EQ(changes[0]["filter"], "post_id=eq.9");
}

TEST(SupabaseRealtimeFeedTest, JoinWithoutFilterOrTokenOmitsThem) {
  SubscriptionSpec spec;
  spec.table = "likes";

  auto msg = SupabaseRealtimeFeed::BuildJoinMessage("realtime:likes-2", spec, "public", "", "1");
  EXPECT_FALSE(msg["payload"].contains("access_token"));
  const auto& change = msg["payload"]["config"]["postgres_changes"][0];
  EXPECT_EQ(change["event"], "*");
  EXPECT_FALSE(change.contains("filter"));
}

TEST(SupabaseRealtimeFeedTest, LeaveAndHeartbeat) {
  auto leave = SupabaseRealtimeFeed::BuildLeaveMessage("realtime:likes-2", "8");
  EXPECT_EQ(leave["event"], "phx_leave");
  EXPECT_EQ(leave["topic"], "realtime:likes-2");

  auto heartbeat = SupabaseRealtimeFeed::BuildHeartbeatMessage("9");
  EXPECT_EQ(heartbeat["topic"], "phoenix");
  EXPECT_EQ(heartbeat["event"], "heartbeat");
  EXPECT_EQ(heartbeat["ref"], "9");
}

TEST(SupabaseRealtimeFeedTest, TranslatesPostgresChangeIntoChangePayload) {
  nlohmann::json payload = {
    {"ids", {1}},
    {"data", {
      {"type", "UPDATE"},
      {"schema", "public"},
      {"table", "profiles"},
      {"record", {{"id", 5}, {"username", "new"}}},
      {"old_record", {{"id", 5}}},
      {"commit_timestamp", "2024-05-01T10:00:00Z"}
    }}
  };

  nlohmann::json raw;
  ASSERT_TRUE(SupabaseRealtimeFeed::TranslatePostgresChange(payload, &raw));

  ChangeEvent event;
  std::string error;
  ASSERT_TRUE(ParseChangeEvent(raw, &event, &error)) << error;
  const auto& update = std::get<UpdateEvent>(event);
  EXPECT_EQ(update.table, "profiles");
  EXPECT_EQ(update.new_row["username"], "new");
  EXPECT_EQ(update.old_row["id"], 5);
  EXPECT_EQ(update.commit_timestamp, "2024-05-01T10:00:00Z");
}

TEST(SupabaseRealtimeFeedTest, TranslateNeedsData) {
  nlohmann::json raw = "untouched";
  EXPECT_FALSE(SupabaseRealtimeFeed::TranslatePostgresChange({{"status", "ok"}}, &raw));
  EXPECT_EQ(raw, "untouched");
}

TEST(SupabaseRealtimeFeedTest, RefusesSubscriptionsWhileDisconnectedWithoutUrl) {
  ConfigManager config;
  ManualScheduler scheduler;
  SupabaseRealtimeFeed feed(config, scheduler);
  EXPECT_FALSE(feed.IsConnected());
  EXPECT_FALSE(feed.Connect());  // No URL configured
}
