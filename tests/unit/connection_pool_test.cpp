#include <gtest/gtest.h>
#include "engine/aggregation/connection_pool.hpp"
#include "engine/realtime/mock_change_feed.hpp"
#include "manual_scheduler.hpp"

#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

using namespace quell::aggregation;
using namespace quell::realtime;
using quell::test::ManualScheduler;
using std::chrono::milliseconds;

class ConnectionPoolTest : public ::testing::Test {
 protected:
  void SetUp() override { MakePool(PoolOptions()); }

  void MakePool(PoolOptions options) {
    pool_ = std::make_shared<ConnectionPool>(scheduler_, feed_, batch_engine_, options, DefaultTierTable());
    pool_->SetErrorHook([this](const std::string& channel, const std::string& error) {
      errors_.emplace_back(channel, error);
    });
  }

  static SubscriptionSpec Spec(const std::string& table, PriorityTier tier = PriorityTier::MEDIUM,
                               const std::string& filter = "", EventKind kind = EventKind::ANY) {
    SubscriptionSpec spec;
    spec.table = table;
    spec.filter = filter;
    spec.event_kind = kind;
    spec.priority = tier;
    return spec;
  }

  // Listener that appends every delivery to out
  static ListenerCallback Collect(std::vector<Delivery>* out) {
    return [out](const Delivery& delivery) { out->push_back(delivery); };
  }

  size_t PublishInsert(const std::string& table, int id) {
    return feed_.Publish({{"eventType", "INSERT"}, {"table", table}, {"new", {{"id", id}}}});
  }

  ManualScheduler scheduler_;
  MockChangeFeed feed_;
  BatchEngine batch_engine_{scheduler_};
  std::vector<std::pair<std::string, std::string>> errors_;
  std::shared_ptr<ConnectionPool> pool_;
};

TEST_F(ConnectionPoolTest, SameTableAndFilterShareOneConnection) {
  std::vector<Delivery> first, second;
  SubscriptionHandle a = pool_->Acquire("home-a", Spec("posts"), Collect(&first));
  SubscriptionHandle b = pool_->Acquire("home-b", Spec("posts"), Collect(&second));

  ASSERT_TRUE(a);
  ASSERT_TRUE(b);
  EXPECT_TRUE(a.IsOwner());
  EXPECT_FALSE(b.IsOwner());
  EXPECT_EQ(a.GetConnectionId(), b.GetConnectionId());
  EXPECT_EQ(feed_.GetTotalSubscribeCalls(), 1u);
  EXPECT_EQ(pool_->GetLiveConnectionCount(), 1u);
  EXPECT_EQ(pool_->GetListenerCount(), 2u);

  auto metrics = pool_->GetMetrics();
  ASSERT_EQ(metrics.size(), 1u);
  EXPECT_EQ(metrics[0].ref_count, 2u);
  EXPECT_EQ(metrics[0].pool_key, "posts:all");

  EXPECT_EQ(PublishInsert("posts", 1), 1u);
  scheduler_.AdvanceBy(milliseconds(1000));
  EXPECT_EQ(first.size(), 1u);
  EXPECT_EQ(second.size(), 1u);
}

TEST_F(ConnectionPoolTest, DifferentFilterOrEventKindOpensNewConnection) {
  std::vector<Delivery> out;
  SubscriptionHandle all = pool_->Acquire("all", Spec("comments"), Collect(&out));
  SubscriptionHandle mine =
      pool_->Acquire("mine", Spec("comments", PriorityTier::MEDIUM, "author_id=eq.42"), Collect(&out));
  SubscriptionHandle inserts =
      pool_->Acquire("inserts", Spec("comments", PriorityTier::MEDIUM, "", EventKind::INSERT), Collect(&out));

  EXPECT_EQ(feed_.GetTotalSubscribeCalls(), 3u);
  EXPECT_EQ(pool_->GetLiveConnectionCount(), 3u);
  EXPECT_TRUE(all.IsOwner());
  EXPECT_TRUE(mine.IsOwner());
  EXPECT_TRUE(inserts.IsOwner());
}

TEST_F(ConnectionPoolTest, JoinerReleaseOnlyDetaches) {
  std::vector<Delivery> owner_out, joiner_out;
  SubscriptionHandle owner = pool_->Acquire("owner", Spec("posts"), Collect(&owner_out));
  SubscriptionHandle joiner = pool_->Acquire("joiner", Spec("posts"), Collect(&joiner_out));

  joiner.Release();
  EXPECT_FALSE(joiner.IsActive());
  EXPECT_EQ(pool_->GetLiveConnectionCount(), 1u);
  EXPECT_EQ(pool_->GetListenerCount(), 1u);
  EXPECT_EQ(feed_.GetSubscriptionCount(), 1u);

  PublishInsert("posts", 1);
  scheduler_.AdvanceBy(milliseconds(1000));
  EXPECT_EQ(owner_out.size(), 1u);
  EXPECT_TRUE(joiner_out.empty());

  // Idempotent
  joiner.Release();
  EXPECT_EQ(pool_->GetListenerCount(), 1u);
}

TEST_F(ConnectionPoolTest, ListenerReleasedMidDeliveryGetsNothing) {
  size_t joiner_after_release = 0;
  bool released = false;
  SubscriptionHandle joiner;
  SubscriptionHandle owner = pool_->Acquire("owner", Spec("posts"), [&](const Delivery&) {
    joiner.Release();
    released = true;
  });
  joiner = pool_->Acquire("joiner", Spec("posts"), [&](const Delivery&) {
    if (released) {
      ++joiner_after_release;
    }
  });

  PublishInsert("posts", 1);
  scheduler_.AdvanceBy(milliseconds(1000));
  EXPECT_TRUE(released);
  EXPECT_EQ(joiner_after_release, 0u);
  EXPECT_EQ(pool_->GetListenerCount(), 1u);
}

TEST_F(ConnectionPoolTest, OwnerTeardownMidDeliverySkipsJoiners) {
  std::vector<Delivery> joiner_out;
  SubscriptionHandle owner;
  owner = pool_->Acquire("owner", Spec("posts"), [&](const Delivery&) { owner.Release(); });
  SubscriptionHandle joiner = pool_->Acquire("joiner", Spec("posts"), Collect(&joiner_out));

  PublishInsert("posts", 1);
  scheduler_.AdvanceBy(milliseconds(1000));
  EXPECT_TRUE(joiner_out.empty());
  EXPECT_EQ(pool_->GetLiveConnectionCount(), 0u);
}

TEST_F(ConnectionPoolTest, OwnerReleaseTearsDownForEveryone) {
  std::vector<Delivery> joiner_out;
  SubscriptionHandle joiner;
  {
    SubscriptionHandle owner = pool_->Acquire("owner", Spec("posts"), [](const Delivery&) {});
    joiner = pool_->Acquire("joiner", Spec("posts"), Collect(&joiner_out));
  }

  EXPECT_EQ(pool_->GetLiveConnectionCount(), 0u);
  EXPECT_FALSE(pool_->HasChannel("owner"));
  EXPECT_FALSE(batch_engine_.IsRegistered("owner"));
  EXPECT_EQ(feed_.GetSubscriptionCount(), 0u);

  EXPECT_EQ(PublishInsert("posts", 1), 0u);
  scheduler_.AdvanceBy(milliseconds(1000));
  EXPECT_TRUE(joiner_out.empty());

  // The orphaned joiner releases nothing
  joiner.Release();
  EXPECT_EQ(pool_->GetLiveConnectionCount(), 0u);
}

TEST_F(ConnectionPoolTest, MovedHandleKeepsRegistration) {
  SubscriptionHandle original = pool_->Acquire("posts", Spec("posts"), [](const Delivery&) {});
  SubscriptionHandle moved = std::move(original);
  EXPECT_FALSE(original.IsActive());
  EXPECT_TRUE(moved.IsActive());

  original.Release();
  EXPECT_EQ(pool_->GetLiveConnectionCount(), 1u);
  moved.Release();
  EXPECT_EQ(pool_->GetLiveConnectionCount(), 0u);
}

TEST_F(ConnectionPoolTest, CeilingDegradesNewSubscriptions) {
  PoolOptions options;
  options.max_total_connections = 2;
  MakePool(options);

  SubscriptionHandle posts = pool_->Acquire("posts", Spec("posts"), [](const Delivery&) {});
  SubscriptionHandle likes = pool_->Acquire("likes", Spec("likes"), [](const Delivery&) {});
  SubscriptionHandle reels = pool_->Acquire("reels", Spec("reels"), [](const Delivery&) {});
  SubscriptionHandle more_posts = pool_->Acquire("more-posts", Spec("posts"), [](const Delivery&) {});

  EXPECT_TRUE(posts);
  EXPECT_TRUE(likes);
  EXPECT_FALSE(reels);
  EXPECT_FALSE(more_posts);  // Ceiling is checked before reuse
  EXPECT_EQ(pool_->GetDegradedCount(), 2u);
  EXPECT_EQ(feed_.GetTotalSubscribeCalls(), 2u);
  EXPECT_EQ(pool_->GetLiveConnectionCount(), 2u);

  // Room again once one is released
  likes.Release();
  SubscriptionHandle retry = pool_->Acquire("reels", Spec("reels"), [](const Delivery&) {});
  EXPECT_TRUE(retry);
}

TEST_F(ConnectionPoolTest, TierLimitAppliesOnlyWhenEnforced) {
  std::vector<SubscriptionHandle> handles;
  handles.push_back(pool_->Acquire("likes", Spec("likes", PriorityTier::CRITICAL), [](const Delivery&) {}));
  handles.push_back(pool_->Acquire("follows", Spec("follows", PriorityTier::CRITICAL), [](const Delivery&) {}));
  EXPECT_TRUE(handles[1]);

  PoolOptions options;
  options.enforce_tier_limits = true;
  handles.clear();
  MakePool(options);

  SubscriptionHandle likes = pool_->Acquire("likes", Spec("likes", PriorityTier::CRITICAL), [](const Delivery&) {});
  SubscriptionHandle follows =
      pool_->Acquire("follows", Spec("follows", PriorityTier::CRITICAL), [](const Delivery&) {});
  SubscriptionHandle shared =
      pool_->Acquire("likes-2", Spec("likes", PriorityTier::CRITICAL), [](const Delivery&) {});
  SubscriptionHandle medium = pool_->Acquire("posts", Spec("posts", PriorityTier::MEDIUM), [](const Delivery&) {});

  EXPECT_TRUE(likes);
  EXPECT_FALSE(follows);  // CRITICAL allows one connection
  EXPECT_TRUE(shared);    // Joining does not open a connection
  EXPECT_TRUE(medium);
  EXPECT_EQ(pool_->GetDegradedCount(), 1u);
}

TEST_F(ConnectionPoolTest, RefusedSubscriptionReportsError) {
  feed_.SetRejectSubscriptions(true);
  SubscriptionHandle handle = pool_->Acquire("posts", Spec("posts"), [](const Delivery&) {});

  EXPECT_FALSE(handle);
  EXPECT_EQ(pool_->GetLiveConnectionCount(), 0u);
  EXPECT_FALSE(batch_engine_.IsRegistered("posts"));
  ASSERT_EQ(errors_.size(), 1u);
  EXPECT_EQ(errors_[0].first, "posts");
}

TEST_F(ConnectionPoolTest, MalformedPayloadIsCountedNotDelivered) {
  std::vector<Delivery> out;
  SubscriptionHandle handle = pool_->Acquire("posts", Spec("posts"), Collect(&out));

  EXPECT_EQ(feed_.Publish("posts", {{"eventType", "INSERT"}, {"table", "posts"}}), 1u);
  EXPECT_EQ(feed_.Publish("posts", {{"garbage", true}}), 1u);
  scheduler_.AdvanceBy(milliseconds(5000));

  EXPECT_TRUE(out.empty());
  EXPECT_EQ(pool_->GetMalformedCount(), 2u);
  ASSERT_EQ(errors_.size(), 2u);
  EXPECT_NE(errors_[0].second.find("malformed"), std::string::npos);
  EXPECT_EQ(pool_->GetLiveConnectionCount(), 1u);
}

TEST_F(ConnectionPoolTest, FeedErrorsTearDownAfterLimit) {
  PoolOptions options;
  options.max_connection_errors = 3;
  MakePool(options);

  SubscriptionHandle handle = pool_->Acquire("posts", Spec("posts"), [](const Delivery&) {});
  feed_.InjectError("posts", "CHANNEL_ERROR");
  feed_.InjectError("posts", "TIMED_OUT");
  EXPECT_EQ(pool_->GetLiveConnectionCount(), 1u);
  EXPECT_EQ(pool_->GetMetrics()[0].error_count, 2);

  feed_.InjectError("posts", "CHANNEL_ERROR");
  EXPECT_EQ(pool_->GetLiveConnectionCount(), 0u);
  EXPECT_EQ(feed_.GetSubscriptionCount(), 0u);
  EXPECT_EQ(errors_.size(), 3u);
  EXPECT_EQ(errors_[1].second, "TIMED_OUT");
}

TEST_F(ConnectionPoolTest, ZeroErrorLimitNeverTearsDown) {
  PoolOptions options;
  options.max_connection_errors = 0;
  MakePool(options);

  SubscriptionHandle handle = pool_->Acquire("posts", Spec("posts"), [](const Delivery&) {});
  for (int i = 0; i < 20; ++i) {
    feed_.InjectError("posts", "CHANNEL_ERROR");
  }
  EXPECT_EQ(pool_->GetLiveConnectionCount(), 1u);
  EXPECT_EQ(errors_.size(), 20u);
}

TEST_F(ConnectionPoolTest, ThrowingListenerDoesNotStarveOthers) {
  std::vector<Delivery> out;
  SubscriptionHandle bad = pool_->Acquire("bad", Spec("posts"), [](const Delivery&) {
    throw std::runtime_error("render failed");
  });
  SubscriptionHandle good = pool_->Acquire("good", Spec("posts"), Collect(&out));

  PublishInsert("posts", 1);
  scheduler_.AdvanceBy(milliseconds(1000));

  EXPECT_EQ(out.size(), 1u);
  ASSERT_EQ(errors_.size(), 1u);
  EXPECT_EQ(errors_[0].first, "bad");
  EXPECT_EQ(pool_->GetMetrics()[0].error_count, 1);
}

TEST_F(ConnectionPoolTest, ReacquiringChannelReplacesConnection) {
  SubscriptionHandle first = pool_->Acquire("posts", Spec("posts"), [](const Delivery&) {});
  SubscriptionHandle second =
      pool_->Acquire("posts", Spec("posts", PriorityTier::HIGH, "user_id=eq.1"), [](const Delivery&) {});

  EXPECT_NE(first.GetConnectionId(), second.GetConnectionId());
  EXPECT_EQ(pool_->GetLiveConnectionCount(), 1u);
  EXPECT_EQ(feed_.GetSubscriptionCount(), 1u);

  first.Release();
  EXPECT_EQ(pool_->GetLiveConnectionCount(), 1u);
  EXPECT_EQ(pool_->GetMetrics()[0].priority, PriorityTier::HIGH);
}

TEST_F(ConnectionPoolTest, SweepIdleClosesQuietConnections) {
  PoolOptions options;
  options.idle_timeout = milliseconds(1000);
  MakePool(options);

  SubscriptionHandle quiet = pool_->Acquire("quiet", Spec("reels"), [](const Delivery&) {});
  SubscriptionHandle busy = pool_->Acquire("busy", Spec("posts"), [](const Delivery&) {});

  scheduler_.AdvanceBy(milliseconds(600));
  PublishInsert("posts", 1);
  scheduler_.AdvanceBy(milliseconds(500));

  EXPECT_EQ(pool_->SweepIdle(), 1u);
  EXPECT_FALSE(pool_->HasChannel("quiet"));
  EXPECT_TRUE(pool_->HasChannel("busy"));
  EXPECT_EQ(feed_.GetSubscriptionCount(), 1u);
  EXPECT_EQ(pool_->SweepIdle(), 0u);
}

TEST_F(ConnectionPoolTest, MetricsTrackMessagesAndPending) {
  SubscriptionHandle handle = pool_->Acquire("posts", Spec("posts", PriorityTier::LOW), [](const Delivery&) {});
  PublishInsert("posts", 1);
  PublishInsert("posts", 2);
  scheduler_.AdvanceBy(milliseconds(250));

  auto metrics = pool_->GetMetrics();
  ASSERT_EQ(metrics.size(), 1u);
  EXPECT_EQ(metrics[0].channel, "posts");
  EXPECT_EQ(metrics[0].priority, PriorityTier::LOW);
  EXPECT_EQ(metrics[0].message_count, 2u);
  EXPECT_EQ(metrics[0].pending_events, 2u);
  EXPECT_EQ(metrics[0].idle_for, milliseconds(250));
}

TEST_F(ConnectionPoolTest, ShutdownClosesEverythingAndDegradesLaterCalls) {
  SubscriptionHandle posts = pool_->Acquire("posts", Spec("posts"), [](const Delivery&) {});
  SubscriptionHandle likes = pool_->Acquire("likes", Spec("likes"), [](const Delivery&) {});

  pool_->Shutdown();
  EXPECT_EQ(pool_->GetLiveConnectionCount(), 0u);
  EXPECT_EQ(feed_.GetSubscriptionCount(), 0u);
  EXPECT_EQ(batch_engine_.GetChannelCount(), 0u);

  SubscriptionHandle late = pool_->Acquire("reels", Spec("reels"), [](const Delivery&) {});
  EXPECT_FALSE(late);
  EXPECT_EQ(pool_->GetDegradedCount(), 1u);
}

TEST_F(ConnectionPoolTest, HandleOutlivingPoolIsHarmless) {
  SubscriptionHandle handle = pool_->Acquire("posts", Spec("posts"), [](const Delivery&) {});
  pool_.reset();
  EXPECT_EQ(feed_.GetSubscriptionCount(), 0u);
  handle.Release();
  EXPECT_FALSE(handle.IsActive());
}

TEST_F(ConnectionPoolTest, EmptyCallbackIsRejected) {
  EXPECT_THROW(pool_->Acquire("posts", Spec("posts"), ListenerCallback()), std::invalid_argument);
  EXPECT_EQ(feed_.GetTotalSubscribeCalls(), 0u);
}
