#include <gtest/gtest.h>
#include "engine/aggregation/batch_engine.hpp"
#include "manual_scheduler.hpp"

#include <stdexcept>
#include <vector>

using namespace quell::aggregation;
using namespace quell::realtime;
using quell::test::ManualScheduler;
using std::chrono::milliseconds;

namespace {

ChangeEvent Insert(int id) {
  return InsertEvent{"posts", "", {{"id", id}}};
}

// Flattens a delivery into the row ids it carries
std::vector<int> Ids(const Delivery& delivery) {
  std::vector<int> ids;
  auto id_of = [](const ChangeEvent& event) { return std::get<InsertEvent>(event).new_row["id"].get<int>(); };
  if (const auto* batch = std::get_if<ChangeBatch>(&delivery)) {
    for (const auto& event : batch->events) {
      ids.push_back(id_of(event));
    }
  } else {
    ids.push_back(id_of(std::get<ChangeEvent>(delivery)));
  }
  return ids;
}

}  // namespace

class BatchEngineTest : public ::testing::Test {
 protected:
  void Register(const std::string& channel, PriorityTier tier) {
    engine_.Register(channel, DefaultTierSettings(tier),
                     [this](const std::string& ch, const Delivery& delivery) {
                       channels_.push_back(ch);
                       deliveries_.push_back(delivery);
                       times_.push_back(scheduler_.Now());
                     });
  }

  ManualScheduler scheduler_;
  BatchEngine engine_{scheduler_};
  std::vector<std::string> channels_;
  std::vector<Delivery> deliveries_;
  std::vector<ManualScheduler::TimePoint> times_;
};

TEST_F(BatchEngineTest, CriticalTierFlushesOnBatchSize) {
  Register("likes", PriorityTier::CRITICAL);
  const auto start = scheduler_.Now();

  EXPECT_TRUE(engine_.OnEvent("likes", Insert(1)));
  scheduler_.AdvanceBy(milliseconds(10));
  EXPECT_TRUE(engine_.OnEvent("likes", Insert(2)));
  scheduler_.AdvanceBy(milliseconds(10));
  EXPECT_TRUE(engine_.OnEvent("likes", Insert(3)));

  ASSERT_EQ(deliveries_.size(), 1u);
  ASSERT_TRUE(std::holds_alternative<ChangeBatch>(deliveries_[0]));
  EXPECT_EQ(std::get<ChangeBatch>(deliveries_[0]).count(), 3u);
  EXPECT_EQ(Ids(deliveries_[0]), (std::vector<int>{1, 2, 3}));
  EXPECT_EQ(times_[0] - start, milliseconds(20));
  EXPECT_EQ(engine_.GetPendingCount("likes"), 0u);

  // The superseded debounce timer must not fire an empty or duplicate flush
  scheduler_.AdvanceBy(milliseconds(1000));
  EXPECT_EQ(deliveries_.size(), 1u);
  EXPECT_EQ(scheduler_.GetScheduledCount(), 0u);
}

TEST_F(BatchEngineTest, LowTierSingleEventDeliveredUnwrappedAfterDebounce) {
  Register("follows", PriorityTier::LOW);
  const auto start = scheduler_.Now();

  engine_.OnEvent("follows", Insert(7));
  scheduler_.AdvanceBy(milliseconds(4999));
  EXPECT_TRUE(deliveries_.empty());
  EXPECT_EQ(engine_.GetPendingCount("follows"), 1u);

  scheduler_.AdvanceBy(milliseconds(1));
  ASSERT_EQ(deliveries_.size(), 1u);
  EXPECT_TRUE(std::holds_alternative<ChangeEvent>(deliveries_[0]));
  EXPECT_EQ(Ids(deliveries_[0]), std::vector<int>{7});
  EXPECT_EQ(times_[0] - start, milliseconds(5000));
  EXPECT_EQ(channels_[0], "follows");
}

TEST_F(BatchEngineTest, EveryEventRestartsTheDebounce) {
  Register("comments", PriorityTier::MEDIUM);
  const auto start = scheduler_.Now();

  engine_.OnEvent("comments", Insert(1));
  scheduler_.AdvanceBy(milliseconds(800));
  engine_.OnEvent("comments", Insert(2));
  scheduler_.AdvanceBy(milliseconds(800));
  EXPECT_TRUE(deliveries_.empty());

  scheduler_.AdvanceBy(milliseconds(200));
  ASSERT_EQ(deliveries_.size(), 1u);
  EXPECT_EQ(Ids(deliveries_[0]), (std::vector<int>{1, 2}));
  EXPECT_EQ(times_[0] - start, milliseconds(1800));
}

TEST_F(BatchEngineTest, ChannelsBatchIndependently) {
  Register("posts", PriorityTier::HIGH);
  Register("follows", PriorityTier::LOW);

  engine_.OnEvent("posts", Insert(1));
  engine_.OnEvent("follows", Insert(2));
  scheduler_.AdvanceBy(milliseconds(200));
  ASSERT_EQ(channels_.size(), 1u);
  EXPECT_EQ(channels_[0], "posts");
  EXPECT_EQ(engine_.GetPendingCount("follows"), 1u);

  scheduler_.AdvanceBy(milliseconds(4800));
  ASSERT_EQ(channels_.size(), 2u);
  EXPECT_EQ(channels_[1], "follows");
}

TEST_F(BatchEngineTest, UnregisteredChannelDropsEvents) {
  EXPECT_FALSE(engine_.OnEvent("nobody", Insert(1)));
  EXPECT_FALSE(engine_.Flush("nobody"));
  EXPECT_EQ(scheduler_.GetScheduledCount(), 0u);
}

TEST_F(BatchEngineTest, ManualFlushCancelsTimer) {
  Register("posts", PriorityTier::MEDIUM);
  EXPECT_FALSE(engine_.Flush("posts"));

  engine_.OnEvent("posts", Insert(1));
  engine_.OnEvent("posts", Insert(2));
  EXPECT_TRUE(engine_.Flush("posts"));
  ASSERT_EQ(deliveries_.size(), 1u);
  EXPECT_EQ(scheduler_.GetScheduledCount(), 0u);

  scheduler_.AdvanceBy(milliseconds(5000));
  EXPECT_EQ(deliveries_.size(), 1u);
}

TEST_F(BatchEngineTest, RemoveDropsQueueAndTimer) {
  Register("posts", PriorityTier::MEDIUM);
  engine_.OnEvent("posts", Insert(1));
  EXPECT_EQ(scheduler_.GetScheduledCount(), 1u);

  engine_.Remove("posts");
  EXPECT_FALSE(engine_.IsRegistered("posts"));
  EXPECT_EQ(engine_.GetChannelCount(), 0u);
  EXPECT_EQ(scheduler_.GetScheduledCount(), 0u);

  scheduler_.AdvanceBy(milliseconds(2000));
  EXPECT_TRUE(deliveries_.empty());
}

TEST_F(BatchEngineTest, ReRegisterDropsPendingEvents) {
  Register("posts", PriorityTier::MEDIUM);
  engine_.OnEvent("posts", Insert(1));

  Register("posts", PriorityTier::HIGH);
  EXPECT_EQ(engine_.GetPendingCount("posts"), 0u);
  scheduler_.AdvanceBy(milliseconds(2000));
  EXPECT_TRUE(deliveries_.empty());

  engine_.OnEvent("posts", Insert(2));
  scheduler_.AdvanceBy(milliseconds(200));
  ASSERT_EQ(deliveries_.size(), 1u);
  EXPECT_EQ(Ids(deliveries_[0]), std::vector<int>{2});
}

TEST_F(BatchEngineTest, ThrowingCallbackLosesOnlyItsOwnDelivery) {
  int calls = 0;
  engine_.Register("posts", DefaultTierSettings(PriorityTier::HIGH),
                   [&calls](const std::string&, const Delivery&) {
                     if (++calls == 1) {
                       throw std::runtime_error("listener blew up");
                     }
                   });

  engine_.OnEvent("posts", Insert(1));
  scheduler_.AdvanceBy(milliseconds(200));
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(engine_.GetPendingCount("posts"), 0u);

  engine_.OnEvent("posts", Insert(2));
  scheduler_.AdvanceBy(milliseconds(200));
  EXPECT_EQ(calls, 2);
}

TEST_F(BatchEngineTest, EventDuringDeliveryStartsFreshQueue) {
  std::vector<std::vector<int>> delivered;
  std::vector<ManualScheduler::TimePoint> at;
  size_t pending_during_callback = 99;
  engine_.Register("posts", DefaultTierSettings(PriorityTier::HIGH),
                   [&](const std::string& channel, const Delivery& delivery) {
                     delivered.push_back(Ids(delivery));
                     at.push_back(scheduler_.Now());
                     if (delivered.size() == 1) {
                       engine_.OnEvent(channel, Insert(99));
                       pending_during_callback = engine_.GetPendingCount(channel);
                     }
                   });
  const auto start = scheduler_.Now();

  engine_.OnEvent("posts", Insert(1));
  scheduler_.AdvanceBy(milliseconds(200));
  ASSERT_EQ(delivered.size(), 1u);
  EXPECT_EQ(delivered[0], (std::vector<int>{1}));
  EXPECT_EQ(pending_during_callback, 1u);
  EXPECT_EQ(engine_.GetPendingCount("posts"), 1u);

  scheduler_.AdvanceBy(milliseconds(200));
  ASSERT_EQ(delivered.size(), 2u);
  EXPECT_EQ(delivered[1], (std::vector<int>{99}));
  EXPECT_EQ(at[1] - start, milliseconds(400));
  EXPECT_EQ(engine_.GetPendingCount("posts"), 0u);
}

TEST_F(BatchEngineTest, StoppedSchedulerFlushesImmediately) {
  Register("follows", PriorityTier::LOW);
  scheduler_.Stop();

  EXPECT_TRUE(engine_.OnEvent("follows", Insert(7)));
  ASSERT_EQ(deliveries_.size(), 1u);
  EXPECT_EQ(Ids(deliveries_[0]), (std::vector<int>{7}));
  EXPECT_EQ(engine_.GetPendingCount("follows"), 0u);
}

TEST_F(BatchEngineTest, RejectsZeroBatchSize) {
  TierSettings settings;
  settings.max_batch_size = 0;
  EXPECT_THROW(engine_.Register("posts", settings, [](const std::string&, const Delivery&) {}),
               std::invalid_argument);
  EXPECT_FALSE(engine_.IsRegistered("posts"));
}
