#include "change_feed_factory.hpp"
#include "mock_change_feed.hpp"
#include "supabase_realtime_feed.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace quell {
namespace realtime {

ChangeFeedFactory& ChangeFeedFactory::GetInstance() {
  static ChangeFeedFactory instance;
  return instance;
}

void ChangeFeedFactory::RegisterFeed(const std::string& type, FeedCreator creator) {
  creators_[type] = std::move(creator);
}

std::unique_ptr<ChangeFeed> ChangeFeedFactory::Create(
    const std::string& type,
    const engine::common::ConfigManager& config,
    engine::common::Scheduler& scheduler) const {
  auto it = creators_.find(type);
  if (it == creators_.end()) {
    SPDLOG_ERROR("Unknown change feed type: {}", type);
    return nullptr;
  }
  SPDLOG_DEBUG("Creating change feed of type {}", type);
  return it->second(config, scheduler);
}

bool ChangeFeedFactory::IsRegistered(const std::string& type) const {
  return creators_.find(type) != creators_.end();
}

std::vector<std::string> ChangeFeedFactory::GetRegisteredTypes() const {
  std::vector<std::string> types;
  types.reserve(creators_.size());
  for (const auto& [type, creator] : creators_) {
    types.push_back(type);
  }
  std::sort(types.begin(), types.end());
  return types;
}

// Static registration of built-in feeds
namespace {
struct FeedRegistrar {
  FeedRegistrar() {
    auto& factory = ChangeFeedFactory::GetInstance();

    factory.RegisterFeed("mock", [](const engine::common::ConfigManager& config,
                                    engine::common::Scheduler&) {
      return std::make_unique<MockChangeFeed>(config);
    });

    factory.RegisterFeed("supabase_realtime", [](const engine::common::ConfigManager& config,
                                                 engine::common::Scheduler& scheduler) {
      return std::make_unique<SupabaseRealtimeFeed>(config, scheduler);
    });
  }
};

static FeedRegistrar g_registrar;
}  // anonymous namespace

}  // namespace realtime
}  // namespace quell
