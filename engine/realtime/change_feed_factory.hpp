#pragma once

#include "change_feed.hpp"
#include "engine/common/config_manager.hpp"
#include "engine/common/scheduler.hpp"
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace quell {
namespace realtime {

// Factory for creating change feeds by type name ("mock", "supabase_realtime")
class ChangeFeedFactory {
 public:
  using FeedCreator = std::function<std::unique_ptr<ChangeFeed>(
      const engine::common::ConfigManager& config,
      engine::common::Scheduler& scheduler)>;

  static ChangeFeedFactory& GetInstance();

  // Register a feed type (replaces an existing registration)
  void RegisterFeed(const std::string& type, FeedCreator creator);

  // Create a feed by type, nullptr for unknown types
  std::unique_ptr<ChangeFeed> Create(const std::string& type,
                                     const engine::common::ConfigManager& config,
                                     engine::common::Scheduler& scheduler) const;

  bool IsRegistered(const std::string& type) const;

  std::vector<std::string> GetRegisteredTypes() const;

 private:
  ChangeFeedFactory() = default;
  ~ChangeFeedFactory() = default;
  ChangeFeedFactory(const ChangeFeedFactory&) = delete;
  ChangeFeedFactory& operator=(const ChangeFeedFactory&) = delete;

  std::unordered_map<std::string, FeedCreator> creators_;
};

}  // namespace realtime
}  // namespace quell
