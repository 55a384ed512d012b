/**
 * @file feed_monitor/main.cpp
 * @brief Change feed monitor
 *
 * Subscribes the channels listed in the config through the aggregation layer
 * and logs every batched delivery plus periodic pool/breaker/cache metrics.
 *
 * Configuration: config/feed_monitor.json
 * - feed.type: "mock" or "supabase_realtime"
 * - cache.backend: "none", "memory" or "upstash"
 * - channels: [{name, table, filter, event, priority}]
 * - aggregation.*: tier table, pool ceiling, breaker and retry settings
 *
 * With the mock feed, synthetic changes are published on every channel's
 * table so the batching can be watched without a backend.
 *
 * Usage:
 *   ./feed_monitor --config_file=config/feed_monitor.json
 *   ./feed_monitor --log_level=debug --set feed.type=supabase_realtime
 */

#include "engine/common/application_kernel.hpp"
#include "engine/aggregation/aggregation_facade.hpp"
#include "engine/aggregation/aggregation_options.hpp"
#include "engine/cache/in_memory_remote_cache.hpp"
#include "engine/cache/upstash_rest_client.hpp"
#include "engine/realtime/change_feed_factory.hpp"
#include "engine/realtime/mock_change_feed.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace quell::engine::common;
using namespace quell::aggregation;
using namespace quell::realtime;

class FeedMonitorApp : public ApplicationKernel {
 public:
  FeedMonitorApp() {
    SetAppName("feed_monitor");
  }

 protected:
  void OnInitialize() override {
    options_ = LoadAggregationOptions(GetConfig());
    ValidateOptions(options_);

    feed_type_ = GetConfig().GetString("feed.type", "mock");
    if (!ChangeFeedFactory::GetInstance().IsRegistered(feed_type_)) {
      throw std::runtime_error("Unknown feed.type: " + feed_type_);
    }

    std::string backend = GetConfig().GetString("cache.backend", "memory");
    if (backend == "upstash") {
      remote_cache_ = std::make_unique<quell::cache::UpstashRestClient>(GetConfig());
    } else if (backend == "memory") {
      remote_cache_ = std::make_unique<quell::cache::InMemoryRemoteCache>();
    } else if (backend != "none") {
      throw std::runtime_error("Unknown cache.backend: " + backend);
    }
  }

  void OnStart() override {
    feed_ = ChangeFeedFactory::GetInstance().Create(feed_type_, GetConfig(), GetEventThread());
    if (!feed_) {
      throw std::runtime_error("Failed to create feed " + feed_type_);
    }
    if (!feed_->Connect()) {
      throw std::runtime_error("Failed to connect feed " + feed_type_);
    }

    facade_ = std::make_unique<AggregationFacade>(GetEventThread(), *feed_, remote_cache_.get(), options_);
    facade_->SetErrorHook([](const std::string& channel, const std::string& error) {
      SPDLOG_WARN("[{}] subscription error: {}", channel, error);
    });

    if (remote_cache_) {
      SPDLOG_INFO("Remote cache {} healthy: {}", remote_cache_->GetName(), facade_->CheckRemoteCacheHealth());
    }

    SubscribeChannels();

    auto metrics_interval = GetConfig().GetMilliseconds("monitor.metrics_interval_ms", std::chrono::milliseconds(10000));
    metrics_task_id_ = GetEventThread().SchedulePeriodic(
        [this]() { SPDLOG_INFO("Aggregation metrics: {}", facade_->GetMetrics().dump()); },
        metrics_interval);

    auto* mock = dynamic_cast<MockChangeFeed*>(feed_.get());
    if (mock != nullptr) {
      auto publish_interval =
          GetConfig().GetMilliseconds("monitor.demo_publish_interval_ms", std::chrono::milliseconds(250));
      demo_task_id_ = GetEventThread().SchedulePeriodic([this, mock]() { PublishDemoChange(*mock); },
                                                        publish_interval);
      SPDLOG_INFO("Mock feed: publishing a synthetic change every {}ms", publish_interval.count());
    }
  }

  void OnStop() override {
    if (metrics_task_id_ >= 0) {
      GetEventThread().CancelPeriodic(metrics_task_id_);
    }
    if (demo_task_id_ >= 0) {
      GetEventThread().CancelPeriodic(demo_task_id_);
    }

    handles_.clear();
    if (facade_) {
      SPDLOG_INFO("Final metrics: {}", facade_->GetMetrics().dump());
      facade_->Shutdown();
    }
    if (feed_) {
      feed_->Disconnect();
    }
  }

  void OnShutdown() override {
    facade_.reset();
    feed_.reset();
    remote_cache_.reset();
  }

 private:
  void SubscribeChannels() {
    nlohmann::json channels = GetConfig().GetNodeArray("channels");
    if (channels.is_null() || channels.empty()) {
      SPDLOG_WARN("No channels configured, nothing to monitor");
      return;
    }

    for (const auto& entry : channels) {
      SubscriptionSpec spec;
      std::string name = entry.value("name", "");
      spec.table = entry.value("table", "");
      spec.filter = entry.value("filter", "");
      if (name.empty() || spec.table.empty()) {
        SPDLOG_ERROR("Skipping channel without name or table: {}", entry.dump());
        continue;
      }
      if (!ParseEventKind(entry.value("event", "*"), &spec.event_kind)) {
        SPDLOG_ERROR("Skipping channel {}: bad event kind {}", name, entry.value("event", ""));
        continue;
      }
      if (!ParsePriorityTier(entry.value("priority", "medium"), &spec.priority)) {
        SPDLOG_ERROR("Skipping channel {}: bad priority {}", name, entry.value("priority", ""));
        continue;
      }

      SubscriptionHandle handle = facade_->Subscribe(name, spec, [name](const Delivery& delivery) {
        if (const auto* batch = std::get_if<ChangeBatch>(&delivery)) {
          SPDLOG_INFO("[{}] batch of {} events", name, batch->count());
        } else {
          SPDLOG_INFO("[{}] event {}", name, ToJson(delivery).dump());
        }
      });

      if (!handle) {
        SPDLOG_WARN("[{}] running degraded, no live updates", name);
        continue;
      }
      SPDLOG_INFO("[{}] subscribed to {} ({}, {})", name, spec.PoolKey(), ToString(spec.event_kind),
                  ToString(spec.priority));
      demo_tables_.push_back(spec.table);
      handles_.push_back(std::move(handle));
    }
  }

  // Round-robin insert/update/delete over the subscribed tables
  void PublishDemoChange(MockChangeFeed& mock) {
    if (demo_tables_.empty()) {
      return;
    }
    const std::string& table = demo_tables_[demo_counter_ % demo_tables_.size()];
    int64_t id = static_cast<int64_t>(demo_counter_ / 3);
    nlohmann::json row = {{"id", id}, {"seq", demo_counter_}};

    nlohmann::json payload = {{"table", table}, {"commit_timestamp", ""}};
    switch (demo_counter_ % 3) {
      case 0:
        payload["eventType"] = "INSERT";
        payload["new"] = row;
        break;
      case 1:
        payload["eventType"] = "UPDATE";
        payload["new"] = row;
        payload["old"] = {{"id", id}};
        break;
      default:
        payload["eventType"] = "DELETE";
        payload["old"] = {{"id", id}};
        break;
    }
    ++demo_counter_;
    mock.Publish(table, payload);
  }

  AggregationOptions options_;
  std::string feed_type_;
  std::unique_ptr<quell::cache::RemoteCacheClient> remote_cache_;
  std::unique_ptr<ChangeFeed> feed_;
  std::unique_ptr<AggregationFacade> facade_;
  std::vector<SubscriptionHandle> handles_;
  std::vector<std::string> demo_tables_;
  uint64_t demo_counter_ = 0;
  int metrics_task_id_ = -1;
  int demo_task_id_ = -1;
};

int main(int argc, char** argv) {
  FeedMonitorApp app;
  return app.Run(argc, argv);
}
