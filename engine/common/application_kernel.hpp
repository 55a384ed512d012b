#pragma once

#include "config_manager.hpp"
#include "event_thread.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <vector>

namespace quell {
namespace engine {
namespace common {

/**
 * @brief Process shell shared by the quell executables
 *
 * Run() parses the command line, loads the JSON config, applies --set
 * overrides, installs the "quell" logger, then starts the event thread that
 * every component uses as its Scheduler. It blocks until SIGINT/SIGTERM or
 * RequestStop() and tears down in reverse order.
 *
 * Command line:
 *   --config_file PATH   defaults to $QUELL_CONFIG_DIR/<app_name>.json
 *   --log_level LEVEL    overrides app.log.level
 *   --set key=value      repeatable config override
 *
 * Subclasses hook into the lifecycle:
 *   OnInitialize  config loaded, event thread not yet running
 *   OnStart       event thread running
 *   OnStop        stop requested, event thread still running
 *   OnShutdown    event thread joined
 */
class ApplicationKernel {
 public:
  struct LogSettings {
    std::string file;
    std::string level = "info";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v [%s:%#]";
    bool console = true;

    static LogSettings FromConfig(const ConfigManager& config, const std::string& app_name);
  };

  ApplicationKernel();
  virtual ~ApplicationKernel();

  ApplicationKernel(const ApplicationKernel&) = delete;
  ApplicationKernel& operator=(const ApplicationKernel&) = delete;

  // Process exit code
  int Run(int argc, char** argv);

  // Same effect as SIGTERM; safe from any thread
  void RequestStop();

  ConfigManager& GetConfig() { return config_; }
  const ConfigManager& GetConfig() const { return config_; }

  const std::string& GetAppName() const { return app_name_; }
  void SetAppName(const std::string& name) { app_name_ = name; }

  EventThread& GetEventThread() { return event_thread_; }

 protected:
  virtual void OnInitialize() {}
  virtual void OnStart() {}
  virtual void OnStop() {}
  virtual void OnShutdown() {}

 private:
  struct LaunchOptions {
    std::string config_file;
    std::string log_level;
    std::vector<std::string> overrides;
  };

  // False when the process should exit right away with exit_code
  bool ParseArguments(int argc, char** argv, LaunchOptions& launch, int& exit_code);
  bool Configure(const LaunchOptions& launch);
  void InstallLogger(const LogSettings& settings);
  void WaitForStop();
  void Shutdown();

  static void HandleSignal(int signal);

  std::string app_name_;
  ConfigManager config_;
  EventThread event_thread_;

  std::atomic<bool> stop_requested_{false};
  std::atomic<bool> shut_down_{false};
  std::mutex wait_mutex_;
  std::condition_variable wait_cv_;

  static std::atomic<bool> signal_received_;
};

}  // namespace common
}  // namespace engine
}  // namespace quell
