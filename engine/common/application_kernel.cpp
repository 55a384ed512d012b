#include "application_kernel.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <csignal>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <stdexcept>

namespace quell {
namespace engine {
namespace common {

std::atomic<bool> ApplicationKernel::signal_received_{false};

namespace {

constexpr std::chrono::milliseconds kDefaultShutdownTimeout{5000};
constexpr std::chrono::milliseconds kStopPollInterval{100};

}  // namespace

ApplicationKernel::LogSettings ApplicationKernel::LogSettings::FromConfig(const ConfigManager& config,
                                                                         const std::string& app_name) {
  LogSettings settings;
  settings.file = config.GetString("app.log.file", "logs/" + app_name + ".log");
  settings.level = config.GetString("app.log.level", settings.level);
  settings.pattern = config.GetString("app.log.pattern", settings.pattern);
  settings.console = config.GetBool("app.log.console", settings.console);
  return settings;
}

ApplicationKernel::ApplicationKernel() : app_name_("quell_app"), event_thread_("main") {}

ApplicationKernel::~ApplicationKernel() { Shutdown(); }

int ApplicationKernel::Run(int argc, char** argv) {
  LaunchOptions launch;
  int exit_code = 0;
  if (!ParseArguments(argc, argv, launch, exit_code)) {
    return exit_code;
  }
  if (!Configure(launch)) {
    return 1;
  }

  signal_received_ = false;
  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  try {
    OnInitialize();
  } catch (const std::exception& e) {
    SPDLOG_ERROR("{} failed to initialize: {}", app_name_, e.what());
    return 1;
  }

  event_thread_.Start();
  try {
    OnStart();
  } catch (const std::exception& e) {
    SPDLOG_ERROR("{} failed to start: {}", app_name_, e.what());
    Shutdown();
    return 1;
  }
  SPDLOG_INFO("{} running", app_name_);

  WaitForStop();
  SPDLOG_INFO("{} stopping", app_name_);

  try {
    OnStop();
  } catch (const std::exception& e) {
    SPDLOG_ERROR("OnStop: {}", e.what());
  }
  Shutdown();
  return 0;
}

void ApplicationKernel::RequestStop() {
  {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    stop_requested_ = true;
  }
  wait_cv_.notify_all();
}

bool ApplicationKernel::ParseArguments(int argc, char** argv, LaunchOptions& launch, int& exit_code) {
  CLI::App cli{app_name_};
  launch.config_file = ConfigManager::GetConfigDir() + "/" + app_name_ + ".json";
  cli.add_option("--config_file", launch.config_file, "JSON configuration file")
      ->check(CLI::ExistingFile)
      ->capture_default_str();
  cli.add_option("--log_level", launch.log_level, "Override app.log.level")
      ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}));
  cli.add_option("--set", launch.overrides, "Config override as key=value (repeatable)");

  try {
    cli.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    // --help lands here too, with exit code 0
    exit_code = cli.exit(e);
    return false;
  }

  // ExistingFile only checks a value given on the command line
  if (!std::filesystem::exists(launch.config_file)) {
    std::fprintf(stderr, "%s: config file not found: %s\n", app_name_.c_str(), launch.config_file.c_str());
    exit_code = 1;
    return false;
  }
  return true;
}

bool ApplicationKernel::Configure(const LaunchOptions& launch) {
  if (!config_.LoadFromFile(launch.config_file)) {
    std::fprintf(stderr, "%s: unable to load %s\n", app_name_.c_str(), launch.config_file.c_str());
    return false;
  }
  for (const auto& assignment : launch.overrides) {
    if (!config_.ApplyOverride(assignment)) {
      std::fprintf(stderr, "%s: bad --set '%s', expected key=value\n", app_name_.c_str(), assignment.c_str());
      return false;
    }
  }
  if (!launch.log_level.empty()) {
    config_.SetString("app.log.level", launch.log_level);
  }

  InstallLogger(LogSettings::FromConfig(config_, app_name_));
  SPDLOG_INFO("{} configured from {} ({} overrides)", app_name_, launch.config_file,
              config_.GetOverrideCount());
  config_.PrintAllConfig();
  return true;
}

void ApplicationKernel::InstallLogger(const LogSettings& settings) {
  auto level = spdlog::level::from_str(settings.level);
  // from_str maps unknown names to off
  if (level == spdlog::level::off && settings.level != "off") {
    level = spdlog::level::info;
  }
  std::vector<spdlog::sink_ptr> sinks;
  if (settings.console) {
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  }

  std::string file_error;
  if (!settings.file.empty()) {
    try {
      std::filesystem::path path = std::filesystem::absolute(settings.file);
      if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
      }
      sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), true));
    } catch (const std::exception& e) {
      file_error = e.what();
    }
  }
  // Never leave the process without a sink
  if (sinks.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  }

  auto logger = std::make_shared<spdlog::logger>("quell", sinks.begin(), sinks.end());
  logger->set_level(level);
  logger->set_pattern(settings.pattern);
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(logger);

  if (!file_error.empty()) {
    SPDLOG_WARN("Log file {} unavailable, console only: {}", settings.file, file_error);
  } else {
    SPDLOG_INFO("Logging at {} to {}", spdlog::level::to_string_view(level),
                settings.file.empty() ? "console" : settings.file);
  }
}

void ApplicationKernel::WaitForStop() {
  std::unique_lock<std::mutex> lock(wait_mutex_);
  // Signal handlers cannot notify, so the flag is polled
  while (!stop_requested_ && !signal_received_.load()) {
    wait_cv_.wait_for(lock, kStopPollInterval);
  }
}

void ApplicationKernel::Shutdown() {
  if (shut_down_.exchange(true)) {
    return;
  }
  RequestStop();

  const auto timeout = config_.GetMilliseconds("app.shutdown_timeout_ms", kDefaultShutdownTimeout);
  if (!event_thread_.Stop(timeout)) {
    SPDLOG_WARN("Event thread still busy after {}ms", timeout.count());
  }

  try {
    OnShutdown();
  } catch (const std::exception& e) {
    SPDLOG_ERROR("OnShutdown: {}", e.what());
  }
  SPDLOG_INFO("{} stopped", app_name_);
}

void ApplicationKernel::HandleSignal(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    signal_received_.store(true);
  }
}

}  // namespace common
}  // namespace engine
}  // namespace quell
