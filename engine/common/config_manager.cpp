#include "config_manager.hpp"
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace quell {
namespace engine {
namespace common {

namespace {

// "a.b.c" -> "/a/b/c", escaping per RFC 6901
nlohmann::json::json_pointer ToPointer(const std::string& key) {
  std::string path;
  path.reserve(key.size() + 1);
  bool segment_start = true;
  for (char c : key) {
    if (c == '.') {
      segment_start = true;
      continue;
    }
    if (segment_start) {
      path += '/';
      segment_start = false;
    }
    if (c == '~') {
      path += "~0";
    } else if (c == '/') {
      path += "~1";
    } else {
      path += c;
    }
  }
  return nlohmann::json::json_pointer(path);
}

std::optional<bool> ParseBool(const std::string& text) {
  if (text == "true" || text == "1" || text == "yes" || text == "on") return true;
  if (text == "false" || text == "0" || text == "no" || text == "off") return false;
  return std::nullopt;
}

}  // namespace

//==============================================================================
// Loading
//==============================================================================

bool ConfigManager::LoadFromFile(const std::string& config_path) {
  std::ifstream file(config_path);
  if (!file.is_open()) {
    SPDLOG_WARN("Failed to open config file: {}", config_path);
    return false;
  }
  return Parse(file, config_path);
}

bool ConfigManager::LoadFromString(const std::string& json_text) {
  std::istringstream in(json_text);
  return Parse(in, "<inline>");
}

bool ConfigManager::Parse(std::istream& in, const std::string& source) {
  nlohmann::json parsed = nlohmann::json::parse(in, nullptr, false);
  if (parsed.is_discarded()) {
    SPDLOG_WARN("Config {} is not valid JSON", source);
    return false;
  }
  if (!parsed.is_object()) {
    SPDLOG_WARN("Config {} must be a JSON object, got {}", source, parsed.type_name());
    return false;
  }
  root_ = std::move(parsed);
  SPDLOG_INFO("Loaded config from {} ({} sections)", source, root_.size());
  return true;
}

void ConfigManager::PrintAllConfig() const {
  SPDLOG_INFO("Active config:\n{}", root_.dump(2));
  for (const auto& [key, value] : overrides_) {
    SPDLOG_INFO("Override {} = {}", key, value);
  }
}

std::string ConfigManager::GetConfigDir() {
  const char* env = std::getenv("QUELL_CONFIG_DIR");
  return (env != nullptr && *env != '\0') ? std::string(env) : std::string("config");
}

//==============================================================================
// Lookups
//==============================================================================

bool ConfigManager::HasKey(const std::string& key) const {
  return overrides_.count(key) > 0 || Find(key) != nullptr;
}

std::string ConfigManager::GetString(const std::string& key, const std::string& default_value) const {
  if (auto text = FindOverride(key)) {
    return *text;
  }
  const nlohmann::json* node = Find(key);
  return (node != nullptr && node->is_string()) ? node->get<std::string>() : default_value;
}

int ConfigManager::GetInt(const std::string& key, int default_value) const {
  const int64_t value = GetInt64(key, default_value);
  if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
    SPDLOG_WARN("Config {}={} does not fit an int, using {}", key, value, default_value);
    return default_value;
  }
  return static_cast<int>(value);
}

int64_t ConfigManager::GetInt64(const std::string& key, int64_t default_value) const {
  if (auto text = FindOverride(key)) {
    try {
      size_t used = 0;
      int64_t value = std::stoll(*text, &used);
      if (used == text->size()) {
        return value;
      }
    } catch (const std::exception& e) {
      SPDLOG_DEBUG("Override {}={}: {}", key, *text, e.what());
    }
    SPDLOG_WARN("Override {}={} is not an integer, using {}", key, *text, default_value);
    return default_value;
  }
  const nlohmann::json* node = Find(key);
  return (node != nullptr && node->is_number()) ? node->get<int64_t>() : default_value;
}

double ConfigManager::GetDouble(const std::string& key, double default_value) const {
  if (auto text = FindOverride(key)) {
    try {
      size_t used = 0;
      double value = std::stod(*text, &used);
      if (used == text->size()) {
        return value;
      }
    } catch (const std::exception& e) {
      SPDLOG_DEBUG("Override {}={}: {}", key, *text, e.what());
    }
    SPDLOG_WARN("Override {}={} is not a number, using {}", key, *text, default_value);
    return default_value;
  }
  const nlohmann::json* node = Find(key);
  return (node != nullptr && node->is_number()) ? node->get<double>() : default_value;
}

bool ConfigManager::GetBool(const std::string& key, bool default_value) const {
  if (auto text = FindOverride(key)) {
    return ParseBool(*text).value_or(default_value);
  }
  const nlohmann::json* node = Find(key);
  return (node != nullptr && node->is_boolean()) ? node->get<bool>() : default_value;
}

std::chrono::milliseconds ConfigManager::GetMilliseconds(
    const std::string& key, std::chrono::milliseconds default_value) const {
  return std::chrono::milliseconds(GetInt64(key, default_value.count()));
}

nlohmann::json ConfigManager::GetNodeArray(const std::string& key) const {
  const nlohmann::json* node = Find(key);
  return (node != nullptr && node->is_array()) ? *node : nlohmann::json();
}

nlohmann::json ConfigManager::GetNodeValue(const std::string& key) const {
  const nlohmann::json* node = Find(key);
  return node != nullptr ? *node : nlohmann::json();
}

//==============================================================================
// Overrides
//==============================================================================

void ConfigManager::SetString(const std::string& key, const std::string& value) {
  overrides_[key] = value;
}

void ConfigManager::SetInt(const std::string& key, int value) {
  overrides_[key] = std::to_string(value);
}

void ConfigManager::SetDouble(const std::string& key, double value) {
  std::ostringstream out;
  out << value;
  overrides_[key] = out.str();
}

void ConfigManager::SetBool(const std::string& key, bool value) {
  overrides_[key] = value ? "true" : "false";
}

bool ConfigManager::ApplyOverride(const std::string& assignment) {
  const size_t eq = assignment.find('=');
  if (eq == std::string::npos || eq == 0) {
    SPDLOG_WARN("Ignoring override '{}', expected key=value", assignment);
    return false;
  }
  SetString(assignment.substr(0, eq), assignment.substr(eq + 1));
  return true;
}

//==============================================================================
// Helpers (private)
//==============================================================================

const nlohmann::json* ConfigManager::Find(const std::string& key) const {
  if (!root_.is_object() || key.empty()) {
    return nullptr;
  }
  const auto pointer = ToPointer(key);
  if (!root_.contains(pointer)) {
    return nullptr;
  }
  return &root_.at(pointer);
}

std::optional<std::string> ConfigManager::FindOverride(const std::string& key) const {
  auto it = overrides_.find(key);
  if (it == overrides_.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace common
}  // namespace engine
}  // namespace quell
