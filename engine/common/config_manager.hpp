#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <string>

namespace quell {
namespace engine {
namespace common {

/**
 * @brief Read-mostly JSON configuration
 *
 * Keys use dot notation ("aggregation.pool.max_total_connections"). Values set
 * through Set*() or ApplyOverride() shadow the document and are kept as text,
 * parsed on read by the typed getters. Every getter falls back to its default
 * when the key is absent or has the wrong type.
 */
class ConfigManager {
 public:
  bool LoadFromFile(const std::string& config_path);
  bool LoadFromString(const std::string& json_text);

  // Logs the document and any overrides
  void PrintAllConfig() const;

  // $QUELL_CONFIG_DIR, or "config"
  static std::string GetConfigDir();

  bool HasKey(const std::string& key) const;

  std::string GetString(const std::string& key, const std::string& default_value = "") const;
  int GetInt(const std::string& key, int default_value = 0) const;
  int64_t GetInt64(const std::string& key, int64_t default_value = 0) const;
  double GetDouble(const std::string& key, double default_value = 0.0) const;
  bool GetBool(const std::string& key, bool default_value = false) const;
  std::chrono::milliseconds GetMilliseconds(const std::string& key,
                                            std::chrono::milliseconds default_value) const;

  // Array at key, null when absent or not an array
  nlohmann::json GetNodeArray(const std::string& key) const;

  // Raw node at key (overrides are not consulted), null when absent
  nlohmann::json GetNodeValue(const std::string& key) const;

  void SetString(const std::string& key, const std::string& value);
  void SetInt(const std::string& key, int value);
  void SetDouble(const std::string& key, double value);
  void SetBool(const std::string& key, bool value);

  // "key=value" from the command line; false when malformed
  bool ApplyOverride(const std::string& assignment);

  size_t GetOverrideCount() const { return overrides_.size(); }

 private:
  bool Parse(std::istream& in, const std::string& source);

  const nlohmann::json* Find(const std::string& key) const;
  std::optional<std::string> FindOverride(const std::string& key) const;

  nlohmann::json root_;
  std::map<std::string, std::string> overrides_;
};

}  // namespace common
}  // namespace engine
}  // namespace quell
