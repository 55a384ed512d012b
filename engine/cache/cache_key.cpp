#include "cache_key.hpp"

namespace quell {
namespace cache {

std::string MakeCacheKey(const std::string& resource, const std::string& operation,
                         const std::map<std::string, std::string>& params) {
  std::string key = resource + ":" + operation + ":";
  bool first = true;
  for (const auto& [name, value] : params) {
    if (!first) {
      key += '|';
    }
    key += name + ":" + value;
    first = false;
  }
  return key;
}

std::string MakeCacheKey(const std::string& resource, const std::string& operation,
                         const nlohmann::json& params) {
  std::map<std::string, std::string> flat;
  if (params.is_object()) {
    for (auto it = params.begin(); it != params.end(); ++it) {
      flat[it.key()] = it.value().is_string() ? it.value().get<std::string>() : it.value().dump();
    }
  }
  return MakeCacheKey(resource, operation, flat);
}

std::string MakeCachePrefix(const std::string& resource) {
  return resource + ":";
}

}  // namespace cache
}  // namespace quell
