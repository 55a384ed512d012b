#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <string>

namespace quell {
namespace cache {

// "<resource>:<operation>:<k1>:<v1>|<k2>:<v2>" with parameters sorted by name,
// so equivalent requests built in any order share one key
std::string MakeCacheKey(const std::string& resource, const std::string& operation,
                         const std::map<std::string, std::string>& params = {});

// Same, for a JSON object of parameters; strings are used verbatim and other
// values in their compact JSON form
std::string MakeCacheKey(const std::string& resource, const std::string& operation,
                         const nlohmann::json& params);

// "<resource>:" prefix matching every key of a resource
std::string MakeCachePrefix(const std::string& resource);

}  // namespace cache
}  // namespace quell
