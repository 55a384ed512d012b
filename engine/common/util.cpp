#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace quell {
namespace engine {
namespace common {

namespace {

std::string DefaultPortFor(const std::string& scheme) {
  return (scheme == "wss" || scheme == "https") ? "443" : "80";
}

}  // namespace

ParsedUrl ParseUrl(const std::string& url, const std::string& default_scheme) {
  ParsedUrl result;
  result.scheme = default_scheme;
  result.path = "/";

  std::string rest = url;
  size_t protocol_end = url.find("://");
  if (protocol_end != std::string::npos) {
    result.scheme = url.substr(0, protocol_end);
    std::transform(result.scheme.begin(), result.scheme.end(), result.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    rest = url.substr(protocol_end + 3);
  }
  result.port = DefaultPortFor(result.scheme);

  // Path starts at the first '/' or '?'
  size_t path_start = rest.find_first_of("/?");
  std::string host_port = rest.substr(0, path_start);
  if (path_start != std::string::npos) {
    result.path = rest.substr(path_start);
    if (result.path[0] == '?') {
      result.path = "/" + result.path;
    }
  }

  size_t colon = host_port.find(':');
  if (colon != std::string::npos) {
    result.host = host_port.substr(0, colon);
    result.port = host_port.substr(colon + 1);
  } else {
    result.host = host_port;
  }

  return result;
}

std::string UrlEncode(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (unsigned char c : value) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out += static_cast<char>(c);
    } else {
      char buf[4];
      std::snprintf(buf, sizeof(buf), "%%%02X", c);
      out += buf;
    }
  }
  return out;
}

}  // namespace common
}  // namespace engine
}  // namespace quell
