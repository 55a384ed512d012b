#pragma once

#include <string>

namespace quell {
namespace engine {
namespace common {

// Parsed URL components
struct ParsedUrl {
  std::string scheme;  // "wss", "ws", "https", "http" (lowercase)
  std::string host;
  std::string port;
  std::string path;    // Always starts with '/', includes the query string

  bool IsSecure() const { return scheme == "wss" || scheme == "https"; }
};

// Parse a ws://, wss://, http:// or https:// URL into its components
// Example: "wss://abc.supabase.co/realtime/v1/websocket?apikey=k&vsn=1.0.0"
//   -> scheme="wss", host="abc.supabase.co", port="443",
//      path="/realtime/v1/websocket?apikey=k&vsn=1.0.0"
//
// Missing ports default by scheme (443 for secure schemes, 80 otherwise).
// A URL without "://" is treated as a bare host.
ParsedUrl ParseUrl(const std::string& url, const std::string& default_scheme = "https");

// Percent-encode a query string component (RFC 3986 unreserved set kept)
std::string UrlEncode(const std::string& value);

}  // namespace common
}  // namespace engine
}  // namespace quell
