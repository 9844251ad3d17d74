#ifndef SIGNALING_URI_UTIL_H
#define SIGNALING_URI_UTIL_H

#include <string>

namespace roomcast {
namespace mesh {
namespace signaling {

// Percent-encodes everything except RFC 3986 unreserved characters.
std::string UriEncode(const std::string& value);

// Appends "token=<encoded jwt>" to uri with '?' or '&' as appropriate.
// An empty jwt leaves uri unchanged.
std::string BuildConnectionUri(const std::string& uri, const std::string& jwt);

// True for wss:// URIs (case-insensitive scheme).
bool IsSecureUri(const std::string& uri);

// True for ws:// and wss:// URIs.
bool IsWebSocketUri(const std::string& uri);

}  // namespace signaling
}  // namespace mesh
}  // namespace roomcast

#endif  // SIGNALING_URI_UTIL_H
