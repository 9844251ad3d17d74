#include "signaling/uri_util.h"

#include <cctype>

namespace roomcast {
namespace mesh {
namespace signaling {

namespace {

bool HasSchemePrefix(const std::string& uri, const std::string& scheme) {
  const std::string prefix = scheme + "://";
  if (uri.size() <= prefix.size()) {
    return false;
  }
  for (std::size_t i = 0; i < prefix.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(uri[i])) != prefix[i]) {
      return false;
    }
  }
  return true;
}

}  // namespace

std::string UriEncode(const std::string& value) {
  static const char kHex[] = "0123456789ABCDEF";
  std::string encoded;
  encoded.reserve(value.size());
  for (unsigned char c : value) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      encoded.push_back(static_cast<char>(c));
    } else {
      encoded.push_back('%');
      encoded.push_back(kHex[c >> 4]);
      encoded.push_back(kHex[c & 0x0F]);
    }
  }
  return encoded;
}

std::string BuildConnectionUri(const std::string& uri, const std::string& jwt) {
  if (jwt.empty()) {
    return uri;
  }
  const char separator = uri.find('?') == std::string::npos ? '?' : '&';
  return uri + separator + "token=" + UriEncode(jwt);
}

bool IsSecureUri(const std::string& uri) { return HasSchemePrefix(uri, "wss"); }

bool IsWebSocketUri(const std::string& uri) {
  return HasSchemePrefix(uri, "ws") || HasSchemePrefix(uri, "wss");
}

}  // namespace signaling
}  // namespace mesh
}  // namespace roomcast
