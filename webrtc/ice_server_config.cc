#include "webrtc/ice_server_config.h"

#include <iostream>

namespace roomcast {
namespace mesh {
namespace webrtc {

namespace {

bool StartsWith(const std::string& value, const std::string& prefix) {
  return value.compare(0, prefix.size(), prefix) == 0;
}

bool IsTurnUrl(const std::string& url) {
  return StartsWith(url, "turn:") || StartsWith(url, "turns:");
}

bool IsStunUrl(const std::string& url) {
  return StartsWith(url, "stun:") || StartsWith(url, "stuns:");
}

}  // anonymous namespace

IceConfigurationProvider::IceConfigurationProvider()
    : servers_(DefaultServers()) {}

IceConfigurationProvider::IceConfigurationProvider(
    const std::vector<IceServer>& servers) {
  for (const auto& server : servers) {
    std::string error;
    if (!Validate(server, &error)) {
      std::cerr << "IceConfigurationProvider: Dropping ICE server entry: "
                << error << std::endl;
      continue;
    }
    servers_.push_back(server);
  }

  if (servers_.empty()) {
    std::cout << "IceConfigurationProvider: No usable ICE servers configured, "
                 "using defaults."
              << std::endl;
    servers_ = DefaultServers();
  } else if (servers_.size() == 1 && servers_.front().urls.size() == 1) {
    std::cout << "IceConfigurationProvider: Only one ICE endpoint configured; "
                 "connectivity has no fallback if it is unreachable."
              << std::endl;
  }
}

std::vector<IceServer> IceConfigurationProvider::DefaultServers() {
  IceServer primary;
  primary.urls.push_back("stun:stun.l.google.com:19302");
  IceServer secondary;
  secondary.urls.push_back("stun:stun1.l.google.com:19302");
  return {primary, secondary};
}

bool IceConfigurationProvider::Validate(const IceServer& server,
                                        std::string* error) {
  if (server.urls.empty()) {
    if (error) *error = "entry has no urls";
    return false;
  }
  for (const auto& url : server.urls) {
    if (IsStunUrl(url)) {
      continue;
    }
    if (IsTurnUrl(url)) {
      if (!server.hasCredentials()) {
        if (error) *error = "TURN url " + url + " requires username and credential";
        return false;
      }
      continue;
    }
    if (error) *error = "unsupported url scheme: " + url;
    return false;
  }
  return true;
}

}  // namespace webrtc
}  // namespace mesh
}  // namespace roomcast
