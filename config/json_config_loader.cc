#include "config/json_config_loader.h"

#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>

#include <json/json.h>

namespace roomcast {
namespace mesh {
namespace config {

namespace {

// Each reader leaves *out untouched when the key is absent and returns false
// (with *error set) only for a missing required key or a wrong type.
bool ReadString(const Json::Value& obj, const char* key, bool required,
                std::string* out, std::string* error) {
  const Json::Value& value = obj[key];
  if (value.isNull()) {
    if (required) {
      *error = std::string("missing required field '") + key + "'";
      return false;
    }
    return true;
  }
  if (!value.isString()) {
    *error = std::string("field '") + key + "' must be a string";
    return false;
  }
  *out = value.asString();
  if (required && out->empty()) {
    *error = std::string("field '") + key + "' must not be empty";
    return false;
  }
  return true;
}

bool ReadInt(const Json::Value& obj, const char* key, int* out,
             std::string* error) {
  const Json::Value& value = obj[key];
  if (value.isNull()) {
    return true;
  }
  if (!value.isInt() || value.asInt() < 0) {
    *error = std::string("field '") + key + "' must be a non-negative integer";
    return false;
  }
  *out = value.asInt();
  return true;
}

bool ReadBool(const Json::Value& obj, const char* key, bool* out,
              std::string* error) {
  const Json::Value& value = obj[key];
  if (value.isNull()) {
    return true;
  }
  if (!value.isBool()) {
    *error = std::string("field '") + key + "' must be a boolean";
    return false;
  }
  *out = value.asBool();
  return true;
}

bool ReadIceServer(const Json::Value& entry, ClientConfig::IceServer* server,
                   std::string* error) {
  if (!entry.isObject()) {
    *error = "ice_servers entries must be objects";
    return false;
  }
  const Json::Value& urls = entry["urls"];
  if (urls.isString()) {
    server->urls.push_back(urls.asString());
  } else if (urls.isArray()) {
    for (const Json::Value& url : urls) {
      if (!url.isString()) {
        *error = "ice_servers urls must be strings";
        return false;
      }
      server->urls.push_back(url.asString());
    }
  } else {
    *error = "ice_servers entry needs 'urls' (string or array)";
    return false;
  }
  return ReadString(entry, "username", false, &server->username, error) &&
         ReadString(entry, "credential", false, &server->credential, error);
}

bool ParseConfig(const Json::Value& root, ClientConfig* config,
                 std::string* error) {
  if (!root.isObject()) {
    *error = "top level must be an object";
    return false;
  }

  const Json::Value& signaling = root["signaling"];
  if (!signaling.isObject()) {
    *error = "missing required object 'signaling'";
    return false;
  }
  if (!ReadString(signaling, "uri", true, &config->signaling.uri, error) ||
      !ReadString(signaling, "jwt", false, &config->signaling.jwt, error)) {
    return false;
  }

  const Json::Value& room = root["room"];
  if (!room.isObject()) {
    *error = "missing required object 'room'";
    return false;
  }
  if (!ReadString(room, "room_id", true, &config->room.room_id, error) ||
      !ReadString(room, "user_id", true, &config->room.user_id, error) ||
      !ReadString(room, "user_name", false, &config->room.user_name, error)) {
    return false;
  }
  if (config->room.user_name.empty()) {
    config->room.user_name = config->room.user_id;
  }

  const Json::Value& ice_servers = root["ice_servers"];
  if (!ice_servers.isNull()) {
    if (!ice_servers.isArray()) {
      *error = "field 'ice_servers' must be an array";
      return false;
    }
    for (const Json::Value& entry : ice_servers) {
      ClientConfig::IceServer server;
      if (!ReadIceServer(entry, &server, error)) {
        return false;
      }
      config->ice_servers.push_back(server);
    }
  }

  return ReadInt(root, "disconnect_grace_period_ms",
                 &config->disconnect_grace_period_ms, error) &&
         ReadInt(root, "max_ice_restarts", &config->max_ice_restarts, error) &&
         ReadBool(root, "stream_on_join", &config->stream_on_join, error) &&
         ReadInt(root, "keepalive_interval_ms", &config->keepalive_interval_ms,
                 error);
}

}  // namespace

std::optional<ClientConfig> JsonConfigLoader::loadConfig(
    const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    std::cerr << "JsonConfigLoader: Cannot open config file " << path << "."
              << std::endl;
    return std::nullopt;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  std::cout << "JsonConfigLoader: Loading config from " << path << "."
            << std::endl;
  return loadConfigFromString(buffer.str());
}

std::optional<ClientConfig> JsonConfigLoader::loadConfigFromString(
    const std::string& text) {
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value root;
  std::string errors;
  if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
    std::cerr << "JsonConfigLoader: Invalid JSON: " << errors << std::endl;
    return std::nullopt;
  }

  ClientConfig config;
  std::string error;
  try {
    if (!ParseConfig(root, &config, &error)) {
      std::cerr << "JsonConfigLoader: Invalid config: " << error << "."
                << std::endl;
      return std::nullopt;
    }
  } catch (const Json::Exception& e) {
    std::cerr << "JsonConfigLoader: Invalid config: " << e.what() << std::endl;
    return std::nullopt;
  }
  return config;
}

}  // namespace config
}  // namespace mesh
}  // namespace roomcast
