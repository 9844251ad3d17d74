#include "config/json_config_loader.h"

#include <cstdio>
#include <fstream>
#include <string>

#include <gtest/gtest.h>

namespace roomcast {
namespace mesh {
namespace config {
namespace {

const char kMinimal[] = R"({
  "signaling": {"uri": "wss://rooms.example.com/ws"},
  "room": {"room_id": "standup", "user_id": "alice"}
})";

TEST(JsonConfigLoaderTest, MinimalConfigGetsDefaults) {
  auto config = JsonConfigLoader::loadConfigFromString(kMinimal);
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->signaling.uri, "wss://rooms.example.com/ws");
  EXPECT_TRUE(config->signaling.jwt.empty());
  EXPECT_EQ(config->room.room_id, "standup");
  EXPECT_EQ(config->room.user_id, "alice");
  EXPECT_EQ(config->room.user_name, "alice");
  EXPECT_TRUE(config->ice_servers.empty());
  EXPECT_EQ(config->disconnect_grace_period_ms, 5000);
  EXPECT_EQ(config->max_ice_restarts, 0);
  EXPECT_FALSE(config->stream_on_join);
  EXPECT_EQ(config->keepalive_interval_ms, 25000);
}

TEST(JsonConfigLoaderTest, FullConfig) {
  auto config = JsonConfigLoader::loadConfigFromString(R"({
    "signaling": {"uri": "ws://localhost:8080/ws", "jwt": "token"},
    "room": {"room_id": "r1", "user_id": "bob", "user_name": "Bob"},
    "ice_servers": [
      {"urls": "stun:stun.example.org:3478"},
      {"urls": ["turn:turn.example.org:3478", "turns:turn.example.org:5349"],
       "username": "u", "credential": "c"}
    ],
    "disconnect_grace_period_ms": 1500,
    "max_ice_restarts": 3,
    "stream_on_join": true,
    "keepalive_interval_ms": 0
  })");
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->signaling.jwt, "token");
  EXPECT_EQ(config->room.user_name, "Bob");
  ASSERT_EQ(config->ice_servers.size(), 2u);
  EXPECT_EQ(config->ice_servers[0].urls.size(), 1u);
  EXPECT_EQ(config->ice_servers[1].urls.size(), 2u);
  EXPECT_EQ(config->ice_servers[1].username, "u");
  EXPECT_EQ(config->ice_servers[1].credential, "c");
  EXPECT_EQ(config->disconnect_grace_period_ms, 1500);
  EXPECT_EQ(config->max_ice_restarts, 3);
  EXPECT_TRUE(config->stream_on_join);
  EXPECT_EQ(config->keepalive_interval_ms, 0);
}

TEST(JsonConfigLoaderTest, RejectsMissingRequiredFields) {
  EXPECT_FALSE(JsonConfigLoader::loadConfigFromString(
      R"({"room": {"room_id": "r", "user_id": "a"}})"));
  EXPECT_FALSE(JsonConfigLoader::loadConfigFromString(
      R"({"signaling": {"uri": "ws://x"}, "room": {"room_id": "r"}})"));
  EXPECT_FALSE(JsonConfigLoader::loadConfigFromString(
      R"({"signaling": {"uri": ""}, "room": {"room_id": "r", "user_id": "a"}})"));
}

TEST(JsonConfigLoaderTest, RejectsWrongTypes) {
  EXPECT_FALSE(JsonConfigLoader::loadConfigFromString(R"({
    "signaling": {"uri": "ws://x"}, "room": {"room_id": "r", "user_id": "a"},
    "disconnect_grace_period_ms": -1})"));
  EXPECT_FALSE(JsonConfigLoader::loadConfigFromString(R"({
    "signaling": {"uri": "ws://x"}, "room": {"room_id": "r", "user_id": "a"},
    "stream_on_join": "yes"})"));
  EXPECT_FALSE(JsonConfigLoader::loadConfigFromString(R"({
    "signaling": {"uri": "ws://x"}, "room": {"room_id": "r", "user_id": "a"},
    "ice_servers": [{"urls": 42}]})"));
  EXPECT_FALSE(JsonConfigLoader::loadConfigFromString(R"({
    "signaling": {"uri": "ws://x"}, "room": {"room_id": 7, "user_id": "a"}})"));
}

TEST(JsonConfigLoaderTest, RejectsMalformedJson) {
  EXPECT_FALSE(JsonConfigLoader::loadConfigFromString("{\"signaling\": "));
  EXPECT_FALSE(JsonConfigLoader::loadConfigFromString("[]"));
}

TEST(JsonConfigLoaderTest, LoadsFromFile) {
  const std::string path = ::testing::TempDir() + "roomcast_config_test.json";
  {
    std::ofstream out(path);
    out << kMinimal;
  }
  auto config = JsonConfigLoader::loadConfig(path);
  std::remove(path.c_str());
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->room.room_id, "standup");
}

TEST(JsonConfigLoaderTest, MissingFileFails) {
  EXPECT_FALSE(JsonConfigLoader::loadConfig("/nonexistent/roomcast.json"));
}

}  // namespace
}  // namespace config
}  // namespace mesh
}  // namespace roomcast
