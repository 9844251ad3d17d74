#include <iostream>
#include <memory>
#include <string>
#include <utility>

#include "config/json_config_loader.h"
#include "signaling/signaling_client.h"
#include "streaming_client/streaming_client_app.h"
#include "webrtc/libwebrtc_peer_connection.h"

// --- Main Application Entry Point ---

int main(int argc, char* argv[]) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <config_file_path>" << std::endl;
    return 1;
  }

  const std::string config_path = argv[1];

  // 1. Load Configuration
  auto loaded_config =
      roomcast::mesh::config::JsonConfigLoader::loadConfig(config_path);
  if (!loaded_config) {
    std::cerr << "Failed to load configuration from " << config_path
              << std::endl;
    return 1;
  }
  const roomcast::mesh::config::ClientConfig& app_config = *loaded_config;
  std::cout << "Configuration loaded successfully." << std::endl;

  // 2. Create Concrete Component Instances
  auto signaling_client = roomcast::mesh::signaling::CreateSignalingClient(
      app_config.signaling.uri, app_config.signaling.jwt);
  if (!signaling_client) {
    return 1;
  }

  auto connection_factory =
      roomcast::mesh::webrtc::LibwebrtcPeerConnectionFactory::Create();
  if (!connection_factory) {
    std::cerr << "Failed to create the WebRTC connection factory."
              << std::endl;
    return 1;
  }
  roomcast::mesh::webrtc::LibwebrtcPeerConnectionFactory* factory =
      connection_factory.get();
  const std::string stream_id = app_config.room.user_id + "-stream";
  auto local_stream_provider = [factory, stream_id]() {
    return factory->CreateLocalStream(stream_id);
  };

  // 3. Create and Initialize the Application with Dependencies
  roomcast::mesh::client::StreamingClientApp app;
  if (!app.init(app_config, std::move(signaling_client),
                std::move(connection_factory), local_stream_provider)) {
    std::cerr << "Failed to initialize streaming client application."
              << std::endl;
    return 1;
  }

  std::cout << "Streaming client initialized. Running..." << std::endl;

  // 4. Run the Application (delegates to event loop)
  int return_code = app.run();

  std::cout << "Streaming client stopped." << std::endl;
  return return_code;
}
