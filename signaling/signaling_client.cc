#include "signaling/signaling_client.h"

#include <atomic>
#include <deque>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>

#include <absl/base/thread_annotations.h>
#include <boost/asio/ssl.hpp>
#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_client.hpp>
#include <websocketpp/config/asio_no_tls_client.hpp>

#include "signaling/signaling_message.h"
#include "signaling/uri_util.h"

namespace roomcast {
namespace mesh {
namespace signaling {

namespace {

using connection_hdl = websocketpp::connection_hdl;
using websocketpp::lib::bind;
using websocketpp::lib::placeholders::_1;
using websocketpp::lib::placeholders::_2;

// --- SignalingClientImpl (Concrete implementation) ---
// Config is websocketpp::config::asio_client (ws://) or asio_tls_client
// (wss://). All websocketpp handlers run on asioThread_.
template <typename Config>
class SignalingClientImpl : public SignalingClient {
 public:
  using client = websocketpp::client<Config>;
  using message_ptr = typename client::message_ptr;

  static constexpr bool kIsTls =
      std::is_same<typename Config::transport_type,
                   websocketpp::transport::asio::tls_client>::value;

  SignalingClientImpl(const std::string& uri, const std::string& jwt)
      : SignalingClient(uri, jwt), isRunning_(false) {
    std::cout << "SignalingClientImpl created." << std::endl;
    wsClient_.set_access_channels(websocketpp::log::alevel::connect |
                                  websocketpp::log::alevel::disconnect);
    wsClient_.set_error_channels(websocketpp::log::elevel::warn |
                                 websocketpp::log::elevel::rerror |
                                 websocketpp::log::elevel::fatal);

    wsClient_.init_asio();

    wsClient_.set_open_handler(bind(&SignalingClientImpl::onOpen, this, _1));
    wsClient_.set_message_handler(
        bind(&SignalingClientImpl::onMessage, this, _1, _2));
    wsClient_.set_close_handler(bind(&SignalingClientImpl::onClose, this, _1));
    wsClient_.set_fail_handler(bind(&SignalingClientImpl::onFail, this, _1));

    if constexpr (kIsTls) {
      wsClient_.set_tls_init_handler(
          bind(&SignalingClientImpl::onTlsInit, this, _1));
    }
  }

  ~SignalingClientImpl() override {
    std::cout << "SignalingClientImpl destroying." << std::endl;
    disconnect();
  }

  // --- Public Interface Implementation ---

  void connect() override {
    if (isRunning_) {
      std::cout << "SignalingClientImpl: Already running/connecting. Ignoring "
                   "connect call."
                << std::endl;
      return;
    }
    if (asioThread_.joinable()) {
      // A previous connection ended on its own; reap its thread first.
      asioThread_.join();
      wsClient_.reset();
    }
    std::cout << "SignalingClientImpl: Initiating connection to " << uri_
              << std::endl;

    websocketpp::lib::error_code ec;
    const std::string connection_uri = BuildConnectionUri(uri_, jwt_);
    typename client::connection_ptr con =
        wsClient_.get_connection(connection_uri, ec);
    if (ec) {
      std::cerr << "SignalingClientImpl Error: Could not create connection: "
                << ec.message() << std::endl;
      if (onErrorHandler_) {
        onErrorHandler_("Could not create connection: " + ec.message());
      }
      return;
    }

    connectionHdl_ = con->get_handle();
    wsClient_.connect(con);

    isRunning_ = true;
    asioThread_ = std::thread([this]() {
      std::cout << "SignalingClientImpl: Asio thread started." << std::endl;
      wsClient_.run();
      std::cout << "SignalingClientImpl: Asio thread finished running."
                << std::endl;
      isRunning_ = false;
    });
  }

  void disconnect() override {
    if (!asioThread_.joinable()) {
      return;
    }
    std::cout << "SignalingClientImpl: Initiating disconnection." << std::endl;

    websocketpp::lib::error_code ec;
    typename client::connection_ptr con =
        wsClient_.get_con_from_hdl(connectionHdl_, ec);
    if (!ec && con &&
        con->get_state() == websocketpp::session::state::open) {
      std::cout << "SignalingClientImpl: Sending close frame." << std::endl;
      wsClient_.close(connectionHdl_, websocketpp::close::status::going_away,
                      "Client disconnecting", ec);
      if (ec) {
        std::cerr << "SignalingClientImpl Error: Failed to send close frame: "
                  << ec.message() << std::endl;
      }
    }

    wsClient_.stop();
    asioThread_.join();
    isRunning_ = false;
    {
      std::lock_guard<std::mutex> lock(queueMutex_);
      open_ = false;
      pending_.clear();
    }
    std::cout << "SignalingClientImpl: Disconnect complete." << std::endl;
  }

  void sendSignal(const SignalMessage& message) override {
    std::string payload = SerializeSignalMessage(message);
    {
      std::lock_guard<std::mutex> lock(queueMutex_);
      if (!open_) {
        pending_.push_back(std::move(payload));
        return;
      }
    }
    sendPayload(payload);
  }

  // --- Callback Setters ---
  void onConnected(OnConnectedHandler handler) override {
    onConnectedHandler_ = std::move(handler);
  }
  void onDisconnected(OnDisconnectedHandler handler) override {
    onDisconnectedHandler_ = std::move(handler);
  }
  void onError(OnErrorHandler handler) override {
    onErrorHandler_ = std::move(handler);
  }
  void onMessageReceived(OnMessageReceivedHandler handler) override {
    onMessageReceivedHandler_ = std::move(handler);
  }

 private:
  void sendPayload(const std::string& payload) {
    websocketpp::lib::error_code ec;
    wsClient_.send(connectionHdl_, payload, websocketpp::frame::opcode::text,
                   ec);
    if (ec) {
      std::cerr << "SignalingClientImpl Error: Failed to send message: "
                << ec.message() << std::endl;
      if (onErrorHandler_) {
        onErrorHandler_("Failed to send message: " + ec.message());
      }
    }
  }

  // --- Internal websocketpp handlers (called on the Asio thread) ---

  void onOpen(connection_hdl hdl) {
    std::cout << "SignalingClientImpl: Connection opened successfully."
              << std::endl;
    connectionHdl_ = hdl;

    std::deque<std::string> queued;
    {
      std::lock_guard<std::mutex> lock(queueMutex_);
      open_ = true;
      queued.swap(pending_);
    }
    if (!queued.empty()) {
      std::cout << "SignalingClientImpl: Flushing " << queued.size()
                << " queued messages." << std::endl;
    }
    for (const std::string& payload : queued) {
      sendPayload(payload);
    }

    if (onConnectedHandler_) {
      onConnectedHandler_();
    }
  }

  void onMessage(connection_hdl /*hdl*/, message_ptr msg) {
    auto signalMessage = DeserializeSignalMessage(msg->get_payload());
    if (!signalMessage) {
      std::cerr << "SignalingClientImpl Error: Failed to deserialize received "
                   "message payload."
                << std::endl;
      if (onErrorHandler_) {
        onErrorHandler_("Failed to parse received message.");
      }
      return;
    }
    if (onMessageReceivedHandler_) {
      onMessageReceivedHandler_(*signalMessage);
    }
  }

  void onClose(connection_hdl /*hdl*/) {
    std::cout << "SignalingClientImpl: Connection closed." << std::endl;
    {
      std::lock_guard<std::mutex> lock(queueMutex_);
      open_ = false;
    }
    if (onDisconnectedHandler_) {
      onDisconnectedHandler_();
    }
  }

  // The connection never opened, so onClose will not follow.
  void onFail(connection_hdl hdl) {
    websocketpp::lib::error_code ec;
    typename client::connection_ptr con = wsClient_.get_con_from_hdl(hdl, ec);
    std::string error_msg = "Connection handshake failed";
    if (con) {
      error_msg += ": " + con->get_ec().message();
    } else if (ec) {
      error_msg += ": (handle error) " + ec.message();
    }
    std::cerr << "SignalingClientImpl Error: " << error_msg << std::endl;

    if (onErrorHandler_) {
      onErrorHandler_(error_msg);
    }
    if (onDisconnectedHandler_) {
      onDisconnectedHandler_();
    }
  }

  // Verifies the server certificate against the system trust store and the
  // host name being connected to.
  websocketpp::lib::shared_ptr<boost::asio::ssl::context> onTlsInit(
      connection_hdl hdl) {
    std::cout << "SignalingClientImpl: Performing TLS initialization."
              << std::endl;
    auto ssl_context = websocketpp::lib::make_shared<boost::asio::ssl::context>(
        boost::asio::ssl::context::tlsv12_client);

    boost::system::error_code ec;
    ssl_context->set_options(boost::asio::ssl::context::default_workarounds |
                                 boost::asio::ssl::context::no_sslv2 |
                                 boost::asio::ssl::context::no_sslv3 |
                                 boost::asio::ssl::context::no_tlsv1 |
                                 boost::asio::ssl::context::no_tlsv1_1 |
                                 boost::asio::ssl::context::single_dh_use,
                             ec);
    if (!ec) {
      ssl_context->set_default_verify_paths(ec);
    }
    if (!ec) {
      ssl_context->set_verify_mode(boost::asio::ssl::verify_peer, ec);
    }
    if (ec) {
      std::cerr << "SignalingClientImpl Error: TLS context setup failed: "
                << ec.message() << std::endl;
      return ssl_context;
    }

    websocketpp::lib::error_code hdl_ec;
    typename client::connection_ptr con =
        wsClient_.get_con_from_hdl(hdl, hdl_ec);
    if (con) {
      ssl_context->set_verify_callback(
          boost::asio::ssl::host_name_verification(con->get_host()));
    }
    return ssl_context;
  }

  client wsClient_;
  connection_hdl connectionHdl_;

  std::atomic<bool> isRunning_;
  std::thread asioThread_;

  std::mutex queueMutex_;
  bool open_ ABSL_GUARDED_BY(queueMutex_) = false;
  // Serialized messages sent before the connection opened.
  std::deque<std::string> pending_ ABSL_GUARDED_BY(queueMutex_);

  SignalingClientImpl(const SignalingClientImpl&) = delete;
  SignalingClientImpl& operator=(const SignalingClientImpl&) = delete;
};

}  // namespace

std::unique_ptr<SignalingClient> CreateSignalingClient(const std::string& uri,
                                                       const std::string& jwt) {
  if (!IsWebSocketUri(uri)) {
    std::cerr << "SignalingClient: Unsupported URI '" << uri
              << "', expected ws:// or wss://." << std::endl;
    return nullptr;
  }
  if (IsSecureUri(uri)) {
    return std::make_unique<
        SignalingClientImpl<websocketpp::config::asio_tls_client>>(uri, jwt);
  }
  return std::make_unique<SignalingClientImpl<websocketpp::config::asio_client>>(
      uri, jwt);
}

}  // namespace signaling
}  // namespace mesh
}  // namespace roomcast
