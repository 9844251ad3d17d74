#include "webrtc/connection_registry.h"

#include <iostream>
#include <utility>

namespace roomcast {
namespace mesh {
namespace webrtc {

// --- PeerSession ---

PeerSession::PeerSession(std::string remote_id,
                         boost::asio::io_context& io_context,
                         const HealthMonitorConfig& health_config)
    : remote_id_(std::move(remote_id)),
      health_(health_config),
      grace_timer_(io_context) {}

PeerSession::~PeerSession() { close(); }

void PeerSession::setConnection(std::shared_ptr<IPeerConnection> connection) {
  connection_ = std::move(connection);
}

uint64_t PeerSession::armGraceTimer(std::chrono::milliseconds period) {
  grace_timer_.expires_after(period);
  return ++grace_generation_;
}

void PeerSession::cancelGraceTimer() {
  ++grace_generation_;
  grace_timer_.cancel();
}

void PeerSession::close() {
  if (closed_) {
    return;
  }
  closed_ = true;
  cancelGraceTimer();
  if (connection_) {
    connection_->Close();
  }
}

bool PeerSession::markEnded() {
  if (ended_) {
    return false;
  }
  ended_ = true;
  return true;
}

// --- ConnectionRegistry ---

ConnectionRegistry::ConnectionRegistry(SessionFactory factory)
    : factory_(std::move(factory)) {}

ConnectionRegistry::~ConnectionRegistry() {
  for (auto& session : takeAll()) {
    session->close();
  }
}

void ConnectionRegistry::onSessionCreated(SessionCreatedHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  onSessionCreatedHandler_ = std::move(handler);
}

std::shared_ptr<PeerSession> ConnectionRegistry::getOrCreate(
    const std::string& remote_id, bool* created) {
  if (created) *created = false;

  // Creation, binding and insertion all happen under one lock so that a
  // concurrent lookup never sees a half-built entry.
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(remote_id);
  if (it != sessions_.end()) {
    return it->second;
  }

  std::shared_ptr<PeerSession> session = factory_ ? factory_(remote_id) : nullptr;
  if (!session || !session->hasConnection()) {
    std::cerr << "ConnectionRegistry: Failed to create connection for "
              << remote_id << "." << std::endl;
    return nullptr;
  }

  if (onSessionCreatedHandler_) {
    onSessionCreatedHandler_(*session);
  }
  sessions_.emplace(remote_id, session);
  if (created) *created = true;
  std::cout << "ConnectionRegistry: Created connection for " << remote_id
            << " (" << sessions_.size() << " total)." << std::endl;
  return session;
}

std::shared_ptr<PeerSession> ConnectionRegistry::get(
    const std::string& remote_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(remote_id);
  if (it == sessions_.end()) {
    return nullptr;
  }
  return it->second;
}

bool ConnectionRegistry::remove(const std::string& remote_id) {
  std::shared_ptr<PeerSession> session = take(remote_id);
  if (!session) {
    return false;
  }
  // Outside the lock: Close() may report state changes synchronously.
  session->close();
  return true;
}

std::shared_ptr<PeerSession> ConnectionRegistry::take(
    const std::string& remote_id, const PeerSession* expected) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(remote_id);
  if (it == sessions_.end()) {
    return nullptr;
  }
  if (expected && it->second.get() != expected) {
    return nullptr;
  }
  std::shared_ptr<PeerSession> session = std::move(it->second);
  sessions_.erase(it);
  return session;
}

std::vector<std::shared_ptr<PeerSession>> ConnectionRegistry::takeAll() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::shared_ptr<PeerSession>> taken;
  taken.reserve(sessions_.size());
  for (auto& entry : sessions_) {
    taken.push_back(std::move(entry.second));
  }
  sessions_.clear();
  return taken;
}

void ConnectionRegistry::forEach(
    const std::function<void(PeerSession& session)>& fn) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& entry : sessions_) {
    fn(*entry.second);
  }
}

bool ConnectionRegistry::contains(const std::string& remote_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.count(remote_id) > 0;
}

std::size_t ConnectionRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

std::vector<std::string> ConnectionRegistry::ids() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> result;
  result.reserve(sessions_.size());
  for (const auto& entry : sessions_) {
    result.push_back(entry.first);
  }
  return result;
}

}  // namespace webrtc
}  // namespace mesh
}  // namespace roomcast
