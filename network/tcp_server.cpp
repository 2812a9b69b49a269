#include "network/tcp_server.hpp"
#include "network/protocol.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>
#include <vector>

namespace ledger {
namespace network {

namespace {

std::string errnoText(const std::string& what) {
  return what + ": " + std::strerror(errno);
}

std::string peerName(const sockaddr_in& address) {
  char ip[INET_ADDRSTRLEN];
  inet_ntop(AF_INET, &address.sin_addr, ip, INET_ADDRSTRLEN);
  return std::string(ip) + ":" + std::to_string(ntohs(address.sin_port));
}

}  // namespace

TCPServer::TCPServer(const Options& options, RequestHandler handler)
    : options_(options),
      listen_socket_(-1),
      request_handler_(std::move(handler)),
      running_(false),
      next_connection_id_(1) {
}

TCPServer::~TCPServer() {
  stop();
}

bool TCPServer::openListener() {
  listen_socket_ = socket(AF_INET, SOCK_STREAM, 0);
  if (listen_socket_ < 0) {
    LEDGER_LOG_ERROR(errnoText("Failed to create socket"));
    return false;
  }

  int reuse = 1;
  if (setsockopt(listen_socket_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
    LEDGER_LOG_ERROR(errnoText("Failed to set SO_REUSEADDR"));
    return false;
  }

  sockaddr_in address;
  std::memset(&address, 0, sizeof(address));
  address.sin_family = AF_INET;
  address.sin_addr.s_addr = INADDR_ANY;
  address.sin_port = htons(static_cast<uint16_t>(options_.port));

  if (bind(listen_socket_, reinterpret_cast<sockaddr*>(&address), sizeof(address)) < 0) {
    LEDGER_LOG_ERROR(errnoText("Failed to bind port " + std::to_string(options_.port)));
    return false;
  }
  if (listen(listen_socket_, SOMAXCONN) < 0) {
    LEDGER_LOG_ERROR(errnoText("Failed to listen"));
    return false;
  }

  socklen_t address_len = sizeof(address);
  if (getsockname(listen_socket_, reinterpret_cast<sockaddr*>(&address), &address_len) == 0) {
    options_.port = ntohs(address.sin_port);
  }
  return true;
}

bool TCPServer::start() {
  if (running_) return true;

  if (!openListener()) {
    if (listen_socket_ >= 0) {
      close(listen_socket_);
      listen_socket_ = -1;
    }
    return false;
  }

  running_ = true;
  accept_thread_ = std::make_unique<std::thread>(&TCPServer::acceptLoop, this);

  LEDGER_LOG_EVENT(observability::LogLevel::INFO, "TCP server listening")
      .field("port", options_.port)
      .field("max_connections", options_.max_connections)
      .field("idle_timeout_ms", static_cast<int64_t>(options_.idle_timeout.count()));
  return true;
}

void TCPServer::stop() {
  if (!running_.exchange(false)) return;

  // Closing the listener breaks the accept loop
  if (listen_socket_ >= 0) {
    shutdown(listen_socket_, SHUT_RDWR);
    close(listen_socket_);
    listen_socket_ = -1;
  }
  if (accept_thread_ && accept_thread_->joinable()) {
    accept_thread_->join();
  }
  accept_thread_.reset();

  // Unblock reads under the lock, join outside it
  std::unordered_map<uint64_t, std::unique_ptr<Connection>> connections;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (auto& entry : connections_) {
      if (entry.second->socket >= 0) {
        shutdown(entry.second->socket, SHUT_RDWR);
      }
    }
    connections.swap(connections_);
  }
  for (auto& entry : connections) {
    if (entry.second->thread.joinable()) {
      entry.second->thread.join();
    }
  }

  LEDGER_LOG_INFO("TCP server stopped");
}

void TCPServer::acceptLoop() {
  auto& metrics = observability::getGlobalMetrics();

  while (running_) {
    sockaddr_in peer_address;
    socklen_t peer_len = sizeof(peer_address);
    int client_socket =
        accept(listen_socket_, reinterpret_cast<sockaddr*>(&peer_address), &peer_len);
    if (client_socket < 0) {
      if (running_ && errno != EINTR) {
        LEDGER_LOG_WARN(errnoText("Failed to accept connection"));
      }
      continue;
    }

    std::string peer = peerName(peer_address);
    reapFinished();

    std::lock_guard<std::mutex> lock(connections_mutex_);
    if (!running_) {
      close(client_socket);
      break;
    }
    size_t open = 0;
    for (const auto& entry : connections_) {
      if (!entry.second->finished) ++open;
    }
    if (open >= options_.max_connections) {
      rejectBusy(client_socket, peer);
      continue;
    }

    applyIdleTimeout(client_socket);
    auto connection = std::make_unique<Connection>();
    connection->socket = client_socket;
    connection->peer = peer;
    Connection* raw = connection.get();
    connections_[next_connection_id_++] = std::move(connection);
    raw->thread = std::thread(&TCPServer::serve, this, raw);

    metrics.incrementCounter("ledger_connections_total");
    metrics.addGauge("ledger_active_connections", 1);
    LEDGER_LOG_DEBUG("Accepted connection from " + peer);
  }
}

void TCPServer::rejectBusy(int socket, const std::string& peer) {
  LEDGER_LOG_EVENT(observability::LogLevel::WARN, "Connection limit reached")
      .field("peer", peer)
      .field("max_connections", options_.max_connections);

  auto busy = protocol::Response::error(protocol::status::SERVICE_UNAVAILABLE,
                                        protocol::kServerBusy,
                                        "Too many open connections, retry later");
  sendAll(socket, protocol::MessageFramer::frameMessage(protocol::serializeResponse(busy)));
  close(socket);
  observability::getGlobalMetrics().incrementCounter(
      "ledger_requests_total", {{"status", std::to_string(busy.status)}});
}

void TCPServer::applyIdleTimeout(int socket) const {
  if (options_.idle_timeout.count() <= 0) return;

  timeval timeout;
  timeout.tv_sec = static_cast<time_t>(options_.idle_timeout.count() / 1000);
  timeout.tv_usec = static_cast<suseconds_t>((options_.idle_timeout.count() % 1000) * 1000);
  if (setsockopt(socket, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) < 0) {
    LEDGER_LOG_WARN(errnoText("Failed to set idle timeout"));
  }
}

void TCPServer::serve(Connection* connection) {
  char chunk[4096];
  std::string pending;
  bool open = true;

  while (open && running_) {
    ssize_t n = read(connection->socket, chunk, sizeof(chunk));
    if (n < 0 && errno == EINTR) continue;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      LEDGER_LOG_DEBUG("Closing idle connection from " + connection->peer);
      break;
    }
    if (n <= 0) {
      if (n < 0 && running_) {
        LEDGER_LOG_WARN(errnoText("Read failed for " + connection->peer));
      }
      break;
    }

    pending.append(chunk, static_cast<size_t>(n));

    try {
      while (auto request_json = protocol::MessageFramer::extractMessage(pending)) {
        std::string response_json = request_handler_(*request_json);
        if (!sendAll(connection->socket, protocol::MessageFramer::frameMessage(response_json))) {
          LEDGER_LOG_WARN("Write failed for " + connection->peer);
          open = false;
          break;
        }
      }
    } catch (const protocol::ProtocolError& e) {
      // No way to find the next frame after a bad header
      LEDGER_LOG_WARN("Dropping " + connection->peer + ": " + e.what());
      auto rejected =
          protocol::Response::error(protocol::status::BAD_REQUEST, protocol::kBadRequest, e.what());
      sendAll(connection->socket,
              protocol::MessageFramer::frameMessage(protocol::serializeResponse(rejected)));
      open = false;
    }
  }

  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    close(connection->socket);
    connection->socket = -1;
  }
  observability::getGlobalMetrics().addGauge("ledger_active_connections", -1);
  LEDGER_LOG_DEBUG("Closed connection from " + connection->peer);
  connection->finished = true;
}

bool TCPServer::sendAll(int socket, const std::string& data) {
  size_t sent = 0;
  while (sent < data.size()) {
    ssize_t n = send(socket, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    sent += static_cast<size_t>(n);
  }
  return true;
}

void TCPServer::reapFinished() {
  std::vector<std::unique_ptr<Connection>> finished;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (auto it = connections_.begin(); it != connections_.end();) {
      if (it->second->finished) {
        finished.push_back(std::move(it->second));
        it = connections_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& connection : finished) {
    if (connection->thread.joinable()) {
      connection->thread.join();
    }
  }
}

size_t TCPServer::getConnectionCount() const {
  std::lock_guard<std::mutex> lock(connections_mutex_);
  size_t open = 0;
  for (const auto& entry : connections_) {
    if (!entry.second->finished) ++open;
  }
  return open;
}

}  // namespace network
}  // namespace ledger
