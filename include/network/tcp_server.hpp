#ifndef LEDGER_TCP_SERVER_HPP_
#define LEDGER_TCP_SERVER_HPP_

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace ledger {
namespace network {

/**
 * Listener for the framed JSON protocol. Each connection gets a handler
 * thread that reads frames, passes every complete one to the request handler
 * and frames the returned document back, in order.
 */
class TCPServer {
 public:
  using RequestHandler = std::function<std::string(const std::string&)>;

  struct Options {
    int port = 0;  // 0 picks a free port, readable through getPort()
    // Connections past this are answered with SERVER_BUSY and closed.
    size_t max_connections = 64;
    // A connection that sends nothing for this long is closed; 0 never.
    std::chrono::milliseconds idle_timeout{0};
  };

  TCPServer(const Options& options, RequestHandler handler);
  ~TCPServer();

  TCPServer(const TCPServer&) = delete;
  TCPServer& operator=(const TCPServer&) = delete;

  bool start();

  /**
   * Stop accepting, shut down open connections and join their threads.
   * Safe to call more than once.
   */
  void stop();

  bool isRunning() const { return running_.load(); }
  int getPort() const { return options_.port; }
  size_t getConnectionCount() const;

 private:
  struct Connection {
    int socket = -1;
    std::string peer;
    std::thread thread;
    std::atomic<bool> finished{false};
  };

  bool openListener();
  void acceptLoop();
  void serve(Connection* connection);
  void rejectBusy(int socket, const std::string& peer);
  void applyIdleTimeout(int socket) const;
  static bool sendAll(int socket, const std::string& data);
  void reapFinished();

  Options options_;
  int listen_socket_;
  RequestHandler request_handler_;
  std::atomic<bool> running_;
  std::unique_ptr<std::thread> accept_thread_;
  std::unordered_map<uint64_t, std::unique_ptr<Connection>> connections_;
  uint64_t next_connection_id_;
  mutable std::mutex connections_mutex_;
};

}  // namespace network
}  // namespace ledger

#endif  // LEDGER_TCP_SERVER_HPP_
