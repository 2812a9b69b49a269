#include "network/protocol.hpp"
#include "network/tcp_server.hpp"

#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <chrono>
#include <optional>
#include <string>
#include <thread>

using namespace ledger::network;
using namespace ledger::network::protocol;

namespace {

// Blocking client with a receive timeout so a broken server fails the test
// instead of hanging it.
class TestClient {
 public:
  explicit TestClient(int port) : socket_(socket(AF_INET, SOCK_STREAM, 0)) {
    timeval timeout{5, 0};
    setsockopt(socket_, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    connected_ = connect(socket_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
  }

  ~TestClient() {
    if (socket_ >= 0) close(socket_);
  }

  bool connected() const { return connected_; }

  bool sendRaw(const std::string& data) {
    return send(socket_, data.data(), data.size(), MSG_NOSIGNAL) ==
           static_cast<ssize_t>(data.size());
  }

  // Next framed document, or nullopt once the server closes the stream.
  std::optional<std::string> receive() {
    char chunk[1024];
    while (true) {
      if (auto message = MessageFramer::extractMessage(buffer_)) return message;
      ssize_t n = recv(socket_, chunk, sizeof(chunk), 0);
      if (n <= 0) return std::nullopt;
      buffer_.append(chunk, static_cast<size_t>(n));
    }
  }

 private:
  int socket_;
  bool connected_ = false;
  std::string buffer_;
};

std::string echo(const std::string& request) {
  return "{\"echo\":" + request + "}";
}

bool waitForConnections(const TCPServer& server, size_t expected) {
  for (int i = 0; i < 200; ++i) {
    if (server.getConnectionCount() == expected) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return false;
}

}  // namespace

TEST(TCPServerTest, AnswersEachFrameInOrder) {
  TCPServer server(TCPServer::Options{}, echo);
  ASSERT_TRUE(server.start());
  ASSERT_GT(server.getPort(), 0);

  TestClient client(server.getPort());
  ASSERT_TRUE(client.connected());

  // One frame split across writes, then two frames in one write
  std::string first = MessageFramer::frameMessage("{\"n\":1}");
  ASSERT_TRUE(client.sendRaw(first.substr(0, 5)));
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  ASSERT_TRUE(client.sendRaw(first.substr(5) + MessageFramer::frameMessage("{\"n\":2}") +
                             MessageFramer::frameMessage("{\"n\":3}")));

  for (int n = 1; n <= 3; ++n) {
    auto reply = client.receive();
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(nlohmann::json::parse(*reply)["echo"]["n"], n);
  }
}

TEST(TCPServerTest, BadHeaderGetsErrorAndClose) {
  TCPServer server(TCPServer::Options{}, echo);
  ASSERT_TRUE(server.start());

  TestClient client(server.getPort());
  ASSERT_TRUE(client.connected());
  ASSERT_TRUE(client.sendRaw("zzzzzzzz{}"));

  auto reply = client.receive();
  ASSERT_TRUE(reply.has_value());
  Response response = deserializeResponse(*reply);
  EXPECT_EQ(response.status, status::BAD_REQUEST);
  EXPECT_EQ(response.error_kind, kBadRequest);
  EXPECT_FALSE(client.receive().has_value());
}

TEST(TCPServerTest, RejectsConnectionsPastTheLimit) {
  TCPServer::Options options;
  options.max_connections = 1;
  TCPServer server(options, echo);
  ASSERT_TRUE(server.start());

  TestClient first(server.getPort());
  ASSERT_TRUE(first.connected());
  ASSERT_TRUE(waitForConnections(server, 1));

  TestClient second(server.getPort());
  ASSERT_TRUE(second.connected());
  auto reply = second.receive();
  ASSERT_TRUE(reply.has_value());
  Response busy = deserializeResponse(*reply);
  EXPECT_EQ(busy.status, status::SERVICE_UNAVAILABLE);
  EXPECT_EQ(busy.error_kind, kServerBusy);
  EXPECT_FALSE(second.receive().has_value());

  // The first connection is still served
  ASSERT_TRUE(first.sendRaw(MessageFramer::frameMessage("{\"n\":1}")));
  EXPECT_TRUE(first.receive().has_value());
}

TEST(TCPServerTest, ClosesIdleConnections) {
  TCPServer::Options options;
  options.idle_timeout = std::chrono::milliseconds(100);
  TCPServer server(options, echo);
  ASSERT_TRUE(server.start());

  TestClient client(server.getPort());
  ASSERT_TRUE(client.connected());
  EXPECT_FALSE(client.receive().has_value());
  EXPECT_TRUE(waitForConnections(server, 0));
}

TEST(TCPServerTest, StopClosesOpenConnections) {
  TCPServer server(TCPServer::Options{}, echo);
  ASSERT_TRUE(server.start());

  TestClient client(server.getPort());
  ASSERT_TRUE(client.connected());
  ASSERT_TRUE(waitForConnections(server, 1));

  server.stop();
  EXPECT_FALSE(server.isRunning());
  EXPECT_FALSE(client.receive().has_value());
  server.stop();
}
