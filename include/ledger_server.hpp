#ifndef LEDGER_SERVER_HPP_
#define LEDGER_SERVER_HPP_

#include "account_query_facade.hpp"
#include "account_service.hpp"
#include "interest_accrual_engine.hpp"
#include "network/protocol.hpp"
#include "network/tcp_server.hpp"
#include "transfer_coordinator.hpp"

#include <memory>
#include <string>
#include <vector>

namespace ledger {

/**
 * Boundary of the ledger: decodes requests, calls straight into the services
 * and encodes their results. This is the only place a LedgerError becomes a
 * response; storage faults are answered with a generic message and logged in
 * full.
 */
class LedgerServer {
 public:
  LedgerServer(const network::TCPServer::Options& transport, AccountService& accounts,
               TransferCoordinator& transfers, InterestAccrualEngine& interest,
               AccountQueryFacade& queries);
  ~LedgerServer();

  // Non-copyable
  LedgerServer(const LedgerServer&) = delete;
  LedgerServer& operator=(const LedgerServer&) = delete;

  bool start();
  void stop();

  struct Stats {
    bool is_running;
    size_t active_connections;
  };
  Stats getStats() const;

  int getPort() const { return tcp_server_->getPort(); }

  /**
   * Decode one request document, dispatch it and encode the response. Never
   * throws.
   */
  std::string handleMessage(const std::string& request_json);

  /**
   * Dispatch a decoded request. Never throws.
   */
  network::protocol::Response handleRequest(const network::protocol::Request& request);

 private:
  network::protocol::Response route(const network::protocol::Request& request);

  network::protocol::Response getAccountInfo(const std::string& account_id);
  network::protocol::Response deposit(const std::string& account_id, const nlohmann::json& body);
  network::protocol::Response withdraw(const std::string& account_id, const nlohmann::json& body);
  network::protocol::Response transfer(const nlohmann::json& body);
  network::protocol::Response calculateInterest(const nlohmann::json& body);
  network::protocol::Response getInterestHistory(const std::string& account_id);
  network::protocol::Response reconcile(const std::string& account_id);
  network::protocol::Response health();
  network::protocol::Response exportMetrics();

  network::protocol::Response errorResponse(const LedgerError& e,
                                            const network::protocol::Request& request);

  AccountService& accounts_;
  TransferCoordinator& transfers_;
  InterestAccrualEngine& interest_;
  AccountQueryFacade& queries_;
  std::unique_ptr<network::TCPServer> tcp_server_;
};

}  // namespace ledger

#endif  // LEDGER_SERVER_HPP_
