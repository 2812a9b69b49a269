#ifndef LEDGER_PROTOCOL_HPP_
#define LEDGER_PROTOCOL_HPP_

#include "account_query_facade.hpp"
#include "interest_accrual_engine.hpp"
#include "ledger_error.hpp"
#include "ledger_types.hpp"

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace ledger {
namespace network {
namespace protocol {

// Response status codes, HTTP numbering
namespace status {
constexpr int OK = 200;
constexpr int BAD_REQUEST = 400;
constexpr int NOT_FOUND = 404;
constexpr int INTERNAL_ERROR = 500;
constexpr int SERVICE_UNAVAILABLE = 503;
}  // namespace status

// Error kinds produced by the boundary itself
constexpr const char* kBadRequest = "BAD_REQUEST";
constexpr const char* kRouteNotFound = "ROUTE_NOT_FOUND";
constexpr const char* kServerBusy = "SERVER_BUSY";

/**
 * Malformed frame or request document.
 */
class ProtocolError : public std::runtime_error {
 public:
  explicit ProtocolError(const std::string& message) : std::runtime_error(message) {}
};

struct Request {
  std::string method;  // "GET" or "POST"
  std::string path;
  nlohmann::json body = nlohmann::json::object();
  std::string request_id;

  static Request get(const std::string& path, const std::string& request_id = "");
  static Request post(const std::string& path, const nlohmann::json& body,
                      const std::string& request_id = "");
};

struct Response {
  int status = status::OK;
  std::string request_id;
  nlohmann::json body;
  std::string error_kind;  // empty on success
  std::string error_message;

  bool ok() const { return error_kind.empty(); }

  static Response success(const nlohmann::json& body);
  static Response error(int status, const std::string& kind, const std::string& message);
};

/**
 * 400 for validation and business failures, 404 for AccountNotFound, 500 for
 * storage faults.
 */
int statusFor(ErrorKind kind);

// Serialization functions
std::string serializeRequest(const Request& request);
Request deserializeRequest(const std::string& json_str);

std::string serializeResponse(const Response& response);
Response deserializeResponse(const std::string& json_str);

/**
 * Reads a monetary amount given as a JSON string ("250.50") or number
 * (250.5). Throws LedgerError(InvalidAmount) for anything else.
 */
Money parseAmount(const nlohmann::json& value);

// Entity to response conversions
nlohmann::json toJson(const Transaction& txn);
nlohmann::json toJson(const AccountInfo& info);
nlohmann::json toJson(const TransferReceipt& receipt);
nlohmann::json toJson(const InterestRecord& record);
nlohmann::json toJson(const AccrualSummary& summary);
nlohmann::json toJson(const ReconciliationReport& report);

/**
 * Length-prefixed framing for TCP transport: 8 hex digits of payload size,
 * then the payload.
 */
class MessageFramer {
 public:
  static constexpr size_t kHeaderSize = 8;
  static constexpr size_t kMaxMessageSize = 1 << 20;

  static std::string frameMessage(const std::string& message);

  static bool isCompleteMessage(const std::string& buffer);

  /**
   * Remove the first complete message from `buffer` and return its payload,
   * or nullopt if the buffer holds only part of one. Throws ProtocolError on
   * a bad header.
   */
  static std::optional<std::string> extractMessage(std::string& buffer);

 private:
  static size_t payloadSize(const std::string& buffer);
};

}  // namespace protocol
}  // namespace network
}  // namespace ledger

#endif  // LEDGER_PROTOCOL_HPP_
