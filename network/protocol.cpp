#include "network/protocol.hpp"

#include <iomanip>
#include <sstream>

namespace ledger {
namespace network {
namespace protocol {

// Request helper methods
Request Request::get(const std::string& path, const std::string& request_id) {
  Request req;
  req.method = "GET";
  req.path = path;
  req.request_id = request_id;
  return req;
}

Request Request::post(const std::string& path, const nlohmann::json& body,
                      const std::string& request_id) {
  Request req;
  req.method = "POST";
  req.path = path;
  req.body = body;
  req.request_id = request_id;
  return req;
}

// Response helper methods
Response Response::success(const nlohmann::json& body) {
  Response resp;
  resp.status = status::OK;
  resp.body = body;
  return resp;
}

Response Response::error(int status, const std::string& kind, const std::string& message) {
  Response resp;
  resp.status = status;
  resp.error_kind = kind;
  resp.error_message = message;
  return resp;
}

int statusFor(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InvalidAmount:
    case ErrorKind::InvalidTransfer:
    case ErrorKind::InsufficientFunds:
    case ErrorKind::ConstraintViolation:
      return status::BAD_REQUEST;
    case ErrorKind::AccountNotFound:
      return status::NOT_FOUND;
    case ErrorKind::StorageTimeout:
    case ErrorKind::StorageFailure:
      return status::INTERNAL_ERROR;
  }
  return status::INTERNAL_ERROR;
}

// Serialization functions
std::string serializeRequest(const Request& request) {
  nlohmann::json j;
  j["method"] = request.method;
  j["path"] = request.path;
  j["body"] = request.body;
  j["request_id"] = request.request_id;
  return j.dump();
}

Request deserializeRequest(const std::string& json_str) {
  try {
    nlohmann::json j = nlohmann::json::parse(json_str);
    if (!j.is_object()) {
      throw ProtocolError("Request must be a JSON object");
    }

    Request req;
    req.method = j.at("method").get<std::string>();
    req.path = j.at("path").get<std::string>();
    if (j.contains("body") && !j["body"].is_null()) {
      if (!j["body"].is_object()) {
        throw ProtocolError("Request body must be a JSON object");
      }
      req.body = j["body"];
    }
    if (j.contains("request_id") && j["request_id"].is_string()) {
      req.request_id = j["request_id"].get<std::string>();
    }
    return req;
  } catch (const nlohmann::json::exception& e) {
    throw ProtocolError(std::string("Malformed request: ") + e.what());
  }
}

std::string serializeResponse(const Response& response) {
  nlohmann::json j;
  j["status"] = response.status;
  j["request_id"] = response.request_id;
  if (response.ok()) {
    j["body"] = response.body;
  } else {
    j["error"] = {{"kind", response.error_kind}, {"message", response.error_message}};
  }
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

Response deserializeResponse(const std::string& json_str) {
  try {
    nlohmann::json j = nlohmann::json::parse(json_str);
    Response resp;
    resp.status = j.at("status").get<int>();
    resp.request_id = j.value("request_id", "");
    if (j.contains("error")) {
      resp.error_kind = j["error"].at("kind").get<std::string>();
      resp.error_message = j["error"].value("message", "");
    } else if (j.contains("body")) {
      resp.body = j["body"];
    }
    return resp;
  } catch (const nlohmann::json::exception& e) {
    throw ProtocolError(std::string("Malformed response: ") + e.what());
  }
}

Money parseAmount(const nlohmann::json& value) {
  if (value.is_string()) {
    return Money::parse(value.get<std::string>());
  }
  if (value.is_number()) {
    // Numbers are read by their decimal text so 250.5 stays exactly 250.50.
    return Money::parse(value.dump());
  }
  throw LedgerError(ErrorKind::InvalidAmount, "Amount must be a decimal string or number");
}

// Entity conversions
nlohmann::json toJson(const Transaction& txn) {
  nlohmann::json j;
  j["transactionId"] = txn.transaction_id;
  j["accountId"] = txn.account_id;
  j["type"] = toString(txn.type);
  j["amount"] = txn.amount.toString();
  j["timestamp"] = formatTimestamp(txn.timestamp);
  j["description"] = txn.description;
  if (!txn.reference_id.empty()) {
    j["referenceId"] = txn.reference_id;
  }
  return j;
}

nlohmann::json toJson(const AccountInfo& info) {
  nlohmann::json transactions = nlohmann::json::array();
  for (const auto& txn : info.recent_transactions) {
    transactions.push_back(toJson(txn));
  }

  nlohmann::json j;
  j["accountId"] = info.account.account_id;
  j["customerName"] = info.account.customer_name;
  j["balance"] = info.account.balance.toString();
  j["createdAt"] = formatTimestamp(info.account.created_at);
  j["recentTransactions"] = transactions;
  j["accumulatedInterest"] = info.accumulated_interest.toString();
  return j;
}

nlohmann::json toJson(const TransferReceipt& receipt) {
  nlohmann::json j;
  j["transferId"] = receipt.transfer_id;
  j["fromAccountId"] = receipt.from_account_id;
  j["toAccountId"] = receipt.to_account_id;
  j["amount"] = receipt.amount.toString();
  j["fromBalance"] = receipt.from_balance.toString();
  j["toBalance"] = receipt.to_balance.toString();
  j["timestamp"] = formatTimestamp(receipt.timestamp);
  return j;
}

nlohmann::json toJson(const InterestRecord& record) {
  nlohmann::json j;
  j["id"] = record.id;
  j["accountId"] = record.account_id;
  j["interestRate"] = record.interest_rate.toString();
  j["calculatedInterest"] = record.calculated_interest.toString();
  j["calculationDate"] = record.calculation_date;
  j["transactionId"] = record.transaction_id;
  j["calculatedAt"] = formatTimestamp(record.calculated_at);
  return j;
}

nlohmann::json toJson(const AccrualSummary& summary) {
  nlohmann::json j;
  j["calculationDate"] = summary.calculation_date;
  j["accountsScanned"] = summary.accounts_scanned;
  j["accountsCredited"] = summary.accounts_credited;
  j["alreadyAccrued"] = summary.already_accrued;
  j["skipped"] = summary.skipped;
  j["failed"] = summary.failed;
  j["totalInterest"] = summary.total_interest.toString();
  return j;
}

nlohmann::json toJson(const ReconciliationReport& report) {
  nlohmann::json j;
  j["accountId"] = report.account_id;
  j["openingBalance"] = report.opening_balance.toString();
  j["ledgerSum"] = report.ledger_sum.toString();
  j["balance"] = report.balance.toString();
  j["transactionCount"] = report.transaction_count;
  j["balanced"] = report.balanced;
  return j;
}

// Message framing implementation
std::string MessageFramer::frameMessage(const std::string& message) {
  std::stringstream ss;
  ss << std::setw(kHeaderSize) << std::setfill('0') << std::hex << message.size();
  ss << message;
  return ss.str();
}

bool MessageFramer::isCompleteMessage(const std::string& buffer) {
  if (buffer.size() < kHeaderSize) {
    return false;
  }
  return buffer.size() >= kHeaderSize + payloadSize(buffer);
}

std::optional<std::string> MessageFramer::extractMessage(std::string& buffer) {
  if (!isCompleteMessage(buffer)) {
    return std::nullopt;
  }

  size_t size = payloadSize(buffer);
  std::string message = buffer.substr(kHeaderSize, size);
  buffer.erase(0, kHeaderSize + size);
  return message;
}

size_t MessageFramer::payloadSize(const std::string& buffer) {
  size_t size = 0;
  for (size_t i = 0; i < kHeaderSize; ++i) {
    char c = buffer[i];
    size_t digit;
    if (c >= '0' && c <= '9') {
      digit = c - '0';
    } else if (c >= 'a' && c <= 'f') {
      digit = c - 'a' + 10;
    } else if (c >= 'A' && c <= 'F') {
      digit = c - 'A' + 10;
    } else {
      throw ProtocolError("Invalid frame header");
    }
    size = size * 16 + digit;
  }

  if (size > kMaxMessageSize) {
    throw ProtocolError("Frame of " + std::to_string(size) + " bytes exceeds limit");
  }
  return size;
}

}  // namespace protocol
}  // namespace network
}  // namespace ledger
