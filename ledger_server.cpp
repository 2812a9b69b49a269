#include "ledger_server.hpp"

#include "ledger_error.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"

namespace ledger {

namespace protocol = network::protocol;

namespace {

std::vector<std::string> splitPath(const std::string& path) {
  std::vector<std::string> segments;
  size_t start = 0;
  while (start <= path.size()) {
    size_t end = path.find('/', start);
    if (end == std::string::npos) end = path.size();
    if (end > start) {
      segments.push_back(path.substr(start, end - start));
    }
    start = end + 1;
  }
  return segments;
}

std::string requireString(const nlohmann::json& body, const char* key) {
  auto it = body.find(key);
  if (it == body.end() || !it->is_string() || it->get<std::string>().empty()) {
    throw protocol::ProtocolError(std::string("Field '") + key + "' must be a non-empty string");
  }
  return it->get<std::string>();
}

Money amountField(const nlohmann::json& body) {
  auto it = body.find("amount");
  if (it == body.end() || it->is_null()) {
    throw LedgerError(ErrorKind::InvalidAmount, "Field 'amount' is required");
  }
  return protocol::parseAmount(*it);
}

protocol::Response routeNotFound(const protocol::Request& request) {
  return protocol::Response::error(protocol::status::NOT_FOUND, protocol::kRouteNotFound,
                                   "No route for " + request.method + " " + request.path);
}

}  // namespace

LedgerServer::LedgerServer(const network::TCPServer::Options& transport,
                           AccountService& accounts, TransferCoordinator& transfers,
                           InterestAccrualEngine& interest, AccountQueryFacade& queries)
    : accounts_(accounts), transfers_(transfers), interest_(interest), queries_(queries) {
  tcp_server_ = std::make_unique<network::TCPServer>(
      transport, [this](const std::string& request) { return handleMessage(request); });
}

LedgerServer::~LedgerServer() {
  stop();
}

bool LedgerServer::start() {
  if (!tcp_server_->start()) {
    LEDGER_LOG_ERROR("Failed to start TCP server");
    return false;
  }

  LEDGER_LOG_INFO("Ledger server started on port " + std::to_string(tcp_server_->getPort()));
  return true;
}

void LedgerServer::stop() {
  if (tcp_server_ && tcp_server_->isRunning()) {
    tcp_server_->stop();
    LEDGER_LOG_INFO("Ledger server stopped");
  }
}

LedgerServer::Stats LedgerServer::getStats() const {
  Stats stats;
  stats.is_running = tcp_server_->isRunning();
  stats.active_connections = tcp_server_->getConnectionCount();
  return stats;
}

std::string LedgerServer::handleMessage(const std::string& request_json) {
  protocol::Response response;
  try {
    response = handleRequest(protocol::deserializeRequest(request_json));
  } catch (const protocol::ProtocolError& e) {
    response = protocol::Response::error(protocol::status::BAD_REQUEST, protocol::kBadRequest,
                                         e.what());
  }
  observability::getGlobalMetrics().incrementCounter(
      "ledger_requests_total", {{"status", std::to_string(response.status)}});
  return protocol::serializeResponse(response);
}

protocol::Response LedgerServer::handleRequest(const protocol::Request& request) {
  auto& metrics = observability::getGlobalMetrics();
  observability::MetricsCollector::Timer timer(metrics, "ledger_request_duration_seconds");

  protocol::Response response;
  try {
    response = route(request);
  } catch (const LedgerError& e) {
    response = errorResponse(e, request);
  } catch (const protocol::ProtocolError& e) {
    response = protocol::Response::error(protocol::status::BAD_REQUEST, protocol::kBadRequest,
                                         e.what());
  } catch (const std::exception& e) {
    observability::LogEvent(observability::LogLevel::ERROR, "Unhandled error",
                            "ledger_server", request.request_id)
        .field("method", request.method)
        .field("path", request.path)
        .field("reason", e.what());
    response = protocol::Response::error(protocol::status::INTERNAL_ERROR,
                                         errorKindName(ErrorKind::StorageFailure),
                                         "Internal storage error");
  }

  response.request_id = request.request_id;
  return response;
}

protocol::Response LedgerServer::route(const protocol::Request& request) {
  std::vector<std::string> segments = splitPath(request.path);
  bool get = request.method == "GET";
  bool post = request.method == "POST";

  if (segments.size() == 1) {
    if (get && segments[0] == "health") return health();
    if (get && segments[0] == "metrics") return exportMetrics();
    if (post && segments[0] == "transfers") return transfer(request.body);
  } else if (segments.size() == 2 && segments[0] == "accounts") {
    if (get) return getAccountInfo(segments[1]);
  } else if (segments.size() == 2 && segments[0] == "interest" && segments[1] == "calculate") {
    if (post) return calculateInterest(request.body);
  } else if (segments.size() == 3 && segments[0] == "accounts") {
    const std::string& account_id = segments[1];
    const std::string& action = segments[2];
    if (post && action == "deposit") return deposit(account_id, request.body);
    if (post && action == "withdrawal") return withdraw(account_id, request.body);
    if (get && action == "interest-history") return getInterestHistory(account_id);
    if (get && action == "reconciliation") return reconcile(account_id);
  }

  return routeNotFound(request);
}

protocol::Response LedgerServer::getAccountInfo(const std::string& account_id) {
  return protocol::Response::success(protocol::toJson(accounts_.getAccountInfo(account_id)));
}

protocol::Response LedgerServer::deposit(const std::string& account_id,
                                         const nlohmann::json& body) {
  Money balance = accounts_.deposit(account_id, amountField(body));
  return protocol::Response::success({{"accountId", account_id}, {"balance", balance.toString()}});
}

protocol::Response LedgerServer::withdraw(const std::string& account_id,
                                          const nlohmann::json& body) {
  Money balance = accounts_.withdraw(account_id, amountField(body));
  return protocol::Response::success({{"accountId", account_id}, {"balance", balance.toString()}});
}

protocol::Response LedgerServer::transfer(const nlohmann::json& body) {
  std::string from = requireString(body, "fromAccountId");
  std::string to = requireString(body, "toAccountId");
  Money amount = amountField(body);

  std::string description;
  auto it = body.find("description");
  if (it != body.end() && it->is_string()) {
    description = it->get<std::string>();
  }

  return protocol::Response::success(
      protocol::toJson(transfers_.transfer(from, to, amount, description)));
}

protocol::Response LedgerServer::calculateInterest(const nlohmann::json& body) {
  auto it = body.find("calculationDate");
  if (it == body.end() || it->is_null()) {
    return protocol::Response::success(protocol::toJson(interest_.accrueDaily()));
  }

  if (!it->is_string() || !isCalendarDate(it->get<std::string>())) {
    throw protocol::ProtocolError("Field 'calculationDate' must be a YYYY-MM-DD date");
  }
  return protocol::Response::success(
      protocol::toJson(interest_.accrueDaily(it->get<std::string>())));
}

protocol::Response LedgerServer::getInterestHistory(const std::string& account_id) {
  nlohmann::json records = nlohmann::json::array();
  for (const auto& record : queries_.getInterestHistory(account_id)) {
    records.push_back(protocol::toJson(record));
  }
  return protocol::Response::success({{"accountId", account_id}, {"interestHistory", records}});
}

protocol::Response LedgerServer::reconcile(const std::string& account_id) {
  return protocol::Response::success(protocol::toJson(queries_.reconcile(account_id)));
}

protocol::Response LedgerServer::health() {
  return protocol::Response::success({{"status", "UP"}, {"timestamp",
                                                         formatTimestamp(currentTimestamp())}});
}

protocol::Response LedgerServer::exportMetrics() {
  return protocol::Response::success(
      {{"format", "prometheus"},
       {"metrics", observability::getGlobalMetrics().exportMetrics()}});
}

protocol::Response LedgerServer::errorResponse(const LedgerError& e,
                                               const protocol::Request& request) {
  int status = protocol::statusFor(e.kind());

  if (isStorageError(e.kind())) {
    observability::LogEvent(observability::LogLevel::ERROR, "Storage error",
                            "ledger_server", request.request_id)
        .field("method", request.method)
        .field("path", request.path)
        .error(e);
    return protocol::Response::error(status, e.kindName(), "Internal storage error");
  }

  observability::LogEvent(observability::LogLevel::DEBUG, "Request rejected",
                          "ledger_server", request.request_id)
      .field("path", request.path)
      .field("error_kind", e.kindName());
  return protocol::Response::error(status, e.kindName(), e.what());
}

}  // namespace ledger
