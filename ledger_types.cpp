#include "ledger_types.hpp"
#include "ledger_error.hpp"

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>

namespace ledger {

namespace {

constexpr int64_t kMicrosPerSecond = 1000000;
constexpr int64_t kPerMillion = 1000000;
// Largest single amount; balances are capped separately at Money::kMaxCents.
constexpr size_t kMaxIntegerDigits = 13;
constexpr size_t kMaxStoredIntegerDigits = 16;

std::tm utcTime(Timestamp ts) {
  std::time_t seconds = static_cast<std::time_t>(ts / kMicrosPerSecond);
  std::tm tm{};
  gmtime_r(&seconds, &tm);
  return tm;
}

}  // namespace

Timestamp currentTimestamp() {
  auto now = std::chrono::system_clock::now();
  return std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count();
}

std::string formatTimestamp(Timestamp ts) {
  std::tm tm = utcTime(ts);
  std::stringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
     << "." << std::setfill('0') << std::setw(6) << (ts % kMicrosPerSecond) << "Z";
  return ss.str();
}

std::string calendarDate(Timestamp ts) {
  std::tm tm = utcTime(ts);
  std::stringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%d");
  return ss.str();
}

bool isCalendarDate(const std::string& text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') return false;
  for (size_t i : {0, 1, 2, 3, 5, 6, 8, 9}) {
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
  }

  int year = std::stoi(text.substr(0, 4));
  int month = std::stoi(text.substr(5, 2));
  int day = std::stoi(text.substr(8, 2));
  if (month < 1 || month > 12 || day < 1) return false;

  static const int kDaysInMonth[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
  int days = kDaysInMonth[month - 1] + (month == 2 && leap ? 1 : 0);
  return day <= days;
}

Money Money::parse(const std::string& text) {
  return Money(parseCents(text, kMaxIntegerDigits));
}

Money Money::parseStored(const std::string& text) {
  return Money(parseCents(text, kMaxStoredIntegerDigits));
}

int64_t Money::parseCents(const std::string& text, size_t max_integer_digits) {
  size_t pos = 0;
  bool negative = false;
  if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
    negative = text[pos] == '-';
    ++pos;
  }

  int64_t whole = 0;
  size_t whole_digits = 0;
  while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
    whole = whole * 10 + (text[pos] - '0');
    ++whole_digits;
    ++pos;
    if (whole_digits > max_integer_digits) {
      throw LedgerError(ErrorKind::InvalidAmount, "Amount out of range: " + text);
    }
  }

  int64_t fraction = 0;
  size_t fraction_digits = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
      if (fraction_digits == 2) {
        throw LedgerError(ErrorKind::InvalidAmount,
                          "Amount has more than two decimal places: " + text);
      }
      fraction = fraction * 10 + (text[pos] - '0');
      ++fraction_digits;
      ++pos;
    }
    if (fraction_digits == 0) {
      throw LedgerError(ErrorKind::InvalidAmount, "Malformed amount: " + text);
    }
  }

  if (whole_digits == 0 || pos != text.size()) {
    throw LedgerError(ErrorKind::InvalidAmount, "Malformed amount: '" + text + "'");
  }

  if (fraction_digits == 1) {
    fraction *= 10;
  }

  int64_t cents = whole * 100 + fraction;
  return negative ? -cents : cents;
}

std::string Money::toString() const {
  int64_t magnitude = cents_ < 0 ? -cents_ : cents_;
  std::stringstream ss;
  if (cents_ < 0) ss << "-";
  ss << magnitude / 100 << "." << std::setfill('0') << std::setw(2) << magnitude % 100;
  return ss.str();
}

InterestRate InterestRate::parse(const std::string& text) {
  size_t dot = text.find('.');
  std::string whole = text.substr(0, dot);
  std::string fraction = dot == std::string::npos ? "" : text.substr(dot + 1);

  auto all_digits = [](const std::string& s) {
    for (char c : s) {
      if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
  };

  if (whole.empty() || !all_digits(whole) || !all_digits(fraction) || fraction.size() > 6 ||
      whole.size() > 6 || (dot != std::string::npos && fraction.empty())) {
    throw LedgerError(ErrorKind::InvalidAmount, "Malformed interest rate: '" + text + "'");
  }

  fraction.append(6 - fraction.size(), '0');
  return InterestRate{std::stoll(whole) * kPerMillion + std::stoll(fraction)};
}

Money InterestRate::applyTo(Money balance) const {
  // A capped balance times a six-digit rate needs more than 64 bits.
  __int128 product = static_cast<__int128>(balance.cents()) * per_million;
  __int128 half = kPerMillion / 2;
  __int128 cents = product >= 0 ? (product + half) / kPerMillion
                                : -((-product + half) / kPerMillion);
  if (cents > std::numeric_limits<int64_t>::max() ||
      cents < std::numeric_limits<int64_t>::min()) {
    throw LedgerError(ErrorKind::ConstraintViolation,
                      "Interest at " + toString() + " on " + balance.toString() +
                          " is out of range");
  }
  return Money::fromCents(static_cast<int64_t>(cents));
}

std::string InterestRate::toString() const {
  std::stringstream ss;
  ss << per_million / kPerMillion;
  int64_t fraction = per_million % kPerMillion;
  if (fraction != 0) {
    std::stringstream frac;
    frac << std::setfill('0') << std::setw(6) << fraction;
    std::string digits = frac.str();
    digits.erase(digits.find_last_not_of('0') + 1);
    ss << "." << digits;
  }
  return ss.str();
}

std::string toString(TransactionType type) {
  switch (type) {
    case TransactionType::DEPOSIT: return "DEPOSIT";
    case TransactionType::WITHDRAWAL: return "WITHDRAWAL";
    case TransactionType::TRANSFER_IN: return "TRANSFER_IN";
    case TransactionType::TRANSFER_OUT: return "TRANSFER_OUT";
  }
  return "UNKNOWN";
}

std::optional<TransactionType> transactionTypeFromString(const std::string& name) {
  if (name == "DEPOSIT") return TransactionType::DEPOSIT;
  if (name == "WITHDRAWAL") return TransactionType::WITHDRAWAL;
  if (name == "TRANSFER_IN") return TransactionType::TRANSFER_IN;
  if (name == "TRANSFER_OUT") return TransactionType::TRANSFER_OUT;
  return std::nullopt;
}

bool isCredit(TransactionType type) {
  return type == TransactionType::DEPOSIT || type == TransactionType::TRANSFER_IN;
}

}  // namespace ledger
