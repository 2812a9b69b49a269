#include "ledger_error.hpp"
#include "ledger_types.hpp"

#include <gtest/gtest.h>

using namespace ledger;

namespace {

ErrorKind parseFailure(const std::string& text) {
  try {
    Money::parse(text);
  } catch (const LedgerError& e) {
    return e.kind();
  }
  ADD_FAILURE() << "'" << text << "' parsed without error";
  return ErrorKind::StorageFailure;
}

}  // namespace

TEST(MoneyTest, ParsesDecimalText) {
  EXPECT_EQ(Money::parse("250.50").cents(), 25050);
  EXPECT_EQ(Money::parse("250.5").cents(), 25050);
  EXPECT_EQ(Money::parse("1000").cents(), 100000);
  EXPECT_EQ(Money::parse("0.01").cents(), 1);
  EXPECT_EQ(Money::parse("-3.20").cents(), -320);
  EXPECT_EQ(Money::parse("+7").cents(), 700);
}

TEST(MoneyTest, RejectsMalformedText) {
  EXPECT_EQ(parseFailure(""), ErrorKind::InvalidAmount);
  EXPECT_EQ(parseFailure("abc"), ErrorKind::InvalidAmount);
  EXPECT_EQ(parseFailure("1.234"), ErrorKind::InvalidAmount);
  EXPECT_EQ(parseFailure("1."), ErrorKind::InvalidAmount);
  EXPECT_EQ(parseFailure(".5"), ErrorKind::InvalidAmount);
  EXPECT_EQ(parseFailure("1,00"), ErrorKind::InvalidAmount);
  EXPECT_EQ(parseFailure("12 "), ErrorKind::InvalidAmount);
  EXPECT_EQ(parseFailure("1e5"), ErrorKind::InvalidAmount);
  EXPECT_EQ(parseFailure("12345678901234"), ErrorKind::InvalidAmount);
}

TEST(MoneyTest, StoredValuesCoverTheColumnRange) {
  EXPECT_EQ(Money::parseStored("9999999999999999.99").cents(), Money::kMaxCents);
  EXPECT_EQ(Money::parseStored("12345678901234.00").cents(), 1234567890123400);
  EXPECT_THROW(Money::parse("9999999999999999.99"), LedgerError);
  EXPECT_THROW(Money::parseStored("12345678901234567"), LedgerError);
  EXPECT_EQ(Money::fromCents(Money::kMaxCents).toString(), "9999999999999999.99");
}

TEST(MoneyTest, FormatsWithTwoDecimals) {
  EXPECT_EQ(Money::fromCents(125050).toString(), "1250.50");
  EXPECT_EQ(Money::fromCents(5).toString(), "0.05");
  EXPECT_EQ(Money::fromCents(0).toString(), "0.00");
  EXPECT_EQ(Money::fromCents(-320).toString(), "-3.20");
}

TEST(MoneyTest, Arithmetic) {
  Money balance = Money::parse("1000.00");
  balance += Money::parse("250.50");
  EXPECT_EQ(balance, Money::parse("1250.50"));
  balance -= Money::parse("300");
  EXPECT_EQ(balance.toString(), "950.50");
  EXPECT_TRUE((Money() - Money::fromCents(1)).isNegative());
  EXPECT_FALSE(Money().isPositive());
  EXPECT_LT(Money::fromCents(1), Money::fromCents(2));
}

TEST(InterestRateTest, DailyRateOnTenThousand) {
  InterestRate rate = InterestRate::fromPerMillion(500);
  EXPECT_EQ(rate.applyTo(Money::parse("10000.00")), Money::parse("5.00"));
}

TEST(InterestRateTest, RoundsHalfAwayFromZero) {
  InterestRate rate = InterestRate::fromPerMillion(500);
  // 10.00 * 0.0005 = 0.005 -> 0.01
  EXPECT_EQ(rate.applyTo(Money::parse("10.00")).cents(), 1);
  // 9.99 * 0.0005 = 0.004995 -> 0.00
  EXPECT_EQ(rate.applyTo(Money::parse("9.99")).cents(), 0);
  // 1234.56 * 0.0005 = 0.61728 -> 0.62
  EXPECT_EQ(rate.applyTo(Money::parse("1234.56")).cents(), 62);
  EXPECT_EQ(rate.applyTo(Money::parse("-10.00")).cents(), -1);
}

TEST(InterestRateTest, ExactOnBalancesPastSixtyFourBitProducts) {
  InterestRate rate = InterestRate::fromPerMillion(500);
  EXPECT_EQ(rate.applyTo(Money::fromCents(19999999999999980)).cents(), 10000000000000);
  EXPECT_EQ(rate.applyTo(Money::fromCents(Money::kMaxCents)).cents(), 500000000000000);

  InterestRate huge = InterestRate::fromPerMillion(999999999999);
  try {
    huge.applyTo(Money::fromCents(Money::kMaxCents));
    FAIL() << "out of range interest was returned";
  } catch (const LedgerError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::ConstraintViolation);
  }
}

TEST(InterestRateTest, ParsesAndFormats) {
  EXPECT_EQ(InterestRate::parse("0.0005").per_million, 500);
  EXPECT_EQ(InterestRate::parse("0.000500").per_million, 500);
  EXPECT_EQ(InterestRate::parse("1").per_million, 1000000);
  EXPECT_EQ(InterestRate::fromPerMillion(500).toString(), "0.0005");
  EXPECT_EQ(InterestRate::fromPerMillion(1250000).toString(), "1.25");
  EXPECT_EQ(InterestRate::fromPerMillion(0).toString(), "0");
  EXPECT_THROW(InterestRate::parse("0.0000001"), LedgerError);
  EXPECT_THROW(InterestRate::parse("-0.1"), LedgerError);
}

TEST(TransactionTypeTest, NamesAndDirection) {
  EXPECT_EQ(toString(TransactionType::TRANSFER_OUT), "TRANSFER_OUT");
  EXPECT_EQ(transactionTypeFromString("WITHDRAWAL"), TransactionType::WITHDRAWAL);
  EXPECT_FALSE(transactionTypeFromString("REFUND").has_value());

  EXPECT_TRUE(isCredit(TransactionType::DEPOSIT));
  EXPECT_TRUE(isCredit(TransactionType::TRANSFER_IN));
  EXPECT_FALSE(isCredit(TransactionType::WITHDRAWAL));
  EXPECT_FALSE(isCredit(TransactionType::TRANSFER_OUT));

  Transaction txn;
  txn.type = TransactionType::TRANSFER_OUT;
  txn.amount = Money::parse("300.00");
  EXPECT_EQ(txn.signedAmount(), Money::parse("-300.00"));
}

TEST(TimestampTest, FormatsUtc) {
  EXPECT_EQ(formatTimestamp(0), "1970-01-01T00:00:00.000000Z");
  // 2024-02-29T12:30:45.000123Z
  Timestamp ts = 1709209845000123;
  EXPECT_EQ(formatTimestamp(ts), "2024-02-29T12:30:45.000123Z");
  EXPECT_EQ(calendarDate(ts), "2024-02-29");
}

TEST(TimestampTest, ValidatesCalendarDates) {
  EXPECT_TRUE(isCalendarDate("2024-02-29"));
  EXPECT_TRUE(isCalendarDate("2026-12-31"));
  EXPECT_FALSE(isCalendarDate("2023-02-29"));
  EXPECT_FALSE(isCalendarDate("2026-13-01"));
  EXPECT_FALSE(isCalendarDate("2026-04-31"));
  EXPECT_FALSE(isCalendarDate("2026-4-1"));
  EXPECT_FALSE(isCalendarDate("today"));
}

TEST(LedgerErrorTest, CarriesKind) {
  LedgerError error(ErrorKind::InsufficientFunds, "balance too low");
  EXPECT_EQ(error.kind(), ErrorKind::InsufficientFunds);
  EXPECT_STREQ(error.kindName(), "INSUFFICIENT_FUNDS");
  EXPECT_STREQ(error.what(), "balance too low");
  EXPECT_TRUE(error.constraint().empty());

  LedgerError duplicate(ErrorKind::ConstraintViolation, "again", "uq_interest_account_day");
  EXPECT_EQ(duplicate.constraint(), "uq_interest_account_day");

  EXPECT_TRUE(isStorageError(ErrorKind::StorageTimeout));
  EXPECT_TRUE(isStorageError(ErrorKind::StorageFailure));
  EXPECT_FALSE(isStorageError(ErrorKind::ConstraintViolation));
}
