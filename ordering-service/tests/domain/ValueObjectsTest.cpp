/**
 * @file ValueObjectsTest.cpp
 * @brief Unit tests for Money, Address, PaymentCard, Timestamp
 */

#include <gtest/gtest.h>
#include <limits>
#include <stdexcept>
#include "domain/Money.hpp"
#include "domain/Address.hpp"
#include "domain/PaymentCard.hpp"
#include "domain/Timestamp.hpp"
#include "domain/enums/OrderStatus.hpp"
#include "domain/enums/EventState.hpp"

using namespace ordering::domain;

// ============================================================================
// MONEY
// ============================================================================

TEST(MoneyTest, FromDouble_SplitsUnitsAndNano) {
    auto m = Money::fromDouble(12.5);

    EXPECT_EQ(m.units, 12);
    EXPECT_EQ(m.nano, 500000000);
    EXPECT_EQ(m.currency, "USD");
}

TEST(MoneyTest, Multiply_CarriesNano) {
    auto m = Money(0, 600000000) * 3;

    EXPECT_EQ(m.units, 1);
    EXPECT_EQ(m.nano, 800000000);
}

TEST(MoneyTest, Subtract_BorrowsFromUnits) {
    auto m = Money(5, 0) - Money(0, 250000000);

    EXPECT_EQ(m.units, 4);
    EXPECT_EQ(m.nano, 750000000);
    EXPECT_FALSE(m.isNegative());
}

TEST(MoneyTest, Subtract_NegativeResultKeepsOneSign) {
    auto m = Money(0, 500000000) - Money(1, 0);

    EXPECT_EQ(m.units, 0);
    EXPECT_EQ(m.nano, -500000000);
    EXPECT_TRUE(m.isNegative());

    auto n = Money(1, 0) - Money(2, 500000000);

    EXPECT_EQ(n.units, -1);
    EXPECT_EQ(n.nano, -500000000);
    EXPECT_EQ(n, Money(-1, -500000000));
    EXPECT_TRUE(n < Money(-1, 0));
    EXPECT_TRUE(Money(-2, 0) < n);
}

TEST(MoneyTest, CompareDifferentCurrencies_Throws) {
    EXPECT_THROW((void)(Money(1, 0, "USD") < Money(2, 0, "EUR")), std::invalid_argument);
    EXPECT_THROW(Money(1, 0, "USD") + Money(2, 0, "EUR"), std::invalid_argument);
    EXPECT_FALSE(Money(1, 0, "USD") == Money(1, 0, "EUR"));
}

TEST(MoneyTest, Multiply_Overflow_Throws) {
    Money price(std::numeric_limits<int64_t>::max() / 2, 0);

    EXPECT_TRUE(price.canMultiplyBy(1));
    EXPECT_FALSE(price.canMultiplyBy(3));
    EXPECT_THROW(price * 3, std::overflow_error);
}

// ============================================================================
// ADDRESS / CARD
// ============================================================================

TEST(AddressTest, FindMissingField_ReportsFirstEmpty) {
    Address full("1 Main St", "Seattle", "WA", "USA", "98101");
    Address noCity("1 Main St", "", "WA", "USA", "98101");

    EXPECT_FALSE(full.findMissingField());
    EXPECT_EQ(noCity.findMissingField(), "city");
}

TEST(PaymentCardTest, Mask_KeepsLastFourDigits) {
    EXPECT_EQ(PaymentCard::mask("4012888888881881"), "************1881");
}

TEST(PaymentCardTest, Mask_ShortNumberIsHiddenCompletely) {
    EXPECT_EQ(PaymentCard::mask("1234"), "****");
    EXPECT_EQ(PaymentCard::mask("12"), "**");

    PaymentCard card("VISA", "1234", "Alice", "12/27");
    EXPECT_EQ(card.getMaskedNumber(), "****");
}

TEST(PaymentCardTest, FromMasked_DoesNotMaskAgain) {
    auto card = PaymentCard::fromMasked("VISA", "****1881", "Alice", "12/27");

    EXPECT_EQ(card.getMaskedNumber(), "****1881");
    EXPECT_FALSE(card.findMissingField());
}

TEST(PaymentCardTest, FindMissingField_Expiration) {
    PaymentCard card("VISA", "4012888888881881", "Alice", "");

    EXPECT_EQ(card.findMissingField(), "card_expiration");
}

// ============================================================================
// TIMESTAMP / ENUMS
// ============================================================================

TEST(TimestampTest, StringRoundTrip) {
    auto ts = Timestamp::fromString("2025-01-15T10:30:00Z");

    EXPECT_EQ(ts.toString(), "2025-01-15T10:30:00Z");
    EXPECT_EQ(Timestamp::fromUnixMillis(ts.toUnixMillis()), ts);
}

TEST(TimestampTest, Plus_AdvancesMillis) {
    auto ts = Timestamp::fromString("2025-01-15T10:30:00Z");

    auto later = ts.plus(std::chrono::milliseconds(1500));

    EXPECT_EQ(later.toUnixMillis() - ts.toUnixMillis(), 1500);
    EXPECT_LT(ts, later);
}

TEST(EnumsTest, ParseStatus_UnknownIsEmpty) {
    EXPECT_EQ(parseOrderStatus("PAID"), OrderStatus::PAID);
    EXPECT_FALSE(parseOrderStatus("paid"));
    EXPECT_EQ(parseEventState("IN_PROGRESS"), EventState::IN_PROGRESS);
    EXPECT_FALSE(parseEventState("DONE"));
}
