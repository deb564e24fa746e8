/**
 * @file OrderTest.cpp
 * @brief Unit tests for Order aggregate
 */

#include <gtest/gtest.h>
#include <limits>
#include "domain/Order.hpp"
#include "../mocks/OrderFixtures.hpp"

using namespace ordering;
using namespace ordering::domain;
using namespace ordering::tests;

class OrderTest : public ::testing::Test {
protected:
    void SetUp() override {
        order_ = std::make_unique<Order>(makeOrder());
    }

    void addDefaultItems() {
        ASSERT_FALSE(order_->addOrderItem(1, "Mug", Money::fromDouble(10.0), Money(), "mug.png", 2));
        ASSERT_FALSE(order_->addOrderItem(2, "Shirt", Money::fromDouble(15.0), Money(), "shirt.png", 1));
    }

    void moveToPaid() {
        ASSERT_FALSE(order_->setAwaitingValidationStatus());
        ASSERT_FALSE(order_->setStockConfirmedStatus());
        ASSERT_FALSE(order_->setPaidStatus());
    }

    std::unique_ptr<Order> order_;
};

// ============================================================================
// CREATION
// ============================================================================

TEST_F(OrderTest, NewOrder_IsSubmittedWithStartedEvent) {
    EXPECT_EQ(order_->getStatus(), OrderStatus::SUBMITTED);
    EXPECT_EQ(order_->getVersion(), 0);

    ASSERT_EQ(order_->getDomainEvents().size(), 1u);
    auto* started = std::get_if<OrderStartedDomainEvent>(&order_->getDomainEvents()[0]);
    ASSERT_NE(started, nullptr);
    EXPECT_EQ(started->orderId, "order-1");
    EXPECT_EQ(started->buyerId, "buyer-1");
    EXPECT_EQ(started->buyerName, "Alice");
}

TEST_F(OrderTest, NewOrder_CardNumberIsMasked) {
    EXPECT_EQ(order_->getCard().getMaskedNumber(), "************1881");
}

TEST_F(OrderTest, Rehydrate_HasNoStagedEvents) {
    OrderData data;
    data.id = "order-7";
    data.buyerId = "buyer-7";
    data.status = OrderStatus::PAID;
    data.version = 4;
    data.items.emplace_back(1, "Mug", Money::fromDouble(10.0), Money(), "", 3);

    auto order = Order::rehydrate(data);

    EXPECT_EQ(order.getStatus(), OrderStatus::PAID);
    EXPECT_EQ(order.getVersion(), 4);
    EXPECT_TRUE(order.getDomainEvents().empty());
    EXPECT_EQ(order.getTotal(), Money::fromDouble(30.0));
}

// ============================================================================
// ORDER ITEMS
// ============================================================================

TEST_F(OrderTest, AddOrderItem_ComputesTotal) {
    addDefaultItems();

    EXPECT_EQ(order_->getItemCount(), 2u);
    EXPECT_EQ(order_->getTotal(), Money::fromDouble(35.0));
}

TEST_F(OrderTest, AddOrderItem_ZeroUnits_Rejected) {
    auto error = order_->addOrderItem(1, "Mug", Money::fromDouble(10.0), Money(), "", 0);

    ASSERT_TRUE(error);
    EXPECT_EQ(error->kind, ErrorKind::VALIDATION);
    EXPECT_EQ(order_->getItemCount(), 0u);
}

TEST_F(OrderTest, AddOrderItem_NegativeUnits_Rejected) {
    auto error = order_->addOrderItem(1, "Mug", Money::fromDouble(10.0), Money(), "", -3);

    ASSERT_TRUE(error);
    EXPECT_EQ(error->kind, ErrorKind::VALIDATION);
}

TEST_F(OrderTest, AddOrderItem_SameProduct_MergesUnits) {
    ASSERT_FALSE(order_->addOrderItem(1, "Mug", Money::fromDouble(10.0), Money(), "", 2));
    ASSERT_FALSE(order_->addOrderItem(1, "Mug", Money::fromDouble(10.0), Money(), "", 3));

    ASSERT_EQ(order_->getItemCount(), 1u);
    EXPECT_EQ(order_->getOrderItems()[0].getUnits(), 5);
    EXPECT_EQ(order_->getTotal(), Money::fromDouble(50.0));
}

TEST_F(OrderTest, AddOrderItem_SameProduct_KeepsHigherDiscount) {
    ASSERT_FALSE(order_->addOrderItem(1, "Mug", Money::fromDouble(10.0), Money::fromDouble(3.0), "", 1));
    ASSERT_FALSE(order_->addOrderItem(1, "Mug", Money::fromDouble(10.0), Money::fromDouble(1.0), "", 1));

    EXPECT_EQ(order_->getOrderItems()[0].getDiscount(), Money::fromDouble(3.0));
    EXPECT_EQ(order_->getTotal(), Money::fromDouble(17.0));
}

TEST_F(OrderTest, AddOrderItem_MergeBeyondIntMax_RejectedWithoutChange) {
    const int maxUnits = std::numeric_limits<int>::max();
    ASSERT_FALSE(order_->addOrderItem(1, "Pin", Money(0, 1), Money(), "", maxUnits));

    auto error = order_->addOrderItem(1, "Pin", Money(0, 1), Money(), "", 1);

    ASSERT_TRUE(error);
    EXPECT_EQ(error->kind, ErrorKind::VALIDATION);
    EXPECT_NE(error->message.find("Too many units"), std::string::npos);
    EXPECT_EQ(order_->getOrderItems()[0].getUnits(), maxUnits);
}

TEST_F(OrderTest, AddOrderItem_TotalOverflow_Rejected) {
    Money price(std::numeric_limits<int64_t>::max() / 2, 0);

    auto error = order_->addOrderItem(1, "Yacht", price, Money(), "", 3);

    ASSERT_TRUE(error);
    EXPECT_EQ(error->kind, ErrorKind::VALIDATION);
    EXPECT_EQ(order_->getItemCount(), 0u);
}

TEST_F(OrderTest, AddOrderItem_MixedCurrency_Rejected) {
    ASSERT_FALSE(order_->addOrderItem(1, "Mug", Money::fromDouble(10.0), Money(), "", 1));

    auto error = order_->addOrderItem(2, "Shirt", Money::fromDouble(15.0, "EUR"), Money(0, 0, "EUR"), "", 1);

    ASSERT_TRUE(error);
    EXPECT_EQ(error->kind, ErrorKind::VALIDATION);
    EXPECT_EQ(order_->getItemCount(), 1u);
}

TEST_F(OrderTest, AddOrderItem_DiscountAboveTotal_Rejected) {
    auto error = order_->addOrderItem(1, "Mug", Money::fromDouble(10.0), Money::fromDouble(25.0), "", 2);

    ASSERT_TRUE(error);
    EXPECT_EQ(error->kind, ErrorKind::VALIDATION);
    EXPECT_EQ(order_->getItemCount(), 0u);
}

TEST_F(OrderTest, AddOrderItem_TooManyItems_Rejected) {
    for (size_t i = 0; i < Order::MAX_ITEMS; ++i) {
        ASSERT_FALSE(order_->addOrderItem(static_cast<int64_t>(i + 1), "p", Money::fromDouble(1.0), Money(), "", 1));
    }

    auto error = order_->addOrderItem(1000, "extra", Money::fromDouble(1.0), Money(), "", 1);

    ASSERT_TRUE(error);
    EXPECT_EQ(error->kind, ErrorKind::VALIDATION);
    EXPECT_EQ(order_->getItemCount(), Order::MAX_ITEMS);
}

TEST_F(OrderTest, GetOrderItems_ReturnsCopy) {
    addDefaultItems();

    auto items = order_->getOrderItems();
    items.clear();

    EXPECT_EQ(order_->getItemCount(), 2u);
}

// ============================================================================
// STATE MACHINE
// ============================================================================

TEST_F(OrderTest, HappyPath_EachTransitionStagesOneEvent) {
    addDefaultItems();
    order_->pullDomainEvents();

    ASSERT_FALSE(order_->setAwaitingValidationStatus());
    EXPECT_EQ(order_->getStatus(), OrderStatus::AWAITING_VALIDATION);
    ASSERT_EQ(order_->getDomainEvents().size(), 1u);
    auto* awaiting = std::get_if<OrderStatusChangedToAwaitingValidationDomainEvent>(&order_->getDomainEvents()[0]);
    ASSERT_NE(awaiting, nullptr);
    ASSERT_EQ(awaiting->stockItems.size(), 2u);
    EXPECT_EQ(awaiting->stockItems[0].productId, 1);
    EXPECT_EQ(awaiting->stockItems[0].units, 2);

    ASSERT_FALSE(order_->setStockConfirmedStatus());
    EXPECT_EQ(order_->getStatus(), OrderStatus::STOCK_CONFIRMED);
    EXPECT_EQ(order_->getDescription(), "All the items were confirmed with available stock.");

    ASSERT_FALSE(order_->setPaidStatus());
    EXPECT_EQ(order_->getStatus(), OrderStatus::PAID);
    EXPECT_EQ(order_->getDescription(), "The payment was performed at a simulated bank.");

    ASSERT_FALSE(order_->setShippedStatus());
    EXPECT_EQ(order_->getStatus(), OrderStatus::SHIPPED);
    EXPECT_EQ(order_->getDescription(), "The order was shipped.");

    auto events = order_->pullDomainEvents();
    ASSERT_EQ(events.size(), 4u);
    EXPECT_TRUE(std::holds_alternative<OrderStatusChangedToAwaitingValidationDomainEvent>(events[0]));
    EXPECT_TRUE(std::holds_alternative<OrderStatusChangedToStockConfirmedDomainEvent>(events[1]));
    EXPECT_TRUE(std::holds_alternative<OrderStatusChangedToPaidDomainEvent>(events[2]));
    EXPECT_TRUE(std::holds_alternative<OrderShippedDomainEvent>(events[3]));
    EXPECT_TRUE(order_->getDomainEvents().empty());
}

TEST_F(OrderTest, SetPaid_EventCarriesTotal) {
    addDefaultItems();
    order_->pullDomainEvents();
    moveToPaid();

    auto events = order_->pullDomainEvents();
    auto* paid = std::get_if<OrderStatusChangedToPaidDomainEvent>(&events.back());
    ASSERT_NE(paid, nullptr);
    EXPECT_EQ(paid->total, Money::fromDouble(35.0));
}

TEST_F(OrderTest, SetPaid_Twice_FailsAndStaysPaid) {
    addDefaultItems();
    moveToPaid();
    order_->pullDomainEvents();

    auto error = order_->setPaidStatus();

    ASSERT_TRUE(error);
    EXPECT_EQ(error->kind, ErrorKind::INVALID_TRANSITION);
    EXPECT_EQ(error->currentStatus, OrderStatus::PAID);
    EXPECT_EQ(order_->getStatus(), OrderStatus::PAID);
    EXPECT_TRUE(order_->getDomainEvents().empty());
}

TEST_F(OrderTest, SetPaid_FromSubmitted_Fails) {
    auto error = order_->setPaidStatus();

    ASSERT_TRUE(error);
    EXPECT_EQ(error->kind, ErrorKind::INVALID_TRANSITION);
    EXPECT_EQ(error->transition, "setPaidStatus");
    EXPECT_EQ(order_->getStatus(), OrderStatus::SUBMITTED);
}

TEST_F(OrderTest, SetStockConfirmed_FromSubmitted_Fails) {
    auto error = order_->setStockConfirmedStatus();

    ASSERT_TRUE(error);
    EXPECT_EQ(error->currentStatus, OrderStatus::SUBMITTED);
}

TEST_F(OrderTest, SetShipped_FromStockConfirmed_Fails) {
    ASSERT_FALSE(order_->setAwaitingValidationStatus());
    ASSERT_FALSE(order_->setStockConfirmedStatus());

    auto error = order_->setShippedStatus();

    ASSERT_TRUE(error);
    EXPECT_EQ(error->currentStatus, OrderStatus::STOCK_CONFIRMED);
}

TEST_F(OrderTest, SetAwaitingValidation_Twice_Fails) {
    ASSERT_FALSE(order_->setAwaitingValidationStatus());

    auto error = order_->setAwaitingValidationStatus();

    ASSERT_TRUE(error);
    EXPECT_EQ(error->currentStatus, OrderStatus::AWAITING_VALIDATION);
}

// ============================================================================
// STOCK REJECTION
// ============================================================================

TEST_F(OrderTest, StockRejected_CancelsWithProductNames) {
    addDefaultItems();
    ASSERT_FALSE(order_->setAwaitingValidationStatus());
    order_->pullDomainEvents();

    ASSERT_FALSE(order_->setStockRejectedStatus({2}));

    EXPECT_EQ(order_->getStatus(), OrderStatus::CANCELLED);
    EXPECT_EQ(order_->getDescription(), "The product items don't have stock: (Shirt).");

    auto events = order_->pullDomainEvents();
    ASSERT_EQ(events.size(), 1u);
    auto* rejected = std::get_if<OrderStockRejectedDomainEvent>(&events[0]);
    ASSERT_NE(rejected, nullptr);
    EXPECT_EQ(rejected->rejectedProductIds, std::vector<int64_t>{2});
}

TEST_F(OrderTest, StockRejected_EmptyList_Rejected) {
    ASSERT_FALSE(order_->setAwaitingValidationStatus());

    auto error = order_->setStockRejectedStatus({});

    ASSERT_TRUE(error);
    EXPECT_EQ(error->kind, ErrorKind::VALIDATION);
    EXPECT_EQ(order_->getStatus(), OrderStatus::AWAITING_VALIDATION);
}

TEST_F(OrderTest, StockRejected_FromSubmitted_Fails) {
    auto error = order_->setStockRejectedStatus({1});

    ASSERT_TRUE(error);
    EXPECT_EQ(error->kind, ErrorKind::INVALID_TRANSITION);
}

// ============================================================================
// CANCELLATION
// ============================================================================

TEST_F(OrderTest, Cancel_FromSubmitted_RecordsPreviousStatus) {
    order_->pullDomainEvents();

    ASSERT_FALSE(order_->setCancelledStatus());

    EXPECT_EQ(order_->getStatus(), OrderStatus::CANCELLED);
    EXPECT_EQ(order_->getDescription(), "The order was cancelled.");
    auto events = order_->pullDomainEvents();
    ASSERT_EQ(events.size(), 1u);
    auto* cancelled = std::get_if<OrderCancelledDomainEvent>(&events[0]);
    ASSERT_NE(cancelled, nullptr);
    EXPECT_EQ(cancelled->previousStatus, OrderStatus::SUBMITTED);
}

TEST_F(OrderTest, Cancel_FromStockConfirmed_Succeeds) {
    ASSERT_FALSE(order_->setAwaitingValidationStatus());
    ASSERT_FALSE(order_->setStockConfirmedStatus());

    EXPECT_FALSE(order_->setCancelledStatus());
    EXPECT_EQ(order_->getStatus(), OrderStatus::CANCELLED);
}

TEST_F(OrderTest, Cancel_FromPaid_Fails) {
    addDefaultItems();
    moveToPaid();

    auto error = order_->setCancelledStatus();

    ASSERT_TRUE(error);
    EXPECT_EQ(error->currentStatus, OrderStatus::PAID);
    EXPECT_EQ(order_->getStatus(), OrderStatus::PAID);
}

TEST_F(OrderTest, Cancel_FromShipped_FailsNamingShipped) {
    addDefaultItems();
    moveToPaid();
    ASSERT_FALSE(order_->setShippedStatus());
    order_->pullDomainEvents();

    auto error = order_->setCancelledStatus();

    ASSERT_TRUE(error);
    EXPECT_EQ(error->kind, ErrorKind::INVALID_TRANSITION);
    EXPECT_EQ(error->currentStatus, OrderStatus::SHIPPED);
    EXPECT_NE(error->message.find("SHIPPED"), std::string::npos);
    EXPECT_EQ(order_->getStatus(), OrderStatus::SHIPPED);
    EXPECT_TRUE(order_->getDomainEvents().empty());
}

TEST_F(OrderTest, Cancel_Twice_Fails) {
    ASSERT_FALSE(order_->setCancelledStatus());

    auto error = order_->setCancelledStatus();

    ASSERT_TRUE(error);
    EXPECT_EQ(error->currentStatus, OrderStatus::CANCELLED);
}
