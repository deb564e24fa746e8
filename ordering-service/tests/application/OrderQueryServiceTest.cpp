/**
 * @file OrderQueryServiceTest.cpp
 * @brief Unit tests for OrderQueryService
 */

#include <gtest/gtest.h>
#include "application/OrderQueryService.hpp"
#include "application/OrderCommandService.hpp"
#include "application/MetricsService.hpp"
#include "adapters/secondary/persistence/InMemoryOrderingStore.hpp"
#include "settings/MetricsSettings.hpp"
#include "../mocks/ManualClock.hpp"
#include "../mocks/OrderFixtures.hpp"
#include "../mocks/TestSettings.hpp"

using namespace ordering;
using namespace ordering::application;
using namespace ordering::tests;

class OrderQueryServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<ManualClock>();
        store_ = std::make_shared<adapters::secondary::InMemoryOrderingStore>(clock_);
        commands_ = std::make_shared<OrderCommandService>(
            store_, store_, clock_,
            std::make_shared<MetricsService>(std::make_shared<settings::MetricsSettings>()),
            std::make_shared<TestCommandSettings>());
        queries_ = std::make_shared<OrderQueryService>(store_, store_);
    }

    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<adapters::secondary::InMemoryOrderingStore> store_;
    std::shared_ptr<OrderCommandService> commands_;
    std::shared_ptr<OrderQueryService> queries_;
};

TEST_F(OrderQueryServiceTest, GetOrderById) {
    auto orderId = commands_->createOrder(twoItemOrder("req-1")).orderId;

    auto order = queries_->getOrderById(orderId);

    ASSERT_TRUE(order);
    EXPECT_EQ(order->getBuyerId(), "buyer-1");
    EXPECT_EQ(order->getItemCount(), 2u);
    EXPECT_FALSE(queries_->getOrderById("missing"));
    EXPECT_FALSE(queries_->getOrderById(""));
}

TEST_F(OrderQueryServiceTest, GetOrdersByBuyer_NewestFirst) {
    auto older = commands_->createOrder(twoItemOrder("req-1")).orderId;
    clock_->advance(std::chrono::minutes(5));
    auto newer = commands_->createOrder(twoItemOrder("req-2")).orderId;

    auto orders = queries_->getOrdersByBuyer("buyer-1");

    ASSERT_EQ(orders.size(), 2u);
    EXPECT_EQ(orders[0].getId(), newer);
    EXPECT_EQ(orders[1].getId(), older);
    EXPECT_TRUE(queries_->getOrdersByBuyer("nobody").empty());
}

TEST_F(OrderQueryServiceTest, GetOrderEvents_InCreationOrder) {
    auto orderId = commands_->createOrder(twoItemOrder("req-1")).orderId;
    commands_->confirmGracePeriod({orderId, "req-2"});
    commands_->cancelOrder({orderId, "req-3"});

    auto events = queries_->getOrderEvents(orderId);

    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].eventType, "order.started");
    EXPECT_EQ(events[1].eventType, "order.awaiting_validation");
    EXPECT_EQ(events[2].eventType, "order.cancelled");
    EXPECT_LT(events[0].sequence, events[1].sequence);
}
