/**
 * @file InMemoryOrderingStoreTest.cpp
 * @brief Unit tests for InMemoryOrderingStore and InMemoryUnitOfWork
 */

#include <gtest/gtest.h>
#include "adapters/secondary/persistence/InMemoryOrderingStore.hpp"
#include "../mocks/ManualClock.hpp"
#include "../mocks/OrderFixtures.hpp"

using namespace ordering;
using namespace ordering::adapters::secondary;
using namespace ordering::tests;
using ports::output::ConcurrencyException;

class InMemoryOrderingStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<ManualClock>();
        store_ = std::make_shared<InMemoryOrderingStore>(clock_);
    }

    domain::OutboxRecord record(const std::string& eventId, const std::string& orderId) {
        domain::OutboxRecord r;
        r.eventId = eventId;
        r.eventType = "order.started";
        r.orderId = orderId;
        r.content = "{}";
        r.createdAt = clock_->now();
        return r;
    }

    void saveNewOrder(const std::string& orderId) {
        auto unit = store_->begin();
        unit->saveOrder(makeOrder(orderId));
        unit->commit();
    }

    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<InMemoryOrderingStore> store_;
};

// ============================================================================
// UNIT OF WORK
// ============================================================================

TEST_F(InMemoryOrderingStoreTest, Commit_AppliesAllChangesTogether) {
    auto unit = store_->begin();
    unit->saveOrder(makeOrder("order-1"));
    unit->addOutboxRecord(record("e-1", "order-1"));
    unit->markProcessed({"req-1", "create_order", "order-1", "{}", clock_->now()});

    EXPECT_EQ(store_->orderCount(), 0u);
    unit->commit();

    EXPECT_EQ(store_->orderCount(), 1u);
    EXPECT_EQ(store_->findById("order-1")->getVersion(), 1);
    EXPECT_TRUE(store_->findByEventId("e-1"));
    EXPECT_TRUE(store_->find("req-1"));
}

TEST_F(InMemoryOrderingStoreTest, Rollback_DiscardsChanges) {
    auto unit = store_->begin();
    unit->saveOrder(makeOrder("order-1"));
    unit->addOutboxRecord(record("e-1", "order-1"));
    unit->rollback();

    EXPECT_EQ(store_->orderCount(), 0u);
    EXPECT_EQ(store_->outboxSize(), 0u);
}

TEST_F(InMemoryOrderingStoreTest, Destructor_RollsBack) {
    {
        auto unit = store_->begin();
        unit->saveOrder(makeOrder("order-1"));
    }

    EXPECT_EQ(store_->orderCount(), 0u);
}

TEST_F(InMemoryOrderingStoreTest, FinishedUnit_CannotBeReused) {
    auto unit = store_->begin();
    unit->commit();

    EXPECT_THROW(unit->addOutboxRecord(record("e-1", "order-1")), std::logic_error);
}

TEST_F(InMemoryOrderingStoreTest, FindProcessed_SeesOwnPendingRecord) {
    auto unit = store_->begin();
    unit->markProcessed({"req-1", "mark_paid", "order-1", "{}", clock_->now()});

    EXPECT_TRUE(unit->findProcessed("req-1"));
    EXPECT_FALSE(store_->find("req-1"));
}

// ============================================================================
// OPTIMISTIC CONCURRENCY
// ============================================================================

TEST_F(InMemoryOrderingStoreTest, StaleVersion_ConflictAtCommit) {
    saveNewOrder("order-1");

    auto first = store_->begin();
    auto second = store_->begin();
    auto a = first->loadOrder("order-1");
    auto b = second->loadOrder("order-1");
    ASSERT_FALSE(a->setCancelledStatus());
    ASSERT_FALSE(b->setAwaitingValidationStatus());

    first->saveOrder(*a);
    second->saveOrder(*b);
    first->commit();

    EXPECT_THROW(second->commit(), ConcurrencyException);
    auto stored = store_->findById("order-1");
    EXPECT_EQ(stored->getStatus(), domain::OrderStatus::CANCELLED);
    EXPECT_EQ(stored->getVersion(), 2);
}

TEST_F(InMemoryOrderingStoreTest, StaleVersion_ConflictAtSave) {
    saveNewOrder("order-1");
    auto stale = store_->findById("order-1");

    auto unit = store_->begin();
    auto fresh = unit->loadOrder("order-1");
    unit->saveOrder(*fresh);
    unit->commit();

    auto late = store_->begin();
    EXPECT_THROW(late->saveOrder(*stale), ConcurrencyException);
}

TEST_F(InMemoryOrderingStoreTest, DuplicateNewOrder_Conflict) {
    saveNewOrder("order-1");

    auto unit = store_->begin();
    EXPECT_THROW(unit->saveOrder(makeOrder("order-1")), ConcurrencyException);
}

TEST_F(InMemoryOrderingStoreTest, DuplicateIdempotencyKey_ConflictAtCommit) {
    auto first = store_->begin();
    auto second = store_->begin();
    first->markProcessed({"req-1", "create_order", "order-1", "{}", clock_->now()});
    second->markProcessed({"req-1", "create_order", "order-2", "{}", clock_->now()});
    second->addOutboxRecord(record("e-2", "order-2"));

    first->commit();

    EXPECT_THROW(second->commit(), ConcurrencyException);
    EXPECT_FALSE(store_->findByEventId("e-2"));
    EXPECT_EQ(store_->find("req-1")->orderId, "order-1");
}

TEST_F(InMemoryOrderingStoreTest, StoredOrder_HasNoStagedEvents) {
    saveNewOrder("order-1");

    EXPECT_TRUE(store_->findById("order-1")->getDomainEvents().empty());
}

// ============================================================================
// OUTBOX CLAIM
// ============================================================================

TEST_F(InMemoryOrderingStoreTest, ClaimPending_AssignsSequenceAndLease) {
    auto unit = store_->begin();
    unit->addOutboxRecord(record("e-1", "order-1"));
    unit->addOutboxRecord(record("e-2", "order-2"));
    unit->commit();

    auto claimed = store_->claimPending(10, std::chrono::milliseconds(1000));

    ASSERT_EQ(claimed.size(), 2u);
    EXPECT_LT(claimed[0].sequence, claimed[1].sequence);
    EXPECT_EQ(claimed[0].state, domain::EventState::IN_PROGRESS);
    EXPECT_EQ(claimed[0].timesSent, 1);
    EXPECT_EQ(*claimed[0].leaseUntil, clock_->now().plus(std::chrono::milliseconds(1000)));
}

TEST_F(InMemoryOrderingStoreTest, ClaimPending_OnePerOrderRespectingBatchSize) {
    auto unit = store_->begin();
    unit->addOutboxRecord(record("e-1", "order-1"));
    unit->addOutboxRecord(record("e-2", "order-1"));
    unit->addOutboxRecord(record("e-3", "order-2"));
    unit->addOutboxRecord(record("e-4", "order-3"));
    unit->commit();

    auto claimed = store_->claimPending(2, std::chrono::milliseconds(1000));

    ASSERT_EQ(claimed.size(), 2u);
    EXPECT_EQ(claimed[0].eventId, "e-1");
    EXPECT_EQ(claimed[1].eventId, "e-3");
}

TEST_F(InMemoryOrderingStoreTest, MarkPublished_IgnoresRowsNotInProgress) {
    auto unit = store_->begin();
    unit->addOutboxRecord(record("e-1", "order-1"));
    unit->commit();

    store_->markPublished("e-1");

    EXPECT_EQ(store_->findByEventId("e-1")->state, domain::EventState::CREATED);
}
