#pragma once

#include "ports/input/IOrderQueryService.hpp"
#include "ports/output/IOrderRepository.hpp"
#include "ports/output/IOutboxRepository.hpp"
#include <memory>
#include <algorithm>

namespace ordering::application {

/**
 * @brief Чтение заказов (без блокировок и без unit of work)
 */
class OrderQueryService : public ports::input::IOrderQueryService {
public:
    OrderQueryService(
        std::shared_ptr<ports::output::IOrderRepository> orderRepository,
        std::shared_ptr<ports::output::IOutboxRepository> outboxRepository
    ) : orderRepository_(std::move(orderRepository))
      , outboxRepository_(std::move(outboxRepository))
    {}

    std::optional<domain::Order> getOrderById(const std::string& orderId) override {
        if (orderId.empty()) {
            return std::nullopt;
        }
        return orderRepository_->findById(orderId);
    }

    std::vector<domain::Order> getOrdersByBuyer(const std::string& buyerId) override {
        if (buyerId.empty()) {
            return {};
        }
        return orderRepository_->findByBuyerId(buyerId);
    }

    std::vector<domain::OutboxRecord> getOrderEvents(const std::string& orderId) override {
        auto records = outboxRepository_->findByOrderId(orderId);
        std::sort(records.begin(), records.end(),
            [](const domain::OutboxRecord& a, const domain::OutboxRecord& b) {
                return a.sequence < b.sequence;
            });
        return records;
    }

private:
    std::shared_ptr<ports::output::IOrderRepository> orderRepository_;
    std::shared_ptr<ports::output::IOutboxRepository> outboxRepository_;
};

} // namespace ordering::application
