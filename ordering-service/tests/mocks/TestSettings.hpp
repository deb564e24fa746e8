#pragma once

#include "settings/IOutboxSettings.hpp"
#include "settings/ICommandSettings.hpp"

namespace ordering::tests {

class TestOutboxSettings : public settings::IOutboxSettings {
public:
    size_t batchSize = 50;
    std::chrono::milliseconds pollInterval{20};
    std::chrono::milliseconds leaseTimeout{30000};
    int maxAttempts = 3;
    std::chrono::milliseconds backoffBase{500};
    std::chrono::milliseconds backoffMax{4000};
    std::chrono::hours retention{72};

    size_t getBatchSize() const override { return batchSize; }
    std::chrono::milliseconds getPollInterval() const override { return pollInterval; }
    std::chrono::milliseconds getLeaseTimeout() const override { return leaseTimeout; }
    int getMaxAttempts() const override { return maxAttempts; }
    std::chrono::milliseconds getBackoffBase() const override { return backoffBase; }
    std::chrono::milliseconds getBackoffMax() const override { return backoffMax; }
    std::chrono::hours getRetention() const override { return retention; }
};

class TestCommandSettings : public settings::ICommandSettings {
public:
    int maxRetries = 3;
    size_t workerCount = 2;

    int getMaxRetries() const override { return maxRetries; }
    size_t getWorkerCount() const override { return workerCount; }
};

} // namespace ordering::tests
