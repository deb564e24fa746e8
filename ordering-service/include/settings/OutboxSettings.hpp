#pragma once

#include "IOutboxSettings.hpp"
#include <cstdlib>
#include <string>

namespace ordering::settings {

/**
 * @brief Настройки relay из ENV (OUTBOX_*)
 */
class OutboxSettings : public IOutboxSettings {
public:
    OutboxSettings() {
        batchSize_ = static_cast<size_t>(getEnvOrDefault("OUTBOX_BATCH_SIZE", 50));
        pollIntervalMs_ = getEnvOrDefault("OUTBOX_POLL_INTERVAL_MS", 1000);
        leaseTimeoutMs_ = getEnvOrDefault("OUTBOX_LEASE_TIMEOUT_MS", 30000);
        maxAttempts_ = static_cast<int>(getEnvOrDefault("OUTBOX_MAX_ATTEMPTS", 5));
        backoffBaseMs_ = getEnvOrDefault("OUTBOX_BACKOFF_BASE_MS", 500);
        backoffMaxMs_ = getEnvOrDefault("OUTBOX_BACKOFF_MAX_MS", 60000);
        retentionHours_ = getEnvOrDefault("OUTBOX_RETENTION_HOURS", 72);
    }

    size_t getBatchSize() const override { return batchSize_; }
    std::chrono::milliseconds getPollInterval() const override { return std::chrono::milliseconds(pollIntervalMs_); }
    std::chrono::milliseconds getLeaseTimeout() const override { return std::chrono::milliseconds(leaseTimeoutMs_); }
    int getMaxAttempts() const override { return maxAttempts_; }
    std::chrono::milliseconds getBackoffBase() const override { return std::chrono::milliseconds(backoffBaseMs_); }
    std::chrono::milliseconds getBackoffMax() const override { return std::chrono::milliseconds(backoffMaxMs_); }
    std::chrono::hours getRetention() const override { return std::chrono::hours(retentionHours_); }

private:
    size_t batchSize_;
    long long pollIntervalMs_;
    long long leaseTimeoutMs_;
    int maxAttempts_;
    long long backoffBaseMs_;
    long long backoffMaxMs_;
    long long retentionHours_;

    static long long getEnvOrDefault(const char* name, long long defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::stoll(value) : defaultValue;
    }
};

} // namespace ordering::settings
