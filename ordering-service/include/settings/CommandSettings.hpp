#pragma once

#include "ICommandSettings.hpp"
#include <cstdlib>
#include <string>

namespace ordering::settings {

/**
 * @brief COMMAND_MAX_RETRIES (default: 3), COMMAND_WORKERS (default: 4)
 */
class CommandSettings : public ICommandSettings {
public:
    CommandSettings() {
        if (const char* retries = std::getenv("COMMAND_MAX_RETRIES")) {
            maxRetries_ = std::stoi(retries);
        }
        if (const char* workers = std::getenv("COMMAND_WORKERS")) {
            workerCount_ = static_cast<size_t>(std::stoul(workers));
        }
    }

    int getMaxRetries() const override { return maxRetries_; }
    size_t getWorkerCount() const override { return workerCount_; }

private:
    int maxRetries_ = 3;
    size_t workerCount_ = 4;
};

} // namespace ordering::settings
