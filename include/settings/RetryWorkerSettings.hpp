#pragma once

#include "settings/EnvUtils.hpp"
#include "settings/IRetryWorkerSettings.hpp"
#include <string>

namespace chronicle::settings {

class RetryWorkerSettings : public IRetryWorkerSettings {
public:
    RetryWorkerSettings()
        : intervalSeconds_(std::stoi(getEnvOrDefault("CHRONICLE_RETRY_INTERVAL_SECONDS", "10")))
        , replayBatchSize_(std::stoi(getEnvOrDefault("CHRONICLE_REPLAY_BATCH_SIZE", "100")))
    {}

    int getIntervalSeconds() const override { return intervalSeconds_; }
    int getReplayBatchSize() const override { return replayBatchSize_; }

private:
    int intervalSeconds_;
    int replayBatchSize_;
};

} // namespace chronicle::settings
