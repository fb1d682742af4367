#pragma once

#include "settings/EnvUtils.hpp"
#include "settings/IRepositorySettings.hpp"
#include <string>

namespace chronicle::settings {

class RepositorySettings : public IRepositorySettings {
public:
    RepositorySettings()
        : maxRetries_(std::stoi(getEnvOrDefault("CHRONICLE_SAVE_MAX_RETRIES", "3")))
        , baseDelayMs_(std::stoi(getEnvOrDefault("CHRONICLE_SAVE_BASE_DELAY_MS", "50")))
        , snapshotThreshold_(std::stoi(getEnvOrDefault("CHRONICLE_SNAPSHOT_THRESHOLD", "10")))
    {}

    int getMaxRetries() const override { return maxRetries_; }
    int getBaseDelayMs() const override { return baseDelayMs_; }
    int getSnapshotThreshold() const override { return snapshotThreshold_; }

private:
    int maxRetries_;
    int baseDelayMs_;
    int snapshotThreshold_;
};

} // namespace chronicle::settings
