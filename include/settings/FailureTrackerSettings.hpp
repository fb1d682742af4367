#pragma once

#include "settings/EnvUtils.hpp"
#include "settings/IFailureTrackerSettings.hpp"
#include <string>
#include <vector>

namespace chronicle::settings {

class FailureTrackerSettings : public IFailureTrackerSettings {
public:
    FailureTrackerSettings()
        : maxRetries_(std::stoi(getEnvOrDefault("CHRONICLE_FAILURE_MAX_RETRIES", "5")))
        , backoffSeconds_(parseIntList(getEnvOrDefault("CHRONICLE_FAILURE_BACKOFF_SECONDS", "1,2,4,8,16")))
    {}

    int getMaxRetries() const override { return maxRetries_; }
    std::vector<int> getBackoffSeconds() const override { return backoffSeconds_; }

private:
    int maxRetries_;
    std::vector<int> backoffSeconds_;
};

} // namespace chronicle::settings
