#pragma once

#include "settings/EnvUtils.hpp"
#include "settings/IPublisherSettings.hpp"
#include <string>
#include <vector>

namespace chronicle::settings {

class PublisherSettings : public IPublisherSettings {
public:
    PublisherSettings()
        : maxRetries_(std::stoi(getEnvOrDefault("CHRONICLE_PUBLISH_MAX_RETRIES", "3")))
        , backoffMs_(parseIntList(getEnvOrDefault("CHRONICLE_PUBLISH_BACKOFF_MS", "1000,2000,4000")))
    {}

    int getMaxRetries() const override { return maxRetries_; }
    std::vector<int> getBackoffMs() const override { return backoffMs_; }

private:
    int maxRetries_;
    std::vector<int> backoffMs_;
};

} // namespace chronicle::settings
