#pragma once

#include "settings/IFailureTrackerSettings.hpp"
#include "settings/IPublisherSettings.hpp"
#include "settings/IRepositorySettings.hpp"
#include "settings/IRetryWorkerSettings.hpp"
#include <vector>

namespace chronicle::tests {

// Значения по умолчанию совпадают с продовыми

struct FakeRepositorySettings : settings::IRepositorySettings {
    int maxRetries = 3;
    int baseDelayMs = 50;
    int snapshotThreshold = 10;

    int getMaxRetries() const override { return maxRetries; }
    int getBaseDelayMs() const override { return baseDelayMs; }
    int getSnapshotThreshold() const override { return snapshotThreshold; }
};

struct FakePublisherSettings : settings::IPublisherSettings {
    int maxRetries = 3;
    std::vector<int> backoffMs{1000, 2000, 4000};

    int getMaxRetries() const override { return maxRetries; }
    std::vector<int> getBackoffMs() const override { return backoffMs; }
};

struct FakeFailureTrackerSettings : settings::IFailureTrackerSettings {
    int maxRetries = 5;
    std::vector<int> backoffSeconds{1, 2, 4, 8, 16};

    int getMaxRetries() const override { return maxRetries; }
    std::vector<int> getBackoffSeconds() const override { return backoffSeconds; }
};

struct FakeRetryWorkerSettings : settings::IRetryWorkerSettings {
    int intervalSeconds = 10;
    int replayBatchSize = 100;

    int getIntervalSeconds() const override { return intervalSeconds; }
    int getReplayBatchSize() const override { return replayBatchSize; }
};

} // namespace chronicle::tests
