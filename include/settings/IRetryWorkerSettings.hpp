#pragma once

namespace chronicle::settings {

class IRetryWorkerSettings {
public:
    virtual ~IRetryWorkerSettings() = default;

    virtual int getIntervalSeconds() const = 0;
    /// Размер пачки при replay
    virtual int getReplayBatchSize() const = 0;
};

} // namespace chronicle::settings
