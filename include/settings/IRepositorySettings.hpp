#pragma once

namespace chronicle::settings {

class IRepositorySettings {
public:
    virtual ~IRepositorySettings() = default;

    /// Повторов после первой попытки при ConcurrencyError
    virtual int getMaxRetries() const = 0;
    /// Задержка попытки n: baseDelay * 2^n
    virtual int getBaseDelayMs() const = 0;
    /// Снапшот пишется при пересечении кратного значения версии
    virtual int getSnapshotThreshold() const = 0;
};

} // namespace chronicle::settings
