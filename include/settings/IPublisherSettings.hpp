#pragma once

#include <vector>

namespace chronicle::settings {

class IPublisherSettings {
public:
    virtual ~IPublisherSettings() = default;

    /// Inline-повторов после первой попытки handle()
    virtual int getMaxRetries() const = 0;
    /// Задержки перед повторами, мс (последняя повторяется)
    virtual std::vector<int> getBackoffMs() const = 0;
};

} // namespace chronicle::settings
