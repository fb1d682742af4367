#pragma once

#include <vector>

namespace chronicle::settings {

class IFailureTrackerSettings {
public:
    virtual ~IFailureTrackerSettings() = default;

    virtual int getMaxRetries() const = 0;
    /// Расписание фоновых повторов, секунды
    virtual std::vector<int> getBackoffSeconds() const = 0;
};

} // namespace chronicle::settings
