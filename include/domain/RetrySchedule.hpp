#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace chronicle::domain {

/**
 * @brief Расписание фоновых повторов для сбоев проекций
 *
 * Задержка для retryCount = schedule[min(retryCount, size - 1)].
 * После maxRetries автоматических повторов больше нет (nullopt).
 */
class RetrySchedule {
public:
    RetrySchedule(std::vector<int> delaysSeconds, int maxRetries)
        : delaysSeconds_(std::move(delaysSeconds))
        , maxRetries_(maxRetries)
    {
        if (delaysSeconds_.empty()) {
            delaysSeconds_.push_back(1);
        }
    }

    std::chrono::seconds delayFor(int retryCount) const {
        auto index = static_cast<size_t>(std::max(retryCount, 0));
        index = std::min(index, delaysSeconds_.size() - 1);
        return std::chrono::seconds(delaysSeconds_[index]);
    }

    /**
     * @brief Задержка до следующего повтора или nullopt, если лимит исчерпан
     */
    std::optional<std::chrono::seconds> nextDelay(int retryCount) const {
        if (retryCount >= maxRetries_) {
            return std::nullopt;
        }
        return delayFor(retryCount);
    }

    int maxRetries() const { return maxRetries_; }

private:
    std::vector<int> delaysSeconds_;
    int maxRetries_;
};

} // namespace chronicle::domain
