#pragma once

#include "ports/output/IClock.hpp"
#include <thread>

namespace chronicle::adapters::secondary {

class SystemClock : public ports::output::IClock {
public:
    domain::Timestamp now() const override {
        return domain::Timestamp::now();
    }

    void sleepFor(std::chrono::milliseconds duration) override {
        std::this_thread::sleep_for(duration);
    }
};

} // namespace chronicle::adapters::secondary
