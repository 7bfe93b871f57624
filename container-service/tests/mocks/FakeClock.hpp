#pragma once

#include "ports/output/IClock.hpp"
#include <chrono>
#include <mutex>

namespace containers::tests {

/**
 * @brief Управляемые часы: время двигается только через advance()
 */
class FakeClock : public ports::output::IClock {
public:
    FakeClock() : now_(domain::Timestamp::fromEpochMicros(1700000000LL * 1000000)) {}

    domain::Timestamp now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void advance(std::chrono::seconds delta) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = now_.plus(delta);
    }

private:
    mutable std::mutex mutex_;
    domain::Timestamp now_;
};

} // namespace containers::tests
