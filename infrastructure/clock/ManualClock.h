#pragma once

#include <chrono>
#include <vector>

#include "layers/application/application_layer.h"

namespace application {

// Time only moves when somebody sleeps or advance() is called.
class ManualClock final : public Clock
{
public:
    explicit ManualClock(TimePoint start = TimePoint(std::chrono::hours(24 * 365 * 50)));

    TimePoint now() const override;
    void sleepFor(std::chrono::milliseconds duration) override;

    void advance(std::chrono::milliseconds duration);

    std::chrono::milliseconds totalSlept() const noexcept { return totalSlept_; }
    const std::vector<std::chrono::milliseconds>& sleeps() const noexcept { return sleeps_; }

private:
    TimePoint now_;
    std::chrono::milliseconds totalSlept_{0};
    std::vector<std::chrono::milliseconds> sleeps_;
};

} // namespace application
