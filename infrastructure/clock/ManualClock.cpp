#include "ManualClock.h"

namespace application {

ManualClock::ManualClock(TimePoint start)
    : now_(start)
{
}

TimePoint ManualClock::now() const
{
    return now_;
}

void ManualClock::sleepFor(std::chrono::milliseconds duration)
{
    sleeps_.push_back(duration);
    totalSlept_ += duration;
    now_ += duration;
}

void ManualClock::advance(std::chrono::milliseconds duration)
{
    now_ += duration;
}

} // namespace application
