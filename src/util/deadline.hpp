#ifndef PHISCRUB_UTIL_DEADLINE_HPP
#define PHISCRUB_UTIL_DEADLINE_HPP

#include <algorithm>
#include <chrono>
#include <cstdint>

namespace phiscrub {
namespace util {

/**
 * @class Deadline
 * @brief A point in steady time after which work must stop, or "never".
 */
class Deadline
{
public:
    using Clock = std::chrono::steady_clock;

    /// A deadline that never expires.
    static Deadline none()
    {
        return Deadline(Clock::time_point::max());
    }

    static Deadline after(std::chrono::milliseconds budget)
    {
        return Deadline(Clock::now() + budget);
    }

    /// after(ms), or none() for 0.
    static Deadline afterMillis(uint64_t ms)
    {
        if (ms == 0) {
            return none();
        }
        return after(std::chrono::milliseconds(ms));
    }

    bool unlimited() const { return when_ == Clock::time_point::max(); }

    bool expired() const
    {
        return !unlimited() && Clock::now() >= when_;
    }

    /// The earlier of two deadlines.
    static Deadline earliest(const Deadline &a, const Deadline &b)
    {
        return Deadline(std::min(a.when_, b.when_));
    }

private:
    explicit Deadline(Clock::time_point when)
        : when_(when)
    {
    }

    Clock::time_point when_;
};

} // namespace util
} // namespace phiscrub

#endif // PHISCRUB_UTIL_DEADLINE_HPP
