#include "util/rate_limiter.hpp"
#include "util/sleep.hpp"

#include <chrono>

namespace astream::util
{

RateLimiter::Clock RateLimiter::Clock::steady()
{
    Clock c;
    c.now = [] {
        using namespace std::chrono;
        return duration<double>(steady_clock::now().time_since_epoch()).count();
    };
    c.sleep = [](double secs, std::stop_token st) {
        return sleep_for(std::chrono::ceil<std::chrono::nanoseconds>(
                             std::chrono::duration<double>(secs)),
                         std::move(st));
    };
    return c;
}

RateLimiter::RateLimiter(bool enabled, uint32_t bytes_per_second)
    : RateLimiter(enabled, bytes_per_second, Clock::steady())
{
}

RateLimiter::RateLimiter(bool enabled, uint32_t bytes_per_second, Clock clock)
    : enabled_(enabled),
      limit_(bytes_per_second),
      clock_(std::move(clock))
{
    window_start_ = clock_.now();
}

bool RateLimiter::acquire(std::size_t n, std::stop_token st)
{
    if (!enabled_)
        return true;

    double now = clock_.now();

    /* nouvelle fenêtre d'une seconde */
    if (now - window_start_ >= 1.0) {
        window_start_ = now;
        in_window_    = 0;
    }

    if (in_window_ + n > limit_) {
        const double sleep_time = 1.0 - (now - window_start_);
        if (sleep_time > 0.0) {
            if (!clock_.sleep(sleep_time, st))
                return false;
            ++waits_;
            waited_s_    += sleep_time;
            window_start_ = clock_.now();
            in_window_    = 0;
        }
    }

    in_window_ += n;
    return true;
}

} // namespace astream::util
