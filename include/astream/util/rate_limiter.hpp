#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <stop_token>

namespace astream::util
{
/**
 *  Token-window throttle on outbound bytes.
 *
 *  Bytes are counted per one-second window; a request that would push the
 *  window over the limit waits out the rest of the window, then opens a new
 *  one. Frames are never split: an oversized frame goes out whole and the
 *  following window absorbs the overshoot.
 *
 *  Touched only by the send stage, hence not synchronised.
 */
class RateLimiter
{
public:
    struct Clock
    {
        std::function<double()> now;   ///< seconds, monotonic
        /** Sleeps `secs`; returns false if interrupted by `st`. */
        std::function<bool(double secs, std::stop_token st)> sleep;

        static Clock steady();
    };

    RateLimiter(bool enabled, uint32_t bytes_per_second);
    RateLimiter(bool enabled, uint32_t bytes_per_second, Clock clock);

    /**
     *  Admits `n` bytes, waiting if the window is exhausted.
     *  Returns false if the wait was interrupted (nothing accounted).
     */
    bool acquire(std::size_t n, std::stop_token st = {});

    [[nodiscard]] bool     enabled()          const noexcept { return enabled_; }
    [[nodiscard]] uint32_t limit()            const noexcept { return limit_; }
    [[nodiscard]] uint64_t bytes_in_window()  const noexcept { return in_window_; }
    [[nodiscard]] uint64_t waits()            const noexcept { return waits_; }
    [[nodiscard]] double   total_wait()       const noexcept { return waited_s_; }

private:
    bool     enabled_;
    uint32_t limit_;
    Clock    clock_;

    double   window_start_ {0.0};
    uint64_t in_window_    {0};

    uint64_t waits_    {0};
    double   waited_s_ {0.0};
};

} // namespace astream::util
