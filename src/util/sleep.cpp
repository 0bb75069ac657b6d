#include "util/sleep.hpp"

#include <condition_variable>
#include <mutex>

namespace astream::util
{

bool sleep_for(std::chrono::nanoseconds d, std::stop_token st)
{
    if (d <= std::chrono::nanoseconds::zero())
        return !st.stop_requested();

    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock lk(m);
    // the predicate never holds: returns on timeout or stop only
    cv.wait_for(lk, st, d, [] { return false; });
    return !st.stop_requested();
}

} // namespace astream::util
