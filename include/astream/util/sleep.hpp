#pragma once
#include <chrono>
#include <stop_token>

namespace astream::util
{
/** Sleeps `d` unless `st` is stopped first. false = interrupted. */
bool sleep_for(std::chrono::nanoseconds d, std::stop_token st);

} // namespace astream::util
