#include "stats/stats_collector.hpp"

#include <algorithm>

namespace astream::stats
{

std::string_view stage_name(Stage s) noexcept
{
    switch (s) {
    case Stage::Encode:  return "encode";
    case Stage::Send:    return "send";
    case Stage::Receive: return "receive";
    case Stage::Decode:  return "decode";
    }
    return "unknown";
}

StatsCollector::StatsCollector()
    : start_(clock::now())
{
}

double StatsCollector::seconds_since_start() const
{
    return std::chrono::duration<double>(clock::now() - start_).count();
}

void StatsCollector::record(Stage stage, double duration, uint32_t byte_size)
{
    const double ts = seconds_since_start();

    std::lock_guard lock(m_);
    log_.push_back(PerformanceSample{
        .stage     = stage,
        .duration  = duration,
        .byte_size = byte_size,
        .timestamp = ts
    });
}

void StatsCollector::record_since(Stage stage, clock::time_point started, uint32_t byte_size)
{
    record(stage, std::chrono::duration<double>(clock::now() - started).count(), byte_size);
}

void StatsCollector::mark_finished()
{
    std::lock_guard lock(m_);
    if (!finished_)
        finished_ = clock::now();
}

std::vector<PerformanceSample> StatsCollector::samples() const
{
    std::lock_guard lock(m_);
    return log_;
}

std::size_t StatsCollector::size() const
{
    std::lock_guard lock(m_);
    return log_.size();
}

Summary StatsCollector::summary() const
{
    Summary out;

    std::lock_guard lock(m_);
    const auto end = finished_.value_or(clock::now());
    out.elapsed = std::chrono::duration<double>(end - start_).count();

    for (const auto& s : log_) {
        auto& st = out.stages[static_cast<std::size_t>(s.stage)];
        if (st.count == 0) {
            st.min_duration = st.max_duration = s.duration;
            st.min_bytes    = st.max_bytes    = s.byte_size;
        } else {
            st.min_duration = std::min(st.min_duration, s.duration);
            st.max_duration = std::max(st.max_duration, s.duration);
            st.min_bytes    = std::min(st.min_bytes, s.byte_size);
            st.max_bytes    = std::max(st.max_bytes, s.byte_size);
        }
        ++st.count;
        st.total_duration += s.duration;
        st.total_bytes    += s.byte_size;
    }

    out.bytes_sent     = out[Stage::Send].total_bytes;
    out.bytes_received = out[Stage::Receive].total_bytes;
    return out;
}

} // namespace astream::stats
