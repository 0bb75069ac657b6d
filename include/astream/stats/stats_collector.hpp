#pragma once
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace astream::stats
{
enum class Stage : uint8_t { Encode = 0, Send, Receive, Decode };

inline constexpr std::size_t STAGE_COUNT = 4;

[[nodiscard]] std::string_view stage_name(Stage s) noexcept;

/** One timed stage transition; never mutated after append. */
struct PerformanceSample
{
    Stage    stage;
    double   duration;    ///< seconds
    uint32_t byte_size;
    double   timestamp;   ///< seconds since the collector started
};

struct StageSummary
{
    std::size_t count          {0};
    double      total_duration {0.0};
    double      min_duration   {0.0};
    double      max_duration   {0.0};
    uint64_t    total_bytes    {0};
    uint32_t    min_bytes      {0};
    uint32_t    max_bytes      {0};

    [[nodiscard]] double avg_duration() const noexcept
    { return count ? total_duration / static_cast<double>(count) : 0.0; }

    [[nodiscard]] double avg_bytes() const noexcept
    { return count ? static_cast<double>(total_bytes) / static_cast<double>(count) : 0.0; }
};

struct Summary
{
    std::array<StageSummary, STAGE_COUNT> stages {};
    double   elapsed        {0.0};   ///< seconds
    uint64_t bytes_sent     {0};     ///< wire bytes, send stage
    uint64_t bytes_received {0};     ///< wire bytes, receive stage

    [[nodiscard]] const StageSummary& operator[](Stage s) const noexcept
    { return stages[static_cast<std::size_t>(s)]; }

    /** Wire bytes per second over the session, 0 if nothing elapsed. */
    [[nodiscard]] double throughput() const noexcept
    { return elapsed > 0.0 ? static_cast<double>(bytes_sent + bytes_received) / elapsed : 0.0; }
};

/**
 *  Append-only log of PerformanceSample shared by the four stages.
 *  Appends are serialised by one mutex.
 */
class StatsCollector
{
public:
    using clock = std::chrono::steady_clock;

    StatsCollector();

    void record(Stage stage, double duration, uint32_t byte_size);

    /** Same, measuring from `started` to now. */
    void record_since(Stage stage, clock::time_point started, uint32_t byte_size);

    /** Freezes elapsed(); later calls are ignored. */
    void mark_finished();

    [[nodiscard]] double seconds_since_start() const;

    [[nodiscard]] std::vector<PerformanceSample> samples() const;
    [[nodiscard]] std::size_t                    size() const;
    [[nodiscard]] Summary                        summary() const;

    StatsCollector(const StatsCollector&) = delete;
    StatsCollector& operator=(const StatsCollector&) = delete;

private:
    const clock::time_point              start_;
    mutable std::mutex                   m_;
    std::vector<PerformanceSample>       log_;
    std::optional<clock::time_point>     finished_;
};

} // namespace astream::stats
