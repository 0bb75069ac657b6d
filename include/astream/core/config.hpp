#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace astream::core
{
/** Stride between the starts of two consecutive chunks. */
[[nodiscard]]
constexpr std::size_t stride_of(std::size_t chunk_length,
                                std::size_t overlap_length) noexcept
{
    return chunk_length - overlap_length;
}

/**
 *  Values consumed by the streaming core.
 *  Defaults match 1 s chunks / 0.1 s overlap at 16 kHz and a 3 kbps channel.
 */
struct StreamConfig
{
    std::size_t chunk_length   {16000};
    std::size_t overlap_length {1600};
    std::size_t queue_capacity {4};

    bool     rate_limit_enabled          {false};
    uint32_t rate_limit_bytes_per_second {375};

    uint32_t sample_rate    {16000};
    uint8_t  quality_layers {6};   ///< forwarded to the codec, never read here

    std::chrono::milliseconds io_timeout {0};   ///< 0 = block forever
    bool realtime {false};   ///< pace encode at one chunk duration per chunk
    bool verbose  {false};   ///< per-chunk log lines

    /** Throws ConfigError on inconsistent values. */
    void validate() const;

    [[nodiscard]] std::size_t stride() const noexcept
    {
        return stride_of(chunk_length, overlap_length);
    }
};

} // namespace astream::core
