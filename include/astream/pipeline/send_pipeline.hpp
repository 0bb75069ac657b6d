#pragma once
#include "codec/codec.hpp"
#include "core/chunk.hpp"
#include "core/config.hpp"
#include "core/segmenter.hpp"
#include "net/connection.hpp"
#include "stats/stats_collector.hpp"
#include "util/rate_limiter.hpp"

#include <cstdint>
#include <stop_token>

namespace astream::pipeline
{
struct SendResult
{
    uint64_t chunks_encoded {0};
    uint64_t chunks_sent    {0};
    uint64_t bytes_sent     {0};   ///< frame bytes, prefixes included
    bool     completed      {false};   ///< final unit written, no stop
};

/**
 *  Encode stage ─▶ BoundedQueue<EncodedUnit> ─▶ send stage ─▶ connection
 *
 *  Each stage runs on its own thread. The first error raised by either
 *  stage stops the other (queue and connection are closed) and is
 *  rethrown by run(). An external stop unwinds both and run() returns
 *  with completed == false.
 */
class SendPipeline
{
public:
    SendPipeline(const core::StreamConfig& cfg,
                 const codec::Codec&       codec,
                 net::Connection&          conn,
                 util::RateLimiter&        limiter,
                 stats::StatsCollector&    stats);

    SendResult run(core::Segmenter& segmenter, std::stop_token stop = {});

    SendPipeline(const SendPipeline&) = delete;
    SendPipeline& operator=(const SendPipeline&) = delete;

private:
    [[nodiscard]] core::EncodedUnit encode_chunk(const core::Chunk& chunk) const;

    const core::StreamConfig& cfg_;
    const codec::Codec&       codec_;
    net::Connection&          conn_;
    util::RateLimiter&        limiter_;
    stats::StatsCollector&    stats_;
};

} // namespace astream::pipeline
