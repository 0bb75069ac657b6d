#pragma once
#include "codec/codec.hpp"
#include "core/chunk.hpp"
#include "core/config.hpp"
#include "net/connection.hpp"
#include "stats/stats_collector.hpp"

#include <cstdint>
#include <functional>
#include <stop_token>

namespace astream::pipeline
{
struct ReceiveResult
{
    uint64_t chunks_received {0};
    uint64_t chunks_decoded  {0};
    uint64_t bytes_received  {0};   ///< frame bytes, prefixes included
    bool     completed       {false};   ///< final unit decoded, no stop
};

/**
 *  connection ─▶ receive stage ─▶ BoundedQueue<EncodedUnit> ─▶ decode stage ─▶ sink
 *
 *  Sequence numbers must increase by exactly one from 0; a gap or repeat
 *  is a ProtocolError. Error and stop handling mirror SendPipeline.
 */
class ReceivePipeline
{
public:
    using Sink = std::function<void(core::DecodedChunk&&)>;

    ReceivePipeline(const core::StreamConfig& cfg,
                    const codec::Codec&       codec,
                    net::Connection&          conn,
                    stats::StatsCollector&    stats);

    ReceiveResult run(const Sink& sink, std::stop_token stop = {});

    ReceivePipeline(const ReceivePipeline&) = delete;
    ReceivePipeline& operator=(const ReceivePipeline&) = delete;

private:
    [[nodiscard]] core::DecodedChunk decode_unit(const core::EncodedUnit& unit) const;

    const core::StreamConfig& cfg_;
    const codec::Codec&       codec_;
    net::Connection&          conn_;
    stats::StatsCollector&    stats_;
};

} // namespace astream::pipeline
