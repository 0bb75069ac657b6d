#include <gtest/gtest.h>

#include "memory_pipe.hpp"

#include "codec/codec.hpp"
#include "core/errors.hpp"
#include "core/frame_codec.hpp"
#include "core/reconstructor.hpp"
#include "core/segmenter.hpp"
#include "pipeline/receive_pipeline.hpp"
#include "pipeline/send_pipeline.hpp"
#include "stats/stats_collector.hpp"
#include "util/rate_limiter.hpp"

#include <atomic>
#include <chrono>
#include <cmath>
#include <stdexcept>
#include <thread>
#include <vector>

namespace astream::pipeline
{
namespace
{
using astream::testing::ScriptedConnection;

core::StreamConfig small_config()
{
    core::StreamConfig cfg;
    cfg.chunk_length   = 100;
    cfg.overlap_length = 10;
    cfg.queue_capacity = 2;
    return cfg;
}

std::vector<float> ramp(std::size_t n)
{
    std::vector<float> v(n);
    for (std::size_t i = 0; i < n; ++i)
        v[i] = std::sin(0.05f * static_cast<float>(i)) * 0.5f;
    return v;
}

/** Concatenated frames for the given sequence numbers, raw payloads. */
std::vector<uint8_t> frames_for(const std::vector<uint64_t>& seqs, std::size_t chunk_length,
                                std::size_t payload_size)
{
    std::vector<uint8_t> bytes;
    for (std::size_t i = 0; i < seqs.size(); ++i) {
        core::EncodedUnit u;
        u.sequence        = seqs[i];
        u.payload.assign(payload_size, 0);
        u.original_length = static_cast<uint32_t>(chunk_length);
        u.is_last         = i + 1 == seqs.size();
        const auto f = core::encode_frame(u);
        bytes.insert(bytes.end(), f.begin(), f.end());
    }
    return bytes;
}
} // namespace

TEST(Pipelines, EndToEndOverInMemoryPipe)
{
    const auto cfg   = small_config();
    const auto codec = codec::make_raw_codec(cfg.chunk_length);
    const auto src   = ramp(1234);

    auto ends = astream::testing::make_pipe();
    auto& a = ends.first;
    auto& b = ends.second;
    stats::StatsCollector tx_stats, rx_stats;
    util::RateLimiter     limiter(false, 0);

    core::Reconstructor rec(cfg.chunk_length, cfg.overlap_length);
    ReceiveResult rx;
    std::thread receiver([&] {
        ReceivePipeline pipe(cfg, codec, *b, rx_stats);
        rx = pipe.run([&](core::DecodedChunk&& c) { rec.push(c); });
    });

    core::Segmenter seg(src, cfg.chunk_length, cfg.overlap_length);
    SendPipeline    pipe(cfg, codec, *a, limiter, tx_stats);
    const auto tx = pipe.run(seg);
    receiver.join();

    EXPECT_TRUE(tx.completed);
    EXPECT_EQ(tx.chunks_sent, seg.total_chunks());
    EXPECT_EQ(tx.chunks_encoded, seg.total_chunks());
    EXPECT_TRUE(rx.completed);
    EXPECT_EQ(rx.chunks_received, seg.total_chunks());
    EXPECT_EQ(rx.chunks_decoded, seg.total_chunks());
    EXPECT_EQ(rx.bytes_received, tx.bytes_sent);

    const auto out = rec.take_output();
    ASSERT_EQ(out.size(), src.size());
    for (std::size_t i = 0; i < src.size(); ++i)
        ASSERT_NEAR(out[i], src[i], 1e-6f) << "at " << i;

    const auto tx_sum = tx_stats.summary();
    EXPECT_EQ(tx_sum[stats::Stage::Encode].count, seg.total_chunks());
    EXPECT_EQ(tx_sum[stats::Stage::Send].count, seg.total_chunks());
    EXPECT_EQ(tx_sum.bytes_sent, tx.bytes_sent);
    EXPECT_EQ(rx_stats.summary()[stats::Stage::Decode].count, seg.total_chunks());
}

TEST(Pipelines, SequenceGapIsAProtocolErrorAndStopsDelivery)
{
    const auto cfg   = small_config();
    const auto codec = codec::make_raw_codec(cfg.chunk_length);
    ScriptedConnection conn(frames_for({0, 1, 3}, cfg.chunk_length, cfg.chunk_length * 4));
    stats::StatsCollector stats;

    std::vector<uint64_t> delivered;
    ReceivePipeline pipe(cfg, codec, conn, stats);
    EXPECT_THROW(pipe.run([&](core::DecodedChunk&& c) { delivered.push_back(c.sequence); }),
                 core::ProtocolError);

    EXPECT_LE(delivered.size(), 2u);
    for (std::size_t i = 0; i < delivered.size(); ++i)
        EXPECT_EQ(delivered[i], i);
    EXPECT_GE(conn.close_calls(), 1);
}

TEST(Pipelines, UndecodablePayloadIsACodecError)
{
    const auto cfg   = small_config();
    const auto codec = codec::make_raw_codec(cfg.chunk_length);
    ScriptedConnection conn(frames_for({0}, cfg.chunk_length, 3));
    stats::StatsCollector stats;

    ReceivePipeline pipe(cfg, codec, conn, stats);
    EXPECT_THROW(pipe.run([](core::DecodedChunk&&) {}), core::CodecError);
}

TEST(Pipelines, CleanCloseBeforeFinalChunkIsIncomplete)
{
    const auto cfg   = small_config();
    const auto codec = codec::make_raw_codec(cfg.chunk_length);

    auto bytes = frames_for({0, 1}, cfg.chunk_length, cfg.chunk_length * 4);
    bytes.resize(bytes.size() / 2);                    // exactly frame 0
    ScriptedConnection conn(bytes);
    stats::StatsCollector stats;

    int delivered = 0;
    ReceivePipeline pipe(cfg, codec, conn, stats);
    const auto res = pipe.run([&](core::DecodedChunk&&) { ++delivered; });

    EXPECT_FALSE(res.completed);
    EXPECT_EQ(res.chunks_received, 1u);
    EXPECT_EQ(delivered, 1);
}

TEST(Pipelines, EncoderFailureSurfacesAsCodecError)
{
    const auto cfg = small_config();
    auto codec = codec::make_raw_codec(cfg.chunk_length);
    std::atomic<int> calls {0};
    codec.encode = [inner = codec.encode, &calls](std::span<const float> s,
                                                  const codec::QualityConfig& q) {
        if (++calls == 3)
            throw std::runtime_error("encoder exploded");
        return inner(s, q);
    };

    const auto src = ramp(2000);
    core::Segmenter       seg(src, cfg.chunk_length, cfg.overlap_length);
    ScriptedConnection    conn;
    stats::StatsCollector stats;
    util::RateLimiter     limiter(false, 0);

    SendPipeline pipe(cfg, codec, conn, limiter, stats);
    EXPECT_THROW((void)pipe.run(seg), core::CodecError);

    const std::size_t frame = core::FRAME_PREFIX_SIZE + core::FRAME_FIXED_SIZE + cfg.chunk_length * 4;
    EXPECT_LE(conn.written().size(), 2 * frame);
}

TEST(Pipelines, WriteFailureSurfacesAsTransportError)
{
    const auto cfg   = small_config();
    const auto codec = codec::make_raw_codec(cfg.chunk_length);
    const std::size_t frame = core::FRAME_PREFIX_SIZE + core::FRAME_FIXED_SIZE + cfg.chunk_length * 4;

    const auto src = ramp(2000);
    core::Segmenter       seg(src, cfg.chunk_length, cfg.overlap_length);
    ScriptedConnection    conn({}, frame);
    stats::StatsCollector stats;
    util::RateLimiter     limiter(false, 0);

    SendPipeline pipe(cfg, codec, conn, limiter, stats);
    EXPECT_THROW((void)pipe.run(seg), core::TransportError);
    EXPECT_EQ(conn.written().size(), frame);
}

TEST(Pipelines, ExternalStopEndsARateLimitedSendQuietly)
{
    const auto cfg   = small_config();
    const auto codec = codec::make_raw_codec(cfg.chunk_length);

    const auto src = ramp(5000);
    core::Segmenter       seg(src, cfg.chunk_length, cfg.overlap_length);
    ScriptedConnection    conn;
    stats::StatsCollector stats;
    util::RateLimiter     limiter(true, 100);         // a frame is ~417 bytes

    std::stop_source stop;
    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        stop.request_stop();
    });

    SendPipeline pipe(cfg, codec, conn, limiter, stats);
    const auto t0  = std::chrono::steady_clock::now();
    const auto res = pipe.run(seg, stop.get_token());
    canceller.join();

    EXPECT_FALSE(res.completed);
    EXPECT_EQ(res.chunks_sent, 0u);
    EXPECT_LT(std::chrono::steady_clock::now() - t0, std::chrono::milliseconds(900));
}

TEST(Pipelines, RejectsCodecOfTheWrongBlockSize)
{
    const auto cfg = small_config();
    ScriptedConnection    conn;
    stats::StatsCollector stats;
    util::RateLimiter     limiter(false, 0);

    const auto codec = codec::make_raw_codec(cfg.chunk_length + 1);
    EXPECT_THROW(SendPipeline(cfg, codec, conn, limiter, stats), core::ConfigError);
    EXPECT_THROW(SendPipeline(cfg, codec::Codec{}, conn, limiter, stats), core::ConfigError);
}

} // namespace astream::pipeline
