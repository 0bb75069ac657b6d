#include "pipeline/send_pipeline.hpp"
#include "core/errors.hpp"
#include "core/frame_codec.hpp"
#include "util/bounded_queue.hpp"
#include "util/stage_pair.hpp"
#include "util/sleep.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <mutex>
#include <string>

namespace astream::pipeline
{
using stats::Stage;
using clock = stats::StatsCollector::clock;

SendPipeline::SendPipeline(const core::StreamConfig& cfg,
                           const codec::Codec&       codec,
                           net::Connection&          conn,
                           util::RateLimiter&        limiter,
                           stats::StatsCollector&    stats)
    : cfg_(cfg), codec_(codec), conn_(conn), limiter_(limiter), stats_(stats)
{
    if (!codec_)
        throw core::ConfigError("send pipeline needs a complete codec");
    if (codec_.block_size != cfg_.chunk_length)
        throw core::ConfigError("codec block size " + std::to_string(codec_.block_size)
                                + " != chunk_length " + std::to_string(cfg_.chunk_length));
}

core::EncodedUnit SendPipeline::encode_chunk(const core::Chunk& chunk) const
{
    core::EncodedUnit unit;
    unit.sequence        = chunk.sequence;
    unit.original_length = chunk.valid_length;
    unit.is_last         = chunk.is_last;

    try {
        unit.payload = codec_.encode(chunk.samples, codec::QualityConfig{cfg_.quality_layers});
    } catch (const core::StreamError&) {
        throw;
    } catch (const std::exception& e) {
        throw core::CodecError("encode chunk " + std::to_string(chunk.sequence) + ": " + e.what());
    }
    return unit;
}

SendResult SendPipeline::run(core::Segmenter& segmenter, std::stop_token stop)
{
    util::BoundedQueue<core::EncodedUnit> queue(cfg_.queue_capacity);
    SendResult result;

    std::stop_source   abort;
    std::mutex         err_m;
    std::exception_ptr first_error;

    // errors raised while unwinding an earlier stop are consequences, not causes
    auto fail = [&](std::exception_ptr e) {
        {
            std::lock_guard lk(err_m);
            if (!first_error && !abort.stop_requested())
                first_error = std::move(e);
        }
        abort.request_stop();
    };

    std::stop_callback on_external(stop, [&] { abort.request_stop(); });
    std::stop_callback on_abort(abort.get_token(), [&] {
        queue.close();
        conn_.close();
    });

    const auto pace = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::duration<double>(double(cfg_.stride()) / cfg_.sample_rate));

    /* ── étage 1 : encodage ─────────────────────────────────── */
    auto encoder_stage = [&] {
        const auto token = abort.get_token();
        try {
            while (!token.stop_requested()) {
                auto chunk = segmenter.next();
                if (!chunk)
                    break;

                const auto t0 = clock::now();
                core::EncodedUnit unit = encode_chunk(*chunk);
                stats_.record_since(Stage::Encode, t0, static_cast<uint32_t>(unit.payload.size()));
                ++result.chunks_encoded;

                if (cfg_.verbose)
                    std::cout << "[SEND] encoded chunk " << unit.sequence
                              << " (" << unit.payload.size() << " bytes)\n";

                const bool last = unit.is_last;
                if (!queue.push(std::move(unit)) || last)
                    break;

                if (cfg_.realtime && !util::sleep_for(pace, token))
                    break;
            }
        } catch (...) {
            fail(std::current_exception());
        }
        queue.close();                                   // fin d'entrée
    };

    /* ── étage 2 : émission ─────────────────────────────────── */
    auto sender_stage = [&] {
        const auto token = abort.get_token();
        try {
            while (auto unit = queue.pop()) {
                if (token.stop_requested())
                    break;                               // trame abandonnée

                const auto t0 = clock::now();
                const std::vector<uint8_t> frame = core::encode_frame(*unit);

                if (!limiter_.acquire(frame.size(), token))
                    break;
                conn_.write(frame);

                stats_.record_since(Stage::Send, t0, static_cast<uint32_t>(frame.size()));
                ++result.chunks_sent;
                result.bytes_sent += frame.size();

                if (cfg_.verbose)
                    std::cout << "[SEND] sent chunk " << unit->sequence << " ("
                              << frame.size() << " bytes)"
                              << (limiter_.enabled() ? " (rate limited)" : "") << '\n';

                if (unit->is_last)
                    break;
            }
        } catch (...) {
            fail(std::current_exception());
        }
    };

    util::run_stage_pair(encoder_stage, sender_stage, [&] { abort.request_stop(); });

    if (first_error)
        std::rethrow_exception(first_error);

    result.completed = !abort.stop_requested()
                    && result.chunks_sent == segmenter.total_chunks();
    return result;
}

} // namespace astream::pipeline
