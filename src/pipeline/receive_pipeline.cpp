#include "pipeline/receive_pipeline.hpp"
#include "core/errors.hpp"
#include "core/frame_codec.hpp"
#include "util/bounded_queue.hpp"
#include "util/stage_pair.hpp"

#include <exception>
#include <iostream>
#include <mutex>
#include <string>

namespace astream::pipeline
{
using stats::Stage;
using clock = stats::StatsCollector::clock;

ReceivePipeline::ReceivePipeline(const core::StreamConfig& cfg,
                                 const codec::Codec&       codec,
                                 net::Connection&          conn,
                                 stats::StatsCollector&    stats)
    : cfg_(cfg), codec_(codec), conn_(conn), stats_(stats)
{
    if (!codec_)
        throw core::ConfigError("receive pipeline needs a complete codec");
}

core::DecodedChunk ReceivePipeline::decode_unit(const core::EncodedUnit& unit) const
{
    core::DecodedChunk out;
    out.sequence        = unit.sequence;
    out.original_length = unit.original_length;
    out.is_last         = unit.is_last;

    try {
        out.samples = codec_.decode(unit.payload);
    } catch (const core::StreamError&) {
        throw;
    } catch (const std::exception& e) {
        throw core::CodecError("decode chunk " + std::to_string(unit.sequence) + ": " + e.what());
    }

    if (out.samples.size() != cfg_.chunk_length)
        throw core::CodecError("chunk " + std::to_string(unit.sequence) + " decoded to "
                               + std::to_string(out.samples.size()) + " samples, expected "
                               + std::to_string(cfg_.chunk_length));
    if (unit.original_length > cfg_.chunk_length)
        throw core::ProtocolError("chunk " + std::to_string(unit.sequence)
                                  + " claims more samples than a chunk holds");
    return out;
}

ReceiveResult ReceivePipeline::run(const Sink& sink, std::stop_token stop)
{
    util::BoundedQueue<core::EncodedUnit> queue(cfg_.queue_capacity);
    ReceiveResult result;
    bool          saw_last = false;
    bool          decoded_last = false;

    std::stop_source   abort;
    std::mutex         err_m;
    std::exception_ptr first_error;

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

    /* ── étage 1 : réception ────────────────────────────────── */
    auto receiver_stage = [&] {
        const auto token = abort.get_token();
        try {
            core::FrameReader reader(conn_);
            uint64_t expected = 0;

            while (!token.stop_requested()) {
                const auto t0 = clock::now();
                auto unit = reader.next();
                if (!unit) {
                    if (!token.stop_requested())
                        std::cerr << "[RECV] connection closed before the final chunk ("
                                  << expected << " chunks received)\n";
                    break;
                }

                if (unit->sequence != expected)
                    throw core::ProtocolError("expected sequence " + std::to_string(expected)
                                              + ", got " + std::to_string(unit->sequence));
                ++expected;

                stats_.record_since(Stage::Receive, t0,
                                    static_cast<uint32_t>(reader.last_frame_size()));
                ++result.chunks_received;
                result.bytes_received += reader.last_frame_size();

                if (cfg_.verbose)
                    std::cout << "[RECV] received chunk " << unit->sequence << " ("
                              << reader.last_frame_size() << " bytes)\n";

                const bool last = unit->is_last;
                if (!queue.push(std::move(*unit)))
                    break;
                if (last) {
                    saw_last = true;
                    break;
                }
            }
        } catch (...) {
            fail(std::current_exception());
        }
        queue.close();
    };

    /* ── étage 2 : décodage ─────────────────────────────────── */
    auto decoder_stage = [&] {
        const auto token = abort.get_token();
        try {
            while (auto unit = queue.pop()) {
                if (token.stop_requested())
                    break;

                const auto t0 = clock::now();
                core::DecodedChunk chunk = decode_unit(*unit);
                stats_.record_since(Stage::Decode, t0,
                                    static_cast<uint32_t>(chunk.samples.size() * sizeof(float)));

                const bool last = chunk.is_last;
                sink(std::move(chunk));
                ++result.chunks_decoded;

                if (cfg_.verbose)
                    std::cout << "[RECV] decoded chunk " << unit->sequence << '\n';

                if (last) {
                    decoded_last = true;
                    break;
                }
            }
        } catch (...) {
            fail(std::current_exception());
        }
    };

    util::run_stage_pair(receiver_stage, decoder_stage, [&] { abort.request_stop(); });

    if (first_error)
        std::rethrow_exception(first_error);

    result.completed = !abort.stop_requested() && saw_last && decoded_last;
    return result;
}

} // namespace astream::pipeline
