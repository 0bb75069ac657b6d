#include "net/stream_session.hpp"
#include "core/errors.hpp"
#include "core/segmenter.hpp"

#include <iostream>

namespace astream::net
{
namespace
{
core::StreamConfig validated(core::StreamConfig cfg)
{
    cfg.validate();
    return cfg;
}
} // namespace

StreamSession::StreamSession(std::unique_ptr<Connection> conn, core::StreamConfig cfg)
    : conn_(std::move(conn)),
      cfg_(validated(std::move(cfg))),
      limiter_(cfg_.rate_limit_enabled, cfg_.rate_limit_bytes_per_second)
{
    if (!conn_)
        throw core::TransportError("session without connection");
}

StreamSession::~StreamSession()
{
    conn_->close();
}

std::unique_ptr<StreamSession> StreamSession::connect(const std::string& host, uint16_t port,
                                                      const core::StreamConfig& cfg)
{
    cfg.validate();
    auto conn = TcpConnection::connect(host, port, cfg.io_timeout);
    std::cout << "[SESSION] connected to " << conn->peer() << '\n';
    return std::make_unique<StreamSession>(std::move(conn), cfg);
}

std::unique_ptr<StreamSession> StreamSession::accept(TcpListener& listener,
                                                     const core::StreamConfig& cfg)
{
    cfg.validate();
    std::cout << "[SESSION] waiting for a sender on port " << listener.port() << '\n';
    auto conn = listener.accept(cfg.io_timeout);
    std::cout << "[SESSION] accepted " << conn->peer() << '\n';
    return std::make_unique<StreamSession>(std::move(conn), cfg);
}

void StreamSession::claim(const char* what)
{
    if (used_)
        throw core::StreamError(std::string("session already used, cannot ") + what);
    used_ = true;
}

void StreamSession::cancel() noexcept
{
    stop_.request_stop();
    conn_->close();
}

/* ─────────────────────────────────────────────────────────── */

pipeline::SendResult StreamSession::send(std::span<const float> source, const codec::Codec& codec)
{
    claim("send");

    core::Segmenter segmenter(source, cfg_.chunk_length, cfg_.overlap_length);

    const core::StreamHeader hdr{
        .version        = core::HEADER_VERSION,
        .quality_layers = cfg_.quality_layers,
        .sample_rate    = cfg_.sample_rate,
        .chunk_length   = static_cast<uint32_t>(cfg_.chunk_length),
        .overlap_length = static_cast<uint32_t>(cfg_.overlap_length),
        .total_chunks   = segmenter.total_chunks()
    };

    std::cout << "[SESSION] streaming " << source.size() << " samples as "
              << hdr.total_chunks << " chunks of " << hdr.chunk_length
              << " (overlap " << hdr.overlap_length << ")\n";

    try {
        pipeline::SendPipeline pipe(cfg_, codec, *conn_, limiter_, stats_);
        if (!send_header(hdr)) {
            stats_.mark_finished();
            std::cout << "[SESSION] send stopped before the stream header\n";
            return {};
        }

        const auto res = pipe.run(segmenter, stop_.get_token());
        stats_.mark_finished();

        if (res.completed)
            std::cout << "[SESSION] sent " << res.chunks_sent << " chunks, "
                      << res.bytes_sent << " bytes\n";
        else
            std::cout << "[SESSION] send stopped after " << res.chunks_sent << " chunks\n";
        return res;
    } catch (const std::exception& e) {
        stats_.mark_finished();
        std::cerr << "[SESSION] send aborted: " << e.what() << '\n';
        conn_->close();
        throw;
    }
}

bool StreamSession::send_header(const core::StreamHeader& hdr)
{
    const std::vector<uint8_t> bytes = core::encode_header(hdr);
    if (!limiter_.acquire(bytes.size(), stop_.get_token()))
        return false;

    try {
        conn_->write(bytes);
    } catch (const core::TransportError&) {
        if (stop_.stop_requested())
            return false;                               // fermée par cancel()
        throw;
    }
    return true;
}

std::optional<core::StreamHeader> StreamSession::await_header()
{
    if (header_)
        return header_;

    try {
        header_ = core::read_header(*conn_);
    } catch (const std::exception& e) {
        if (stop_.stop_requested()) {
            std::cout << "[SESSION] cancelled before the stream header\n";
            return std::nullopt;
        }
        std::cerr << "[SESSION] no valid stream header: " << e.what() << '\n';
        conn_->close();
        throw;
    }

    std::cout << "[SESSION] stream header: rate=" << header_->sample_rate
              << " chunk=" << header_->chunk_length
              << " overlap=" << header_->overlap_length
              << " layers=" << int(header_->quality_layers)
              << " total_chunks=" << header_->total_chunks << '\n';
    return header_;
}

ReceivedStream StreamSession::receive(const codec::Codec& codec, core::Reconstructor::Sink sink)
{
    claim("receive");
    const auto announced = await_header();
    if (!announced) {
        stats_.mark_finished();
        return {};
    }
    const core::StreamHeader hdr = *announced;

    if (codec.block_size != hdr.chunk_length) {
        conn_->close();
        throw core::ProtocolError("stream chunk_length " + std::to_string(hdr.chunk_length)
                                  + " does not match codec block size "
                                  + std::to_string(codec.block_size));
    }

    /* géométrie imposée par l'émetteur */
    core::StreamConfig rcfg   = cfg_;
    rcfg.chunk_length         = hdr.chunk_length;
    rcfg.overlap_length       = hdr.overlap_length;
    rcfg.sample_rate          = hdr.sample_rate;
    rcfg.quality_layers       = hdr.quality_layers;

    const bool keep = !sink;
    if (keep)
        sink = [this](std::span<const float> s) { partial_.insert(partial_.end(), s.begin(), s.end()); };

    /* flux vide : rien ne suit l'en-tête */
    if (hdr.total_chunks == 0) {
        stats_.mark_finished();
        std::cout << "[SESSION] empty stream announced, nothing to receive\n";
        ReceivedStream out{ .header = hdr, .samples = {}, .result = {} };
        out.result.completed = true;
        return out;
    }

    core::Reconstructor recon(hdr.chunk_length, hdr.overlap_length, std::move(sink));

    try {
        pipeline::ReceivePipeline pipe(rcfg, codec, *conn_, stats_);
        const auto res = pipe.run([&recon](core::DecodedChunk&& c) { recon.push(c); },
                                  stop_.get_token());
        stats_.mark_finished();

        std::cout << "[SESSION] received " << res.chunks_received << " chunks, "
                  << res.bytes_received << " bytes, reconstructed "
                  << recon.samples_emitted() << " samples"
                  << (res.completed ? "" : " (incomplete)") << '\n';

        ReceivedStream out{ .header = hdr, .samples = {}, .result = res };
        if (keep)
            out.samples = std::move(partial_);
        return out;
    } catch (const std::exception& e) {
        stats_.mark_finished();
        std::cerr << "[SESSION] receive aborted after " << recon.samples_emitted()
                  << " samples: " << e.what() << '\n';
        conn_->close();
        throw;
    }
}

} // namespace astream::net
