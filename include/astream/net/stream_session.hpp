#pragma once
#include "codec/codec.hpp"
#include "core/config.hpp"
#include "core/frame_codec.hpp"
#include "core/reconstructor.hpp"
#include "net/connection.hpp"
#include "net/tcp_connection.hpp"
#include "pipeline/receive_pipeline.hpp"
#include "pipeline/send_pipeline.hpp"
#include "stats/stats_collector.hpp"
#include "util/rate_limiter.hpp"

#include <memory>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <vector>

namespace astream::net
{
struct ReceivedStream
{
    core::StreamHeader      header;
    std::vector<float>      samples;   ///< empty when a sink was supplied
    pipeline::ReceiveResult result;
};

/**
 *  One connection, one direction, one run.
 *
 *  Owns the connection together with the per-session RateLimiter,
 *  StatsCollector and stop source; all of them die with the session.
 *  A failed session is not reusable: open a new one and start over.
 */
class StreamSession
{
public:
    StreamSession(std::unique_ptr<Connection> conn, core::StreamConfig cfg);
    ~StreamSession();

    /** Validates `cfg` then connects. */
    static std::unique_ptr<StreamSession> connect(const std::string& host, uint16_t port,
                                                  const core::StreamConfig& cfg);

    /** Validates `cfg` then waits for one peer on `listener`. */
    static std::unique_ptr<StreamSession> accept(TcpListener& listener,
                                                 const core::StreamConfig& cfg);

    /** Writes the stream header then streams `source` until the final frame.
     *  The header goes through the rate limiter like every frame. */
    pipeline::SendResult send(std::span<const float> source, const codec::Codec& codec);

    /** Reads the stream header once; later calls return the same header.
     *  std::nullopt if the session was cancelled before it arrived. */
    std::optional<core::StreamHeader> await_header();

    /**
     *  Receives and reconstructs the stream announced by the header.
     *  With a sink, output goes there; otherwise it is returned. After a
     *  failure, take_partial_output() gives the reconstructed prefix.
     *  A cancel, even before the header, returns with completed == false.
     */
    ReceivedStream receive(const codec::Codec& codec, core::Reconstructor::Sink sink = {});

    [[nodiscard]] std::vector<float> take_partial_output() { return std::move(partial_); }

    /** Safe from any thread, including a signal-driven one. */
    void cancel() noexcept;

    [[nodiscard]] bool cancelled() const noexcept { return stop_.stop_requested(); }

    [[nodiscard]] const core::StreamConfig&    config() const noexcept { return cfg_; }
    [[nodiscard]] const stats::StatsCollector& stats()  const noexcept { return stats_; }
    [[nodiscard]] const util::RateLimiter&     limiter() const noexcept { return limiter_; }

    StreamSession(const StreamSession&) = delete;
    StreamSession& operator=(const StreamSession&) = delete;

private:
    void claim(const char* what);

    /** false if cancelled before the header was fully written. */
    bool send_header(const core::StreamHeader& hdr);

    std::unique_ptr<Connection>       conn_;
    core::StreamConfig                cfg_;
    util::RateLimiter                 limiter_;
    stats::StatsCollector             stats_;
    std::stop_source                  stop_;
    std::optional<core::StreamHeader> header_;
    std::vector<float>                partial_;
    bool                              used_ {false};
};

} // namespace astream::net
