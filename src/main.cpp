#include <csignal>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <asio.hpp>

#include "codec/codec.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/options.hpp"
#include "net/stream_session.hpp"
#include "stats/stats_collector.hpp"

namespace
{
using astream::core::StreamConfig;

void usage()
{
    std::cerr <<
        "usage: astream send --input <file.pcm> [--host H] [--port P] [options]\n"
        "       astream recv --output <file.pcm> [--bind A] [--port P] [options]\n"
        "options: --chunk N --overlap N --queue N --rate-limit BYTES_PER_S\n"
        "         --sample-rate N --layers N --codec deflate|raw --timeout-ms N\n"
        "         --realtime --verbose\n"
        "audio files are raw 16-bit little-endian mono PCM\n";
}

astream::codec::Codec make_codec(const std::string& name, std::size_t block)
{
    if (name == "deflate") return astream::codec::make_deflate_codec(block);
    if (name == "raw")     return astream::codec::make_raw_codec(block);
    throw astream::core::ConfigError("unknown codec " + name);
}

std::vector<float> read_pcm(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw std::runtime_error("cannot open " + path);

    std::vector<float> out;
    unsigned char b[2];
    while (in.read(reinterpret_cast<char*>(b), 2)) {
        const auto s = static_cast<int16_t>(uint16_t(b[0]) | (uint16_t(b[1]) << 8));
        out.push_back(static_cast<float>(s) / 32767.0f);
    }
    return out;
}

void write_pcm(const std::string& path, const std::vector<float>& samples)
{
    std::ofstream out(path, std::ios::binary);
    if (!out)
        throw std::runtime_error("cannot create " + path);

    for (float x : samples) {
        const float c = x < -1.0f ? -1.0f : (x > 1.0f ? 1.0f : x);
        const auto  s = static_cast<uint16_t>(static_cast<int16_t>(std::lround(c * 32767.0f)));
        const char  b[2] = { static_cast<char>(s & 0xFF), static_cast<char>(s >> 8) };
        out.write(b, 2);
    }
    if (!out)
        throw std::runtime_error("write failed on " + path);
}

void print_summary(const astream::stats::Summary& sum, const StreamConfig& cfg, bool sender)
{
    using astream::stats::Stage;
    std::cout << std::fixed << std::setprecision(4)
              << "\n=== " << (sender ? "Sender" : "Receiver") << " statistics ===\n"
              << "elapsed        : " << sum.elapsed << " s\n"
              << "bytes on wire  : " << (sender ? sum.bytes_sent : sum.bytes_received) << '\n'
              << "average rate   : " << std::setprecision(2) << sum.throughput() << " B/s\n";
    if (sender)
        std::cout << "rate limiting  : "
                  << (cfg.rate_limit_enabled
                          ? std::to_string(cfg.rate_limit_bytes_per_second) + " B/s"
                          : std::string("disabled")) << '\n';

    std::cout << std::setprecision(4);
    for (Stage st : sender ? std::initializer_list<Stage>{Stage::Encode, Stage::Send}
                           : std::initializer_list<Stage>{Stage::Receive, Stage::Decode}) {
        const auto& s = sum[st];
        if (s.count == 0) continue;
        std::cout << astream::stats::stage_name(st) << ": n=" << s.count
                  << " total=" << s.total_duration << "s"
                  << " min=" << s.min_duration << "s"
                  << " avg=" << s.avg_duration() << "s"
                  << " max=" << s.max_duration << "s"
                  << " bytes(min/avg/max)=" << s.min_bytes << '/'
                  << std::setprecision(1) << s.avg_bytes() << std::setprecision(4)
                  << '/' << s.max_bytes << '\n';
    }
}

/* session courante, pour l'arrêt sur SIGINT / SIGTERM */
std::mutex                       g_session_m;
astream::net::StreamSession*     g_session = nullptr;

class ActiveSession
{
public:
    explicit ActiveSession(astream::net::StreamSession* s) { set(s); }
    ~ActiveSession() { set(nullptr); }

    ActiveSession(const ActiveSession&) = delete;
    ActiveSession& operator=(const ActiveSession&) = delete;

private:
    static void set(astream::net::StreamSession* s)
    {
        std::lock_guard lk(g_session_m);
        g_session = s;
    }
};
} // namespace

int main(int argc, char** argv)
{
    std::cout.setf(std::ios::unitbuf); // flush stdout after each output
    std::cerr.setf(std::ios::unitbuf); // flush stderr after each output

    if (argc < 2) {
        usage();
        return 2;
    }
    const std::string mode = argv[1];

    asio::io_context  sig_io;
    asio::signal_set  signals(sig_io, SIGINT, SIGTERM);
    signals.async_wait([&signals](std::error_code ec, int sig) {
        if (ec) return;
        std::lock_guard lk(g_session_m);
        if (g_session) {
            std::cout << "[MAIN] signal " << sig << ", stopping session\n";
            g_session->cancel();
            return;
        }
        // pas encore de session (connexion / accept) : comportement par défaut
        std::error_code ignored;
        signals.clear(ignored);
        std::raise(sig);
    });
    std::thread sig_thread([&sig_io] { sig_io.run(); });

    int rc = 0;
    try {
        const auto opts = astream::core::parse_options(argc, argv, 2);
        const StreamConfig cfg = astream::core::make_config(opts);
        const std::string codec_name = opts.count("codec") ? opts.at("codec") : "deflate";
        const uint16_t port = static_cast<uint16_t>(astream::core::number_option(opts, "port", 8888, 65535));

        if (mode == "send") {
            if (!opts.count("input"))
                throw astream::core::ConfigError("send needs --input");

            const auto source = read_pcm(opts.at("input"));
            const auto codec  = make_codec(codec_name, cfg.chunk_length);
            const std::string host = opts.count("host") ? opts.at("host") : "localhost";

            std::cout << "[MAIN] sending " << opts.at("input") << " to " << host << ':' << port << '\n';
            auto session = astream::net::StreamSession::connect(host, port, cfg);
            ActiveSession active(session.get());
            const auto res = session->send(source, codec);

            print_summary(session->stats().summary(), cfg, true);
            rc = res.completed ? 0 : 3;
        }
        else if (mode == "recv") {
            if (!opts.count("output"))
                throw astream::core::ConfigError("recv needs --output");

            astream::net::TcpListener listener(port, opts.count("bind") ? opts.at("bind") : "0.0.0.0");
            auto session = astream::net::StreamSession::accept(listener, cfg);
            ActiveSession active(session.get());

            // sans en-tête (arrêt demandé), receive() rend un flux incomplet
            const auto hdr   = session->await_header();
            const auto codec = make_codec(codec_name, hdr ? hdr->chunk_length : cfg.chunk_length);

            std::vector<float> audio;
            try {
                auto rx = session->receive(codec);
                audio = std::move(rx.samples);
                rc = rx.result.completed ? 0 : 3;
            } catch (const astream::core::StreamError&) {
                audio = session->take_partial_output();   // préfixe valide
                write_pcm(opts.at("output"), audio);
                throw;
            }

            write_pcm(opts.at("output"), audio);
            std::cout << "[MAIN] wrote " << audio.size() << " samples to " << opts.at("output") << '\n';
            print_summary(session->stats().summary(), session->config(), false);
        }
        else {
            usage();
            rc = 2;
        }
    }
    catch (const astream::core::ConfigError& e) {
        std::cerr << "[Fatal] " << e.what() << '\n';
        usage();
        rc = 2;
    }
    catch (const std::exception& e) {
        std::cerr << "[Fatal] " << e.what() << '\n';
        rc = 1;
    }

    sig_io.stop();
    sig_thread.join();
    return rc;
}
