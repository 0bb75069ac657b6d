#include "core/options.hpp"
#include "core/errors.hpp"

#include <cctype>
#include <limits>
#include <stdexcept>

namespace astream::core
{

Options parse_options(int argc, const char* const* argv, int first)
{
    Options opts;
    for (int i = first; i < argc; ++i) {
        std::string key = argv[i];
        if (key.rfind("--", 0) != 0)
            throw ConfigError("unexpected argument " + key);
        key.erase(0, 2);
        if (key == "realtime" || key == "verbose")
            opts[key] = "1";
        else if (i + 1 < argc)
            opts[key] = argv[++i];
        else
            throw ConfigError("missing value for --" + key);
    }
    return opts;
}

uint64_t number_option(const Options& opts, const std::string& key,
                       uint64_t fallback, uint64_t max)
{
    auto it = opts.find(key);
    if (it == opts.end())
        return fallback;

    const std::string& text = it->second;
    // stoull accepte "-1" et "12abc"
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0])))
        throw ConfigError("--" + key + " expects an unsigned number, got " + text);

    uint64_t v = 0;
    std::size_t used = 0;
    try {
        v = std::stoull(text, &used);
    } catch (const std::exception&) {
        throw ConfigError("--" + key + " is out of range: " + text);
    }
    if (used != text.size())
        throw ConfigError("--" + key + " expects an unsigned number, got " + text);
    if (v > max)
        throw ConfigError("--" + key + " must be <= " + std::to_string(max) + ", got " + text);
    return v;
}

StreamConfig make_config(const Options& opts)
{
    constexpr uint64_t U8  = std::numeric_limits<uint8_t>::max();
    constexpr uint64_t U32 = std::numeric_limits<uint32_t>::max();
    constexpr uint64_t ANY = std::numeric_limits<uint64_t>::max();

    StreamConfig cfg;
    cfg.chunk_length   = number_option(opts, "chunk", cfg.chunk_length, U32);
    cfg.overlap_length = number_option(opts, "overlap", cfg.overlap_length, U32);
    cfg.queue_capacity = number_option(opts, "queue", cfg.queue_capacity, ANY);
    cfg.sample_rate    = static_cast<uint32_t>(number_option(opts, "sample-rate", cfg.sample_rate, U32));
    cfg.quality_layers = static_cast<uint8_t>(number_option(opts, "layers", cfg.quality_layers, U8));
    cfg.io_timeout     = std::chrono::milliseconds(
        static_cast<std::chrono::milliseconds::rep>(number_option(opts, "timeout-ms", 0, U32)));

    if (opts.count("rate-limit")) {
        cfg.rate_limit_enabled          = true;
        cfg.rate_limit_bytes_per_second = static_cast<uint32_t>(number_option(opts, "rate-limit", 0, U32));
    }
    cfg.realtime = opts.count("realtime") != 0;
    cfg.verbose  = opts.count("verbose") != 0;

    cfg.validate();
    return cfg;
}

} // namespace astream::core
