#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <vector>

namespace astream::codec
{
/** Opaque quality knob forwarded from the config to the backend. */
struct QualityConfig
{
    uint8_t layers {1};
};

/**
 *  Codec capability: one encode / decode function pair with a fixed block
 *  size. Backends throw core::CodecError on failure.
 */
struct Codec
{
    std::function<std::vector<uint8_t>(std::span<const float>, const QualityConfig&)> encode;
    std::function<std::vector<float>(std::span<const uint8_t>)>                       decode;

    std::size_t block_size         {0};   ///< samples in / out per call
    uint8_t     max_quality_layers {1};

    [[nodiscard]] explicit operator bool() const noexcept
    { return encode && decode && block_size > 0; }
};

/** Lossless float32 little-endian passthrough. */
[[nodiscard]] Codec make_raw_codec(std::size_t block_size);

/**
 *  16-bit PCM + zlib deflate. `layers` below `max_layers` drop two low
 *  bits per missing layer before deflating.
 */
[[nodiscard]] Codec make_deflate_codec(std::size_t block_size,
                                       uint8_t max_layers = 6,
                                       int level = 6);

} // namespace astream::codec
