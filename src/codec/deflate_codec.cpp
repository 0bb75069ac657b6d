#include "codec/codec.hpp"
#include "core/errors.hpp"

#include <zlib.h>

#include <algorithm>
#include <cmath>
#include <string>

namespace astream::codec
{
namespace
{
/* payload : [layers u8][raw_len u32 LE][deflate…] */
constexpr std::size_t PREFIX_SIZE = 5;

int16_t quantize(float x, uint16_t mask) noexcept
{
    const float clamped = std::clamp(x, -1.0f, 1.0f);
    const auto  v = static_cast<int16_t>(std::lround(clamped * 32767.0f));
    return static_cast<int16_t>(static_cast<uint16_t>(v) & mask);
}
} // namespace

Codec make_deflate_codec(std::size_t block_size, uint8_t max_layers, int level)
{
    if (max_layers == 0 || max_layers > 8)
        throw core::CodecError("deflate codec supports 1..8 quality layers");

    Codec c;
    c.block_size         = block_size;
    c.max_quality_layers = max_layers;

    c.encode = [block_size, max_layers, level](std::span<const float> in,
                                               const QualityConfig& q) {
        if (in.size() != block_size)
            throw core::CodecError("deflate encode: expected " + std::to_string(block_size)
                                   + " samples, got " + std::to_string(in.size()));

        const uint8_t layers  = std::clamp<uint8_t>(q.layers, 1, max_layers);
        const int     dropped = 2 * (max_layers - layers);
        const auto    mask    = static_cast<uint16_t>(0xFFFFu << dropped);

        /* 1. PCM 16 bits little-endian ───────────────────────── */
        std::vector<uint8_t> raw(in.size() * 2);
        for (std::size_t i = 0; i < in.size(); ++i) {
            const auto s = static_cast<uint16_t>(quantize(in[i], mask));
            raw[2 * i]     = static_cast<uint8_t>(s);
            raw[2 * i + 1] = static_cast<uint8_t>(s >> 8);
        }

        /* 2. deflate ─────────────────────────────────────────── */
        uLongf dst_len = ::compressBound(static_cast<uLong>(raw.size()));
        std::vector<uint8_t> out(PREFIX_SIZE + dst_len);
        const int rc = ::compress2(out.data() + PREFIX_SIZE, &dst_len,
                                   raw.data(), static_cast<uLong>(raw.size()), level);
        if (rc != Z_OK)
            throw core::CodecError("zlib compress2 failed (" + std::to_string(rc) + ")");

        out.resize(PREFIX_SIZE + dst_len);
        out[0] = layers;
        const auto raw_len = static_cast<uint32_t>(raw.size());
        for (int b = 0; b < 4; ++b)
            out[1 + b] = static_cast<uint8_t>(raw_len >> (8 * b));
        return out;
    };

    c.decode = [block_size](std::span<const uint8_t> in) {
        if (in.size() < PREFIX_SIZE)
            throw core::CodecError("deflate payload too small");

        uint32_t raw_len = 0;
        for (int b = 0; b < 4; ++b)
            raw_len |= uint32_t(in[1 + b]) << (8 * b);

        if (raw_len != block_size * 2)
            throw core::CodecError("deflate payload announces " + std::to_string(raw_len)
                                   + " bytes, expected " + std::to_string(block_size * 2));

        std::vector<uint8_t> raw(raw_len);
        uLongf dst_len = raw_len;
        const int rc = ::uncompress(raw.data(), &dst_len,
                                    in.data() + PREFIX_SIZE,
                                    static_cast<uLong>(in.size() - PREFIX_SIZE));
        if (rc != Z_OK || dst_len != raw_len)
            throw core::CodecError("zlib uncompress failed (" + std::to_string(rc) + ")");

        std::vector<float> out(block_size);
        for (std::size_t i = 0; i < block_size; ++i) {
            const auto s = static_cast<int16_t>(uint16_t(raw[2 * i]) | (uint16_t(raw[2 * i + 1]) << 8));
            out[i] = static_cast<float>(s) / 32767.0f;
        }
        return out;
    };

    return c;
}

} // namespace astream::codec
