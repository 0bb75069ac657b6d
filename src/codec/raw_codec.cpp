#include "codec/codec.hpp"
#include "core/errors.hpp"

#include <cstring>
#include <string>

namespace astream::codec
{

Codec make_raw_codec(std::size_t block_size)
{
    Codec c;
    c.block_size         = block_size;
    c.max_quality_layers = 1;

    c.encode = [block_size](std::span<const float> in, const QualityConfig&) {
        if (in.size() != block_size)
            throw core::CodecError("raw encode: expected " + std::to_string(block_size)
                                   + " samples, got " + std::to_string(in.size()));

        std::vector<uint8_t> out(in.size() * 4);
        for (std::size_t i = 0; i < in.size(); ++i) {
            uint32_t bits;
            std::memcpy(&bits, &in[i], sizeof(bits));
            for (int b = 0; b < 4; ++b)
                out[i * 4 + b] = static_cast<uint8_t>(bits >> (8 * b));
        }
        return out;
    };

    c.decode = [block_size](std::span<const uint8_t> in) {
        if (in.size() != block_size * 4)
            throw core::CodecError("raw decode: payload of " + std::to_string(in.size())
                                   + " bytes, expected " + std::to_string(block_size * 4));

        std::vector<float> out(block_size);
        for (std::size_t i = 0; i < block_size; ++i) {
            uint32_t bits = 0;
            for (int b = 0; b < 4; ++b)
                bits |= uint32_t(in[i * 4 + b]) << (8 * b);
            std::memcpy(&out[i], &bits, sizeof(bits));
        }
        return out;
    };

    return c;
}

} // namespace astream::codec
