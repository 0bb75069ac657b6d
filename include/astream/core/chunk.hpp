#pragma once
#include <cstdint>
#include <vector>

namespace astream::core
{
/** Fixed-length slice of the source signal, zero padded at the tail. */
struct Chunk
{
    uint64_t           sequence {0};
    std::vector<float> samples;          ///< always chunk_length samples
    uint32_t           valid_length {0}; ///< source samples before padding
    bool               is_last {false};
};

/** Codec output for one chunk, immutable once built. */
struct EncodedUnit
{
    uint64_t             sequence {0};
    std::vector<uint8_t> payload;             ///< opaque to the transport
    uint32_t             original_length {0}; ///< = Chunk::valid_length
    bool                 is_last {false};

    bool operator==(const EncodedUnit&) const = default;
};

/** Codec output on the receiving side, handed to the Reconstructor. */
struct DecodedChunk
{
    uint64_t           sequence {0};
    std::vector<float> samples;
    uint32_t           original_length {0};
    bool               is_last {false};
};

} // namespace astream::core
