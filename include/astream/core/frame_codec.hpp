#pragma once
/**
 *  Wire format of one EncodedUnit (all integers big-endian):
 *
 *  ┌────────┬────────┬─────────────┬──────────────────────────────┐
 *  │ Offset │ Taille │ Champ       │ Description                  │
 *  ├────────┼────────┼─────────────┼──────────────────────────────┤
 *  │   0    │ 4  o   │ length      │ bytes after this field       │
 *  │   4    │ 8  o   │ sequence    │ chunk index                  │
 *  │  12    │ 4  o   │ orig_len    │ source samples in the chunk  │
 *  │  16    │ 1  o   │ is_last     │ 0 / 1                        │
 *  │  17    │ len-13 │ payload     │ codec bitstream (opaque)     │
 *  └────────┴────────┴─────────────┴──────────────────────────────┘
 *
 *  The stream header sent once before the first frame uses the same
 *  length prefix (length = 26):
 *      magic "ASTR" | ver u8 | layers u8 | rate u32 | chunk u32
 *      | overlap u32 | total_chunks u64
 */
#include "core/chunk.hpp"
#include "net/connection.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace astream::core
{
inline constexpr std::size_t FRAME_PREFIX_SIZE = 4;
inline constexpr std::size_t FRAME_FIXED_SIZE  = 13;             ///< seq + orig_len + flag
inline constexpr uint32_t    MAX_FRAME_BODY    = 64u << 20;      ///< 64 MiB

inline constexpr uint8_t     HEADER_VERSION    = 1;
inline constexpr std::size_t HEADER_BODY_SIZE  = 26;

/** Session description announced by the sender, never negotiated. */
struct StreamHeader
{
    uint8_t  version        {HEADER_VERSION};
    uint8_t  quality_layers {0};
    uint32_t sample_rate    {0};
    uint32_t chunk_length   {0};
    uint32_t overlap_length {0};
    uint64_t total_chunks   {0};   ///< exact count, 0 for an empty source

    bool operator==(const StreamHeader&) const = default;
};

/** Serialises `unit` as one complete frame (prefix included). */
[[nodiscard]] std::vector<uint8_t> encode_frame(const EncodedUnit& unit);

/** Parses one complete frame (prefix included). Throws ProtocolError. */
[[nodiscard]] EncodedUnit decode_frame(std::span<const uint8_t> frame);

[[nodiscard]] std::vector<uint8_t> encode_header(const StreamHeader& hdr);

/** Reads and validates the stream header. Throws ProtocolError. */
[[nodiscard]] StreamHeader read_header(net::Connection& conn);

/**
 *  Lazy frame decoder over a connection.
 *  next() returns std::nullopt on a clean close at a frame boundary and
 *  throws ProtocolError if the peer closes inside a frame.
 */
class FrameReader
{
public:
    explicit FrameReader(net::Connection& conn) : conn_(conn) {}

    [[nodiscard]] std::optional<EncodedUnit> next();

    /** Wire size of the frame last returned by next(). */
    [[nodiscard]] std::size_t last_frame_size() const noexcept { return last_size_; }
    [[nodiscard]] uint64_t    bytes_read()      const noexcept { return total_; }

private:
    net::Connection&     conn_;
    std::vector<uint8_t> body_;
    std::size_t          last_size_ {0};
    uint64_t             total_ {0};
};

} // namespace astream::core
