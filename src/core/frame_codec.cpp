#include "core/frame_codec.hpp"
#include "core/errors.hpp"

#include <array>
#include <cstring>
#include <string>

namespace astream::core
{
namespace
{
constexpr std::array<uint8_t, 4> HEADER_MAGIC {'A', 'S', 'T', 'R'};

void put_u32(std::vector<uint8_t>& out, uint32_t v)
{
    for (int shift = 24; shift >= 0; shift -= 8)
        out.push_back(static_cast<uint8_t>(v >> shift));
}

void put_u64(std::vector<uint8_t>& out, uint64_t v)
{
    for (int shift = 56; shift >= 0; shift -= 8)
        out.push_back(static_cast<uint8_t>(v >> shift));
}

uint32_t get_u32(const uint8_t* p) noexcept
{
    return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16)
         | (uint32_t(p[2]) <<  8) |  uint32_t(p[3]);
}

uint64_t get_u64(const uint8_t* p) noexcept
{
    return (uint64_t(get_u32(p)) << 32) | get_u32(p + 4);
}

EncodedUnit parse_body(std::span<const uint8_t> body)
{
    if (body.size() < FRAME_FIXED_SIZE)
        throw ProtocolError("frame body too small (" + std::to_string(body.size()) + " bytes)");

    const uint8_t flag = body[12];
    if (flag > 1)
        throw ProtocolError("invalid is_last flag " + std::to_string(flag));

    EncodedUnit u;
    u.sequence        = get_u64(body.data());
    u.original_length = get_u32(body.data() + 8);
    u.is_last         = flag == 1;
    u.payload.assign(body.begin() + FRAME_FIXED_SIZE, body.end());
    return u;
}

uint32_t check_length(uint32_t len)
{
    if (len < FRAME_FIXED_SIZE)
        throw ProtocolError("frame length " + std::to_string(len) + " below minimum");
    if (len > MAX_FRAME_BODY)
        throw ProtocolError("frame length " + std::to_string(len) + " exceeds limit");
    return len;
}
} // namespace

std::vector<uint8_t> encode_frame(const EncodedUnit& unit)
{
    if (unit.payload.size() > MAX_FRAME_BODY - FRAME_FIXED_SIZE)
        throw ProtocolError("payload too large for one frame");

    const auto len = static_cast<uint32_t>(FRAME_FIXED_SIZE + unit.payload.size());

    std::vector<uint8_t> out;
    out.reserve(FRAME_PREFIX_SIZE + len);
    put_u32(out, len);
    put_u64(out, unit.sequence);
    put_u32(out, unit.original_length);
    out.push_back(unit.is_last ? 1 : 0);
    out.insert(out.end(), unit.payload.begin(), unit.payload.end());
    return out;
}

EncodedUnit decode_frame(std::span<const uint8_t> frame)
{
    if (frame.size() < FRAME_PREFIX_SIZE)
        throw ProtocolError("truncated length prefix");

    const uint32_t len = check_length(get_u32(frame.data()));
    if (frame.size() != FRAME_PREFIX_SIZE + len)
        throw ProtocolError("frame size mismatch: prefix says " + std::to_string(len)
                            + ", got " + std::to_string(frame.size() - FRAME_PREFIX_SIZE));

    return parse_body(frame.subspan(FRAME_PREFIX_SIZE));
}

std::vector<uint8_t> encode_header(const StreamHeader& hdr)
{
    std::vector<uint8_t> out;
    out.reserve(FRAME_PREFIX_SIZE + HEADER_BODY_SIZE);
    put_u32(out, static_cast<uint32_t>(HEADER_BODY_SIZE));
    out.insert(out.end(), HEADER_MAGIC.begin(), HEADER_MAGIC.end());
    out.push_back(hdr.version);
    out.push_back(hdr.quality_layers);
    put_u32(out, hdr.sample_rate);
    put_u32(out, hdr.chunk_length);
    put_u32(out, hdr.overlap_length);
    put_u64(out, hdr.total_chunks);
    return out;
}

StreamHeader read_header(net::Connection& conn)
{
    std::array<uint8_t, FRAME_PREFIX_SIZE + HEADER_BODY_SIZE> buf {};

    if (conn.read(buf) != buf.size())
        throw ProtocolError("connection closed before stream header");

    if (get_u32(buf.data()) != HEADER_BODY_SIZE)
        throw ProtocolError("unexpected stream header length");

    const uint8_t* p = buf.data() + FRAME_PREFIX_SIZE;
    if (std::memcmp(p, HEADER_MAGIC.data(), HEADER_MAGIC.size()) != 0)
        throw ProtocolError("bad stream header magic");
    p += HEADER_MAGIC.size();

    StreamHeader hdr;
    hdr.version = p[0];
    if (hdr.version != HEADER_VERSION)
        throw ProtocolError("unsupported stream version " + std::to_string(hdr.version));

    hdr.quality_layers = p[1];
    hdr.sample_rate    = get_u32(p + 2);
    hdr.chunk_length   = get_u32(p + 6);
    hdr.overlap_length = get_u32(p + 10);
    hdr.total_chunks   = get_u64(p + 14);

    if (hdr.chunk_length == 0 || hdr.overlap_length >= hdr.chunk_length
        || hdr.overlap_length > hdr.chunk_length - hdr.overlap_length)
        throw ProtocolError("invalid chunk geometry in stream header");

    return hdr;
}

/* ─────────────────────────────────────────────────────────── */

std::optional<EncodedUnit> FrameReader::next()
{
    std::array<uint8_t, FRAME_PREFIX_SIZE> prefix {};

    /* 1. length prefix ─ 0 octet lu = fermeture propre */
    const std::size_t got = conn_.read(prefix);
    if (got == 0)
        return std::nullopt;
    if (got != prefix.size())
        throw ProtocolError("connection closed inside a length prefix");

    const uint32_t len = check_length(get_u32(prefix.data()));

    /* 2. corps complet, sinon trame corrompue */
    body_.resize(len);
    if (conn_.read(body_) != len)
        throw ProtocolError("connection closed inside a frame");

    last_size_ = FRAME_PREFIX_SIZE + len;
    total_    += last_size_;
    return parse_body(body_);
}

} // namespace astream::core
