#pragma once
#include <cstddef>
#include <cstdint>
#include <span>

namespace astream::net
{
/**
 *  Reliable, ordered, full-duplex byte stream. One per StreamSession.
 *
 *  read() and write() are called from a single stage thread each;
 *  close() may be called from any thread and unblocks both.
 */
class Connection
{
public:
    virtual ~Connection() = default;

    /** Fills `buf` completely. Returns fewer bytes only if the peer
     *  closed the stream; throws TransportError on failure. */
    virtual std::size_t read(std::span<uint8_t> buf) = 0;

    /** Writes all of `data` or throws TransportError. */
    virtual void write(std::span<const uint8_t> data) = 0;

    virtual void close() noexcept = 0;
};

} // namespace astream::net
