#pragma once
#include "core/chunk.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <vector>

namespace astream::core
{
/**
 *  Overlap-add of consecutive decoded chunks.
 *
 *  Keeps the last O samples of the previous chunk and cross-fades them
 *  linearly (w = i / O) into the first O samples of the next one. The
 *  final chunk is trimmed to its original_length, so the output has
 *  exactly the length of the source.
 */
class Reconstructor
{
public:
    using Sink = std::function<void(std::span<const float>)>;

    /** Without a sink, emitted samples accumulate in take_output(). */
    Reconstructor(std::size_t chunk_length, std::size_t overlap_length, Sink sink = {});

    /** Throws CodecError on a wrong block size, ProtocolError on a chunk
     *  received after the final one. */
    void push(const DecodedChunk& chunk);

    [[nodiscard]] bool        finished()        const noexcept { return finished_; }
    [[nodiscard]] uint64_t    chunks_seen()     const noexcept { return chunks_; }
    [[nodiscard]] std::size_t samples_emitted() const noexcept { return emitted_; }

    [[nodiscard]] std::vector<float> take_output() { return std::move(output_); }

private:
    void emit(std::span<const float> s);

    std::size_t        chunk_len_;
    std::size_t        overlap_;
    Sink               sink_;

    std::vector<float> tail_;
    std::vector<float> scratch_;
    std::vector<float> output_;
    bool               has_tail_ {false};
    bool               finished_ {false};
    uint64_t           chunks_   {0};
    std::size_t        emitted_  {0};
};

} // namespace astream::core
