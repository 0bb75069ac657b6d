#pragma once
/**
 *  Découpe un signal continu en blocs de longueur fixe qui se chevauchent.
 *
 *      chunk i  = source[i*S, i*S + L)       S = L - O
 *
 *  Le dernier bloc est complété par des zéros et porte is_last = true.
 *  Un seul passage sur la source, non redémarrable.
 */
#include "core/chunk.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace astream::core
{
class Segmenter
{
public:
    /** Throws ConfigError if chunk_length == 0 or overlap >= chunk_length.
     *  `source` must outlive the segmenter. */
    Segmenter(std::span<const float> source,
              std::size_t chunk_length,
              std::size_t overlap_length);

    /** Next chunk, or std::nullopt once the source is exhausted. */
    [[nodiscard]] std::optional<Chunk> next();

    /** Number of chunks the whole source produces. */
    [[nodiscard]] uint64_t total_chunks() const noexcept { return total_; }

    [[nodiscard]] std::size_t chunk_length()   const noexcept { return chunk_len_; }
    [[nodiscard]] std::size_t overlap_length() const noexcept { return overlap_; }

    Segmenter(const Segmenter&) = delete;
    Segmenter& operator=(const Segmenter&) = delete;

private:
    std::span<const float> source_;
    std::size_t            chunk_len_;
    std::size_t            overlap_;
    std::size_t            stride_;
    uint64_t               total_ {0};
    uint64_t               next_seq_ {0};
};
} // namespace astream::core
