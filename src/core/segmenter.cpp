#include "core/segmenter.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"

#include <algorithm>

namespace astream::core
{

Segmenter::Segmenter(std::span<const float> source,
                     std::size_t chunk_length,
                     std::size_t overlap_length)
    : source_(source),
      chunk_len_(chunk_length),
      overlap_(overlap_length),
      stride_(0)
{
    if (chunk_len_ == 0)
        throw ConfigError("chunk_length must be > 0");
    if (overlap_ >= chunk_len_)
        throw ConfigError("overlap_length must be < chunk_length");

    stride_ = stride_of(chunk_len_, overlap_);

    /* one chunk per stride start strictly inside the source */
    const std::size_t n = source_.size();
    total_ = (n + stride_ - 1) / stride_;
}

std::optional<Chunk> Segmenter::next()
{
    if (next_seq_ >= total_)
        return std::nullopt;

    const std::size_t start = static_cast<std::size_t>(next_seq_) * stride_;
    const std::size_t avail = std::min(chunk_len_, source_.size() - start);

    Chunk c;
    c.sequence     = next_seq_;
    c.valid_length = static_cast<uint32_t>(avail);
    c.is_last      = (next_seq_ + 1 == total_);

    c.samples.assign(chunk_len_, 0.0f);                 // padding
    std::copy_n(source_.begin() + start, avail, c.samples.begin());

    ++next_seq_;
    return c;
}

} // namespace astream::core
