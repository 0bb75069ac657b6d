#include "core/reconstructor.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <string>

namespace astream::core
{

Reconstructor::Reconstructor(std::size_t chunk_length, std::size_t overlap_length, Sink sink)
    : chunk_len_(chunk_length),
      overlap_(overlap_length),
      sink_(std::move(sink))
{
    if (chunk_len_ == 0 || overlap_ >= chunk_len_)
        throw ConfigError("reconstructor needs 0 <= overlap < chunk_length");

    // only adjacent chunks may share samples
    if (overlap_ > chunk_len_ - overlap_)
        throw ConfigError("reconstructor needs overlap <= chunk_length / 2");

    tail_.reserve(overlap_);
    scratch_.reserve(chunk_len_);
}

void Reconstructor::emit(std::span<const float> s)
{
    if (s.empty()) return;
    emitted_ += s.size();
    if (sink_)
        sink_(s);
    else
        output_.insert(output_.end(), s.begin(), s.end());
}

void Reconstructor::push(const DecodedChunk& chunk)
{
    if (finished_)
        throw ProtocolError("chunk " + std::to_string(chunk.sequence) + " after final chunk");

    if (chunk.samples.size() != chunk_len_)
        throw CodecError("decoded chunk " + std::to_string(chunk.sequence) + " has "
                         + std::to_string(chunk.samples.size()) + " samples, expected "
                         + std::to_string(chunk_len_));

    const std::size_t valid = chunk.is_last
        ? std::min<std::size_t>(chunk.original_length, chunk_len_)
        : chunk_len_;
    const float* s = chunk.samples.data();

    scratch_.clear();
    std::size_t pos = 0;

    /* 1. fondu enchaîné avec la queue du bloc précédent */
    if (has_tail_) {
        const std::size_t n = std::min(overlap_, valid);
        const float inv = overlap_ ? 1.0f / static_cast<float>(overlap_) : 0.0f;
        for (std::size_t i = 0; i < n; ++i) {
            const float w = static_cast<float>(i) * inv;
            scratch_.push_back(tail_[i] * (1.0f - w) + s[i] * w);
        }
        pos = n;
    }

    /* 2. partie propre du bloc ; la dernière est tronquée au signal source */
    const std::size_t body_end = chunk.is_last ? valid : chunk_len_ - overlap_;
    if (body_end > pos)
        scratch_.insert(scratch_.end(), s + pos, s + body_end);

    emit(scratch_);

    /* 3. nouvelle queue */
    if (chunk.is_last) {
        tail_.clear();
        has_tail_ = false;
        finished_ = true;
    } else {
        tail_.assign(s + chunk_len_ - overlap_, s + chunk_len_);
        has_tail_ = true;
    }
    ++chunks_;
}

} // namespace astream::core
