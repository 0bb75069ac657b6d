#include <gtest/gtest.h>

#include "core/errors.hpp"
#include "core/reconstructor.hpp"
#include "core/segmenter.hpp"

#include <cmath>
#include <vector>

namespace astream::core
{
namespace
{
std::vector<float> sine(std::size_t n)
{
    std::vector<float> v(n);
    for (std::size_t i = 0; i < n; ++i)
        v[i] = 0.8f * std::sin(0.01f * static_cast<float>(i));
    return v;
}

DecodedChunk as_decoded(const Chunk& c)
{
    return DecodedChunk{ .sequence = c.sequence, .samples = c.samples,
                         .original_length = c.valid_length, .is_last = c.is_last };
}

std::vector<float> reconstruct(const std::vector<float>& src, std::size_t len, std::size_t ovl)
{
    Segmenter seg(src, len, ovl);
    Reconstructor rec(len, ovl);
    while (auto c = seg.next())
        rec.push(as_decoded(*c));
    EXPECT_TRUE(rec.finished() || src.empty());
    return rec.take_output();
}
} // namespace

TEST(Reconstructor, OutputMatchesSourceLengthForReferenceScenario)
{
    const auto src = sine(32000);
    const auto out = reconstruct(src, 16000, 1600);

    ASSERT_EQ(out.size(), 32000u);
    for (std::size_t i = 0; i < out.size(); ++i)
        ASSERT_NEAR(out[i], src[i], 1e-6f) << "at " << i;
}

TEST(Reconstructor, LosslessChunksRebuildTheSignalForManyGeometries)
{
    const std::size_t lengths[] = {1, 99, 100, 101, 250, 1000, 1234};
    const std::pair<std::size_t, std::size_t> geometries[] = {{100, 10}, {64, 32}, {50, 0}, {16, 1}};

    for (const auto& [len, ovl] : geometries) {
        for (std::size_t n : lengths) {
            const auto src = sine(n);
            const auto out = reconstruct(src, len, ovl);
            ASSERT_EQ(out.size(), n) << "L=" << len << " O=" << ovl;
            for (std::size_t i = 0; i < n; ++i)
                ASSERT_NEAR(out[i], src[i], 1e-6f) << "L=" << len << " O=" << ovl << " i=" << i;
        }
    }
}

TEST(Reconstructor, CrossFadeIsLinearFromTailToIncomingChunk)
{
    Reconstructor rec(8, 4);
    rec.push({ .sequence = 0, .samples = std::vector<float>(8, 1.0f), .original_length = 8, .is_last = false });
    rec.push({ .sequence = 1, .samples = std::vector<float>(8, 0.0f), .original_length = 8, .is_last = true });

    const auto out = rec.take_output();
    const std::vector<float> expected = {
        1, 1, 1, 1,                 // chunk 0, [0, L-O)
        1.0f, 0.75f, 0.5f, 0.25f,   // blend, w = i / O
        0, 0, 0, 0                  // rest of the final chunk
    };
    ASSERT_EQ(out.size(), expected.size());
    for (std::size_t i = 0; i < out.size(); ++i)
        EXPECT_FLOAT_EQ(out[i], expected[i]) << "at " << i;
}

TEST(Reconstructor, FinalChunkShorterThanOverlapIsTrimmed)
{
    Reconstructor rec(10, 4);
    rec.push({ .sequence = 0, .samples = std::vector<float>(10, 2.0f), .original_length = 10, .is_last = false });
    rec.push({ .sequence = 1, .samples = std::vector<float>(10, 2.0f), .original_length = 3, .is_last = true });

    EXPECT_EQ(rec.samples_emitted(), 6u + 3u);
    EXPECT_TRUE(rec.finished());
}

TEST(Reconstructor, SingleChunkIsEmittedVerbatimUpToOriginalLength)
{
    std::vector<float> got;
    Reconstructor rec(6, 2, [&](std::span<const float> s) { got.insert(got.end(), s.begin(), s.end()); });
    rec.push({ .sequence = 0, .samples = {1, 2, 3, 4, 0, 0}, .original_length = 4, .is_last = true });

    EXPECT_EQ(got, (std::vector<float>{1, 2, 3, 4}));
    EXPECT_TRUE(rec.take_output().empty());
}

TEST(Reconstructor, RejectsWrongBlockSizeAndChunksAfterTheEnd)
{
    Reconstructor rec(8, 2);
    EXPECT_THROW(rec.push({ .sequence = 0, .samples = std::vector<float>(7), .original_length = 7, .is_last = false }),
                 CodecError);

    rec.push({ .sequence = 0, .samples = std::vector<float>(8), .original_length = 8, .is_last = true });
    EXPECT_THROW(rec.push({ .sequence = 1, .samples = std::vector<float>(8), .original_length = 8, .is_last = true }),
                 ProtocolError);
}

TEST(Reconstructor, RejectsOverlapBeyondHalfAChunk)
{
    EXPECT_THROW(Reconstructor(10, 6), ConfigError);
    EXPECT_THROW(Reconstructor(10, 10), ConfigError);
    EXPECT_NO_THROW(Reconstructor(10, 5));
}

} // namespace astream::core
