#include "wakecap/FrameChunker.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <numeric>
#include <stdexcept>
#include <vector>

using wakecap::FrameChunker;

namespace {

std::vector<int16_t> Sequence(int16_t first, std::size_t count) {
    std::vector<int16_t> out(count);
    std::iota(out.begin(), out.end(), first);
    return out;
}

} // namespace

TEST(FrameChunkerTest, ZeroFrameLengthIsRejected) {
    EXPECT_THROW(FrameChunker(0), std::invalid_argument);
}

TEST(FrameChunkerTest, ExactMultipleYieldsOnlyFullFrames) {
    const std::size_t frameLength = 512;
    FrameChunker chunker(frameLength);
    std::vector<std::size_t> lengths;

    auto block = Sequence(0, frameLength * 3);
    std::size_t frames = chunker.Feed(block.data(), block.size(),
        [&lengths](const int16_t*, std::size_t length) { lengths.push_back(length); });

    EXPECT_EQ(frames, 3u);
    EXPECT_EQ(lengths, (std::vector<std::size_t>{frameLength, frameLength, frameLength}));
    EXPECT_EQ(chunker.Pending(), 0u);
}

TEST(FrameChunkerTest, FramesAreConsecutiveAndNonOverlapping) {
    FrameChunker chunker(4);
    std::vector<int16_t> seen;

    auto block = Sequence(1, 12);
    chunker.Feed(block.data(), block.size(), [&seen](const int16_t* pcm, std::size_t length) {
        seen.insert(seen.end(), pcm, pcm + length);
    });

    EXPECT_EQ(seen, block);
}

TEST(FrameChunkerTest, RemainderIsCarriedIntoNextBlock) {
    FrameChunker chunker(4);
    std::vector<std::vector<int16_t>> frames;
    auto collect = [&frames](const int16_t* pcm, std::size_t length) {
        frames.emplace_back(pcm, pcm + length);
    };

    auto first = Sequence(1, 6);   // 1..6: один кадр, 5 6 в хвосте
    auto second = Sequence(7, 5);  // 7..11: кадр 5..8, затем 9..11 в хвосте
    auto third = Sequence(12, 1);  // 12: кадр 9..12

    EXPECT_EQ(chunker.Feed(first.data(), first.size(), collect), 1u);
    EXPECT_EQ(chunker.Pending(), 2u);
    EXPECT_EQ(chunker.Feed(second.data(), second.size(), collect), 1u);
    EXPECT_EQ(chunker.Pending(), 3u);
    EXPECT_EQ(chunker.Feed(third.data(), third.size(), collect), 1u);
    EXPECT_EQ(chunker.Pending(), 0u);

    ASSERT_EQ(frames.size(), 3u);
    EXPECT_EQ(frames[0], (std::vector<int16_t>{1, 2, 3, 4}));
    EXPECT_EQ(frames[1], (std::vector<int16_t>{5, 6, 7, 8}));
    EXPECT_EQ(frames[2], (std::vector<int16_t>{9, 10, 11, 12}));
}

TEST(FrameChunkerTest, ShortBlocksNeverProducePartialFrames) {
    FrameChunker chunker(5);
    std::size_t calls = 0;
    auto count = [&calls](const int16_t*, std::size_t length) {
        EXPECT_EQ(length, 5u);
        ++calls;
    };

    auto block = Sequence(0, 2);
    for (int i = 0; i < 7; ++i) {
        chunker.Feed(block.data(), block.size(), count);
    }

    // 14 сэмплов -> 2 полных кадра, 4 сэмпла ждут продолжения
    EXPECT_EQ(calls, 2u);
    EXPECT_EQ(chunker.Pending(), 4u);
}
