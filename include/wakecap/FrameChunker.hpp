#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace wakecap {

// Нарезает поток int16 на непересекающиеся кадры ровно по frameLength сэмплов.
// Неполный хвост блока сохраняется и дополняется данными следующего блока,
// нулями кадр никогда не добивается.
class FrameChunker {
public:
    using FrameCallback = std::function<void(const int16_t*, std::size_t)>;

    explicit FrameChunker(std::size_t frameLength);

    // Возвращает число отданных кадров
    std::size_t Feed(const int16_t* samples, std::size_t numSamples, const FrameCallback& onFrame);

    std::size_t Pending() const { return _pending.size(); }

private:
    std::size_t _frameLength;
    std::vector<int16_t> _pending;
};

} // namespace wakecap
