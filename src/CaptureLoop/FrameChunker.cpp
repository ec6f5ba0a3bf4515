#include "wakecap/FrameChunker.hpp"

#include <algorithm>
#include <stdexcept>

namespace wakecap {

FrameChunker::FrameChunker(std::size_t frameLength)
    : _frameLength(frameLength) {
    if (frameLength == 0) {
        throw std::invalid_argument("Detector frame length must be positive");
    }
    _pending.reserve(frameLength);
}

std::size_t FrameChunker::Feed(const int16_t* samples, std::size_t numSamples,
                               const FrameCallback& onFrame) {
    if (!samples || numSamples == 0) {
        return 0;
    }

    std::size_t frames = 0;
    std::size_t offset = 0;

    // Сначала дополняем хвост, оставшийся от прошлого блока
    if (!_pending.empty()) {
        const std::size_t need = _frameLength - _pending.size();
        const std::size_t take = std::min(need, numSamples);
        _pending.insert(_pending.end(), samples, samples + take);
        offset = take;

        if (_pending.size() < _frameLength) {
            return 0;
        }
        onFrame(_pending.data(), _pending.size());
        _pending.clear();
        ++frames;
    }

    // Полные кадры отдаем прямо из входного блока, без копирования
    while (numSamples - offset >= _frameLength) {
        onFrame(samples + offset, _frameLength);
        offset += _frameLength;
        ++frames;
    }

    _pending.assign(samples + offset, samples + numSamples);
    return frames;
}

} // namespace wakecap
