#include "wakecap/SampleRingBuffer.hpp"

#include <algorithm>
#include <stdexcept>

namespace wakecap {

SampleRingBuffer::SampleRingBuffer(std::size_t capacity)
    : _head(0)
    , _size(0) {
    if (capacity == 0) {
        throw std::invalid_argument("SampleRingBuffer capacity must be at least 1");
    }
    _storage.resize(capacity);
}

void SampleRingBuffer::Push(float sample) {
    const std::size_t capacity = _storage.size();
    _storage[(_head + _size) % capacity] = sample;
    if (_size < capacity) {
        ++_size;
    } else {
        _head = (_head + 1) % capacity;
    }
}

void SampleRingBuffer::Push(const float* samples, std::size_t numSamples) {
    if (!samples || numSamples == 0) {
        return;
    }

    const std::size_t capacity = _storage.size();

    // Если блок больше емкости, в буфере останется только его хвост
    if (numSamples >= capacity) {
        const float* tail = samples + (numSamples - capacity);
        std::copy(tail, tail + capacity, _storage.begin());
        _head = 0;
        _size = capacity;
        return;
    }

    std::size_t write = (_head + _size) % capacity;
    const std::size_t first = std::min(numSamples, capacity - write);
    std::copy(samples, samples + first, _storage.begin() + write);
    std::copy(samples + first, samples + numSamples, _storage.begin());

    const std::size_t total = _size + numSamples;
    if (total > capacity) {
        _head = (_head + (total - capacity)) % capacity;
        _size = capacity;
    } else {
        _size = total;
    }
}

std::vector<float> SampleRingBuffer::Snapshot() const {
    std::vector<float> out;
    out.reserve(_size);

    const std::size_t capacity = _storage.size();
    const std::size_t first = std::min(_size, capacity - _head);
    out.insert(out.end(), _storage.begin() + _head, _storage.begin() + _head + first);
    out.insert(out.end(), _storage.begin(), _storage.begin() + (_size - first));
    return out;
}

} // namespace wakecap
