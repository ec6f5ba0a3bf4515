#pragma once

#include <cstddef>
#include <vector>

namespace wakecap {

// Кольцевой буфер фиксированной емкости: при переполнении затирается самый старый сэмпл.
// Синхронизации нет, блокировкой владеет CaptureState.
class SampleRingBuffer {
public:
    explicit SampleRingBuffer(std::size_t capacity);

    void Push(float sample);
    void Push(const float* samples, std::size_t numSamples);

    // Все сэмплы в хронологическом порядке (старые первыми), буфер не очищается
    std::vector<float> Snapshot() const;

    std::size_t Size() const { return _size; }
    std::size_t Capacity() const { return _storage.size(); }

private:
    std::vector<float> _storage;
    std::size_t _head;
    std::size_t _size;
};

} // namespace wakecap
