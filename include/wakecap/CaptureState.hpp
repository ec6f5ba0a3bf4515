#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

#include "SampleRingBuffer.hpp"

namespace wakecap {

// Единственный объект, разделяемый потоком захвата и обработчиками команд.
// Создается один раз в main и раздается через std::shared_ptr.
class CaptureState {
public:
    CaptureState(std::size_t capacity, std::string outputDirectory);

    CaptureState(const CaptureState&) = delete;
    CaptureState& operator=(const CaptureState&) = delete;

    // Блокировка держится только на время вставки блока или копирования
    void PushHistory(const float* samples, std::size_t numSamples);
    std::vector<float> SnapshotHistory() const;
    std::size_t HistorySize() const;
    std::size_t HistoryCapacity() const { return _capacity; }

    bool IsRecording() const { return _is_recording.load(std::memory_order_relaxed); }
    void SetRecording(bool recording) { _is_recording.store(recording, std::memory_order_relaxed); }

    // false -> true, обратно никогда
    bool IsHalting() const { return _is_halting.load(std::memory_order_relaxed); }
    void MarkHalting() { _is_halting.store(true, std::memory_order_relaxed); }

    const std::string& OutputDirectory() const { return _output_directory; }

    void RequestShutdown();
    bool ShutdownRequested() const;
    // true, если запрос на остановку пришел до истечения timeout
    bool WaitForShutdown(std::chrono::milliseconds timeout) const;

private:
    mutable std::mutex _history_mutex;
    SampleRingBuffer _history;
    const std::size_t _capacity;

    std::atomic<bool> _is_recording;
    std::atomic<bool> _is_halting;
    const std::string _output_directory;

    mutable std::mutex _shutdown_mutex;
    mutable std::condition_variable _shutdown_cv;
    bool _shutdown_requested;
};

} // namespace wakecap
