#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "CaptureState.hpp"
#include "FrameChunker.hpp"
#include "IAudioSource.hpp"
#include "IWakewordDetector.hpp"

namespace wakecap {

struct DetectionEvent {
    int keywordIndex = -1;
    std::string label;
    std::chrono::system_clock::time_point timestamp;
};

// Поток захвата: владеет аудиопотоком, пишет историю в CaptureState и кормит детектор.
// Состояния Running -> Halted, переход только по флагу IsHalting().
class CaptureLoop {
public:
    using DetectionCallback = std::function<void(const DetectionEvent&)>;

    CaptureLoop(std::shared_ptr<CaptureState> state,
                std::shared_ptr<IAudioSource> source,
                std::shared_ptr<IWakewordDetector> detector,
                std::chrono::milliseconds pollInterval = std::chrono::milliseconds(100));
    ~CaptureLoop();

    CaptureLoop(const CaptureLoop&) = delete;
    CaptureLoop& operator=(const CaptureLoop&) = delete;

    // Возвращает управление, когда поток уже запущен; ошибку открытия пробрасывает
    void Start();
    void Join();
    bool WaitUntilStopped(std::chrono::milliseconds timeout);
    bool IsStopped() const;

    // Вызывается из потока аудио-API для каждого блока
    void OnAudioBlock(const float* samples, std::size_t numSamples);
    void OnStreamError(const std::string& error);

    // Задавать до Start()
    void SetOnDetectionCallback(DetectionCallback cb) { _onDetection = std::move(cb); }

    std::uint64_t ChunksProcessed() const { return _chunks_processed.load(); }
    std::uint64_t ChunkErrors() const { return _chunk_errors.load(); }
    std::uint64_t Detections() const { return _detections.load(); }

private:
    void Run(std::promise<void> started);
    void ProcessChunk(const int16_t* pcm, std::size_t length);
    void MarkStopped();

    std::shared_ptr<CaptureState> _state;
    std::shared_ptr<IAudioSource> _source;
    std::shared_ptr<IWakewordDetector> _detector;
    std::chrono::milliseconds _poll_interval;

    // Только поток аудио-API
    FrameChunker _chunker;
    std::vector<int16_t> _pcm;

    DetectionCallback _onDetection;
    std::unique_ptr<std::thread> _thread;

    mutable std::mutex _stopped_mutex;
    std::condition_variable _stopped_cv;
    bool _stopped;

    std::atomic<std::uint64_t> _chunks_processed;
    std::atomic<std::uint64_t> _chunk_errors;
    std::atomic<std::uint64_t> _detections;
};

} // namespace wakecap
