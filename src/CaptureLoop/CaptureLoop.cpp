#include "wakecap/CaptureLoop.hpp"
#include "wakecap/SampleConverter.hpp"
#include "wakecap/debug_log.hpp"

#include <exception>

namespace wakecap {

CaptureLoop::CaptureLoop(std::shared_ptr<CaptureState> state,
                         std::shared_ptr<IAudioSource> source,
                         std::shared_ptr<IWakewordDetector> detector,
                         std::chrono::milliseconds pollInterval)
    : _state(std::move(state))
    , _source(std::move(source))
    , _detector(std::move(detector))
    , _poll_interval(pollInterval)
    , _chunker(_detector->FrameLength())
    , _stopped(false)
    , _chunks_processed(0)
    , _chunk_errors(0)
    , _detections(0) {
}

CaptureLoop::~CaptureLoop() {
    if (_thread && _thread->joinable()) {
        _state->MarkHalting();
        _thread->join();
    }
}

void CaptureLoop::Start() {
    if (_thread) {
        return;
    }

    std::promise<void> started;
    std::future<void> startedFuture = started.get_future();
    _thread = std::make_unique<std::thread>(&CaptureLoop::Run, this, std::move(started));

    try {
        startedFuture.get();
    } catch (const std::exception&) {
        Join();
        throw;
    }
}

void CaptureLoop::Join() {
    if (_thread && _thread->joinable()) {
        _thread->join();
    }
}

bool CaptureLoop::WaitUntilStopped(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(_stopped_mutex);
    return _stopped_cv.wait_for(lock, timeout, [this] { return _stopped; });
}

bool CaptureLoop::IsStopped() const {
    std::lock_guard<std::mutex> lock(_stopped_mutex);
    return _stopped;
}

void CaptureLoop::MarkStopped() {
    {
        std::lock_guard<std::mutex> lock(_stopped_mutex);
        _stopped = true;
    }
    _stopped_cv.notify_all();
}

void CaptureLoop::Run(std::promise<void> started) {
    WAKECAP_LOG_INFO("Initializing audio capture");

    try {
        _source->Open(
            [this](const float* samples, std::size_t numSamples) { OnAudioBlock(samples, numSamples); },
            [this](const std::string& error) { OnStreamError(error); });
        WAKECAP_LOG_INFO("Starting audio stream");
        _source->Start();
    } catch (const std::exception&) {
        _source->Stop();
        MarkStopped();
        started.set_exception(std::current_exception());
        return;
    }

    started.set_value();
    WAKECAP_LOG_INFO("Listening for wake words...");

    // Поток держит аудиопоток живым, пока не поднят флаг остановки
    while (!_state->IsHalting()) {
        std::this_thread::sleep_for(_poll_interval);
    }

    WAKECAP_LOG_INFO("Shutting down capture audio thread");
    _source->Stop();
    // После Stop() колбэк больше не вызывается, хвост читать безопасно
    WAKECAP_LOG_INFO("Dropping " << _chunker.Pending() << " sample(s) of incomplete detector frame");
    MarkStopped();
}

void CaptureLoop::OnAudioBlock(const float* samples, std::size_t numSamples) {
    if (!samples || numSamples == 0 || _state->IsHalting()) {
        return;
    }

    if (_state->IsRecording()) {
        _state->PushHistory(samples, numSamples);
    }

    const std::size_t clamped = FloatToPcm16(samples, numSamples, _pcm);
    if (clamped > 0) {
        WAKECAP_LOG_WARN(clamped << " sample(s) out of int16 range after scaling, clamped");
    }

    _chunker.Feed(_pcm.data(), _pcm.size(), [this](const int16_t* pcm, std::size_t length) {
        ProcessChunk(pcm, length);
    });
}

void CaptureLoop::ProcessChunk(const int16_t* pcm, std::size_t length) {
    int keywordIndex = -1;
    try {
        keywordIndex = _detector->Process(pcm, length);
    } catch (const WakewordException& e) {
        _chunk_errors++;
        WAKECAP_LOG_ERROR("Error processing audio: " << e.what());
        return;
    }
    _chunks_processed++;

    if (keywordIndex < 0) {
        return;
    }

    DetectionEvent event;
    event.keywordIndex = keywordIndex;
    event.label = _detector->KeywordLabel(keywordIndex);
    event.timestamp = std::chrono::system_clock::now();
    _detections++;

    WAKECAP_LOG_INFO("Wakeword detected: " << event.label << " (index " << keywordIndex << ")");

    if (_onDetection) {
        _onDetection(event);
    }
}

void CaptureLoop::OnStreamError(const std::string& error) {
    WAKECAP_LOG_ERROR("Error in audio stream: " << error);
}

} // namespace wakecap
