#include "wakecap/CaptureState.hpp"

#include <utility>

namespace wakecap {

CaptureState::CaptureState(std::size_t capacity, std::string outputDirectory)
    : _history(capacity)
    , _capacity(capacity)
    , _is_recording(true)
    , _is_halting(false)
    , _output_directory(std::move(outputDirectory))
    , _shutdown_requested(false) {
}

void CaptureState::PushHistory(const float* samples, std::size_t numSamples) {
    std::lock_guard<std::mutex> lock(_history_mutex);
    _history.Push(samples, numSamples);
}

std::vector<float> CaptureState::SnapshotHistory() const {
    std::lock_guard<std::mutex> lock(_history_mutex);
    return _history.Snapshot();
}

std::size_t CaptureState::HistorySize() const {
    std::lock_guard<std::mutex> lock(_history_mutex);
    return _history.Size();
}

void CaptureState::RequestShutdown() {
    {
        std::lock_guard<std::mutex> lock(_shutdown_mutex);
        _shutdown_requested = true;
    }
    _shutdown_cv.notify_all();
}

bool CaptureState::ShutdownRequested() const {
    std::lock_guard<std::mutex> lock(_shutdown_mutex);
    return _shutdown_requested;
}

bool CaptureState::WaitForShutdown(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(_shutdown_mutex);
    return _shutdown_cv.wait_for(lock, timeout, [this] { return _shutdown_requested; });
}

} // namespace wakecap
