#include "wakecap/CaptureController.hpp"
#include "wakecap/debug_log.hpp"

#include <ctime>
#include <exception>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace wakecap {

CaptureController::CaptureController(std::shared_ptr<CaptureState> state,
                                     std::shared_ptr<IAudioSource> source,
                                     std::shared_ptr<ISavingWorker> savingWorker,
                                     Clock clock)
    : _state(std::move(state))
    , _source(std::move(source))
    , _saving_worker(std::move(savingWorker))
    , _clock(std::move(clock)) {
    if (!_clock) {
        _clock = [] { return std::chrono::system_clock::now(); };
    }
}

CommandResult CaptureController::StartRecording() {
    WAKECAP_LOG_INFO("Starting recording");
    _state->SetRecording(true);
    return {true, "Recording started"};
}

CommandResult CaptureController::StopRecording() {
    WAKECAP_LOG_INFO("Stopping recording");
    _state->SetRecording(false);
    return {true, "Recording stopped"};
}

std::string CaptureController::RecordingFileName(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm local{};
    localtime_r(&t, &local);
    char buffer[64];
    std::strftime(buffer, sizeof(buffer), "recording_%Y%m%d_%H%M%S.wav", &local);
    return buffer;
}

SaveResult CaptureController::SaveAudio() {
    std::lock_guard<std::mutex> lock(_save_mutex);
    SaveResult result;

    const fs::path directory(_state->OutputDirectory());
    const fs::path filepath = directory / RecordingFileName(_clock());
    result.path = filepath.string();

    WAKECAP_LOG_INFO("Saving audio to " << result.path);

    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        result.error = "Failed to create output directory " + directory.string() + ": " + ec.message();
        WAKECAP_LOG_ERROR(result.error);
        return result;
    }

    std::vector<float> samples = _state->SnapshotHistory();

    try {
        // Формат берется на момент сохранения, а не на момент записи сэмплов
        const AudioFormat format = _source->CurrentFormat();
        WAKECAP_DEBUG_LOG("Using input format: " << format.channels << " channel(s), "
                          << format.sampleRate << " Hz");
        result.sampleCount = _saving_worker->Save(result.path, format, samples);
    } catch (const std::exception& e) {
        result.error = e.what();
        WAKECAP_LOG_ERROR("Failed to save audio: " << result.error);
        return result;
    }

    result.ok = true;
    WAKECAP_LOG_INFO("Successfully saved " << result.sampleCount << " samples to " << result.path);
    return result;
}

CommandResult CaptureController::Halt() {
    WAKECAP_LOG_INFO("Halting server");
    _state->SetRecording(false);
    _state->MarkHalting();
    _state->RequestShutdown();
    return {true, "Server halted"};
}

CaptureStatus CaptureController::Status() const {
    CaptureStatus status;
    status.recording = _state->IsRecording();
    status.halting = _state->IsHalting();
    status.capturing = _source->IsRunning();
    status.bufferedSamples = _state->HistorySize();
    status.capacity = _state->HistoryCapacity();
    status.outputDirectory = _state->OutputDirectory();
    return status;
}

} // namespace wakecap
