#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "CaptureState.hpp"
#include "IAudioSource.hpp"
#include "ISavingWorker.hpp"

namespace wakecap {

struct CommandResult {
    bool ok = true;
    std::string message;
};

struct SaveResult {
    bool ok = false;
    std::string path;
    std::size_t sampleCount = 0;
    std::string error;
};

struct CaptureStatus {
    bool recording = false;
    bool halting = false;
    bool capturing = false;
    std::size_t bufferedSamples = 0;
    std::size_t capacity = 0;
    std::string outputDirectory;
};

// Команды управления. Трогают только CaptureState (и приемник при сохранении),
// исключения наружу не выпускают.
class CaptureController {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    CaptureController(std::shared_ptr<CaptureState> state,
                      std::shared_ptr<IAudioSource> source,
                      std::shared_ptr<ISavingWorker> savingWorker,
                      Clock clock = nullptr);

    CommandResult StartRecording();
    CommandResult StopRecording();
    SaveResult SaveAudio();

    // Необратимо: останавливает запись и захват, поднимает сигнал завершения процесса
    CommandResult Halt();

    CaptureStatus Status() const;

    // recording_YYYYMMDD_HHMMSS.wav по локальному времени
    static std::string RecordingFileName(std::chrono::system_clock::time_point tp);

private:
    std::shared_ptr<CaptureState> _state;
    std::shared_ptr<IAudioSource> _source;
    std::shared_ptr<ISavingWorker> _saving_worker;
    Clock _clock;

    // Сохранения идут по одному: в одну секунду имя файла совпадает
    std::mutex _save_mutex;
};

} // namespace wakecap
