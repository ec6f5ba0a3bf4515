#pragma once

#include <RtAudio.h>

#include <memory>
#include <mutex>

#include "IAudioSource.hpp"

namespace wakecap {

// Захват с устройства ввода по умолчанию через RtAudio, один канал, FLOAT32
class RtAudioSource : public IAudioSource {
public:
    // Выбирает устройство ввода и частоту; бросает AudioSourceException, если устройства нет
    explicit RtAudioSource(unsigned int preferredSampleRate, unsigned int bufferFrames = 512);
    ~RtAudioSource() override;

    void Open(BlockCallback onBlock, ErrorCallback onError) override;
    void Start() override;
    void Stop() override;
    bool IsRunning() const override;
    AudioFormat CurrentFormat() const override;

    // Печатает все устройства с входными каналами
    static void ListDevices();

private:
    static int Record(void* outputBuffer, void* inputBuffer, unsigned int nBufferFrames,
                      double streamTime, RtAudioStreamStatus status, void* userData);

    void OnStreamError(RtAudioErrorType type, const std::string& errorText);

    std::unique_ptr<RtAudio> _audio;
    RtAudio::StreamParameters _parameters;
    BlockCallback _onBlock;
    ErrorCallback _onError;
    unsigned int _preferredSampleRate;
    unsigned int _bufferFrames;
    unsigned int _sampleRate;
    mutable std::mutex _stream_mutex;
};

} // namespace wakecap
