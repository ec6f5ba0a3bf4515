#include "wakecap/RtAudioSource.hpp"
#include "wakecap/debug_log.hpp"

#include <algorithm>
#include <sstream>
#include <vector>

namespace wakecap {

int RtAudioSource::Record(void* /*outputBuffer*/, void* inputBuffer, unsigned int nBufferFrames,
                          double /*streamTime*/, RtAudioStreamStatus status, void* userData) {
    auto* self = static_cast<RtAudioSource*>(userData);

    if (status & RTAUDIO_INPUT_OVERFLOW) {
        if (self->_onError) {
            self->_onError("Stream overflow detected");
        }
    }

    if (inputBuffer && self->_onBlock) {
        const float* samples = static_cast<const float*>(inputBuffer);
        self->_onBlock(samples, static_cast<std::size_t>(nBufferFrames) * self->_parameters.nChannels);
    }

    return 0;
}

RtAudioSource::RtAudioSource(unsigned int preferredSampleRate, unsigned int bufferFrames)
    : _preferredSampleRate(preferredSampleRate)
    , _bufferFrames(bufferFrames)
    , _sampleRate(preferredSampleRate) {
    _audio = std::make_unique<RtAudio>(RtAudio::UNSPECIFIED,
        [this](RtAudioErrorType type, const std::string& errorText) {
            OnStreamError(type, errorText);
        });

    std::vector<unsigned int> deviceIds = _audio->getDeviceIds();
    if (deviceIds.empty()) {
        throw AudioSourceException("No audio devices found");
    }

    unsigned int deviceId = _audio->getDefaultInputDevice();
    RtAudio::DeviceInfo info = _audio->getDeviceInfo(deviceId);

    if (info.inputChannels < 1) {
        WAKECAP_LOG_WARN("Default device has no input channels, searching for alternative...");
        for (unsigned int id : deviceIds) {
            RtAudio::DeviceInfo candidate = _audio->getDeviceInfo(id);
            if (candidate.inputChannels > 0) {
                deviceId = id;
                info = candidate;
                break;
            }
        }
    }

    if (info.inputChannels < 1) {
        throw AudioSourceException("No input devices found");
    }

    WAKECAP_LOG_INFO("Using input device: " << info.name
                     << " (" << info.inputChannels << " input channels)");

    const bool supported = std::find(info.sampleRates.begin(), info.sampleRates.end(),
                                     _preferredSampleRate) != info.sampleRates.end();
    if (!supported) {
        if (info.preferredSampleRate == 0) {
            throw AudioSourceException("Input device " + info.name + " reports no usable sample rate");
        }
        _sampleRate = info.preferredSampleRate;
        WAKECAP_LOG_WARN(_preferredSampleRate << " Hz not supported by device, using preferred rate "
                         << _sampleRate << " Hz; wakeword detection may be degraded");
    }

    // Многоканальный захват не нужен: всегда один канал
    _parameters.deviceId = deviceId;
    _parameters.nChannels = 1;
    _parameters.firstChannel = 0;
}

RtAudioSource::~RtAudioSource() {
    Stop();
}

void RtAudioSource::OnStreamError(RtAudioErrorType type, const std::string& errorText) {
    if (type == RTAUDIO_WARNING) {
        WAKECAP_DEBUG_LOG("RtAudio warning: " << errorText);
        return;
    }
    if (_onError) {
        _onError(errorText);
    } else {
        WAKECAP_LOG_ERROR("Error in audio stream: " << errorText);
    }
}

void RtAudioSource::Open(BlockCallback onBlock, ErrorCallback onError) {
    std::lock_guard<std::mutex> lock(_stream_mutex);

    if (_audio->isStreamOpen()) {
        throw AudioSourceException("Audio stream is already open");
    }

    _onBlock = std::move(onBlock);
    _onError = std::move(onError);

    unsigned int bufferFrames = _bufferFrames;
    WAKECAP_DEBUG_LOG("Opening stream: " << _sampleRate << " Hz, " << bufferFrames
                      << " frames, FLOAT32");

    if (_audio->openStream(nullptr, &_parameters, RTAUDIO_FLOAT32,
                           _sampleRate, &bufferFrames, &RtAudioSource::Record, this)) {
        throw AudioSourceException("Error opening stream: " + _audio->getErrorText());
    }

    _sampleRate = _audio->getStreamSampleRate();
    _bufferFrames = bufferFrames;
    WAKECAP_LOG_INFO("Audio stream opened: " << _sampleRate << " Hz, "
                     << _parameters.nChannels << " channel(s), " << _bufferFrames << " frames per block");
}

void RtAudioSource::Start() {
    std::lock_guard<std::mutex> lock(_stream_mutex);

    if (!_audio->isStreamOpen()) {
        throw AudioSourceException("Audio stream is not open");
    }
    if (_audio->isStreamRunning()) {
        return;
    }
    if (_audio->startStream()) {
        std::string error = _audio->getErrorText();
        _audio->closeStream();
        throw AudioSourceException("Error starting stream: " + error);
    }
}

void RtAudioSource::Stop() {
    std::lock_guard<std::mutex> lock(_stream_mutex);

    if (_audio->isStreamRunning()) {
        if (_audio->stopStream()) {
            WAKECAP_LOG_WARN("Error stopping stream: " << _audio->getErrorText());
        }
    }
    if (_audio->isStreamOpen()) {
        _audio->closeStream();
    }
}

bool RtAudioSource::IsRunning() const {
    std::lock_guard<std::mutex> lock(_stream_mutex);
    return _audio->isStreamRunning();
}

AudioFormat RtAudioSource::CurrentFormat() const {
    std::lock_guard<std::mutex> lock(_stream_mutex);

    AudioFormat format;
    format.channels = _parameters.nChannels;
    format.sampleRate = _audio->isStreamOpen() ? _audio->getStreamSampleRate() : _sampleRate;
    return format;
}

void RtAudioSource::ListDevices() {
    RtAudio audio;
    std::vector<unsigned int> deviceIds = audio.getDeviceIds();
    if (deviceIds.empty()) {
        std::cout << "No audio devices found." << std::endl;
        return;
    }

    const unsigned int defaultInput = audio.getDefaultInputDevice();
    std::cout << "Available input devices:" << std::endl;
    for (unsigned int i = 0; i < deviceIds.size(); i++) {
        RtAudio::DeviceInfo info = audio.getDeviceInfo(deviceIds[i]);
        if (info.inputChannels < 1) {
            continue;
        }

        std::ostringstream rates;
        for (unsigned int sr : info.sampleRates) {
            rates << sr << " ";
        }
        std::cout << "index: " << i << " (ID: " << deviceIds[i] << "), device name: " << info.name
                  << (deviceIds[i] == defaultInput ? " [default]" : "") << std::endl;
        std::cout << "  Input channels: " << info.inputChannels << std::endl;
        std::cout << "  Supported sample rates: " << rates.str() << std::endl;
    }
}

} // namespace wakecap
