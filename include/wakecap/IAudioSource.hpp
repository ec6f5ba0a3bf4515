#pragma once

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>

#include "AudioFormat.hpp"

namespace wakecap {

class AudioSourceException : public std::runtime_error {
public:
    explicit AudioSourceException(const std::string& message)
        : std::runtime_error(message) {}
};

// Источник аудио с доставкой блоков через callback
class IAudioSource {
public:
    // (samples, numSamples) — чередующиеся float-сэмплы одного блока
    using BlockCallback = std::function<void(const float*, std::size_t)>;
    // Асинхронные ошибки потока, поток при этом не останавливается
    using ErrorCallback = std::function<void(const std::string&)>;

    virtual ~IAudioSource() = default;

    // Бросают AudioSourceException
    virtual void Open(BlockCallback onBlock, ErrorCallback onError) = 0;
    virtual void Start() = 0;

    // Останавливает и закрывает поток; повторный вызов ничего не делает
    virtual void Stop() = 0;

    virtual bool IsRunning() const = 0;

    // Текущая конфигурация устройства на момент вызова
    virtual AudioFormat CurrentFormat() const = 0;
};

} // namespace wakecap
