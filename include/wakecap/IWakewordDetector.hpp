#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace wakecap {

class WakewordException : public std::runtime_error {
public:
    explicit WakewordException(const std::string& message)
        : std::runtime_error(message) {}
};

// Классификатор ключевого слова, принимающий кадры int16 PCM фиксированной длины
class IWakewordDetector {
public:
    virtual ~IWakewordDetector() = default;

    // Точное число сэмплов в кадре, которое принимает модель
    virtual std::size_t FrameLength() const = 0;
    virtual unsigned int SampleRate() const = 0;

    // -1: нет срабатывания, иначе индекс ключевого слова.
    // Бросает WakewordException при неверной длине кадра или ошибке движка.
    virtual int Process(const int16_t* pcm, std::size_t length) = 0;

    virtual std::string KeywordLabel(int index) const = 0;
};

} // namespace wakecap
