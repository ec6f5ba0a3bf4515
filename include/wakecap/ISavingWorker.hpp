#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include "AudioFormat.hpp"

namespace wakecap {

class SavingWorkerException : public std::runtime_error {
public:
    explicit SavingWorkerException(const std::string& message)
        : std::runtime_error(message) {}
};

// Приемник для сохранения снимка истории.
// Реализация не хранит состояние между вызовами: сохранения могут идти параллельно.
class ISavingWorker {
public:
    virtual ~ISavingWorker() = default;

    // Возвращает число записанных сэмплов, при ошибке бросает SavingWorkerException
    virtual std::size_t Save(const std::string& filename,
                             const AudioFormat& format,
                             const std::vector<float>& samples) = 0;
};

} // namespace wakecap
