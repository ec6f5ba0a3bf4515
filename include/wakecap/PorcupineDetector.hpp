#pragma once

#include <memory>
#include <string>
#include <vector>

#include "IWakewordDetector.hpp"

struct pv_porcupine;

namespace wakecap {

struct PorcupineDeleter {
    void operator()(pv_porcupine* ptr) const noexcept;
};

struct PorcupineOptions {
    std::string accessKey;
    std::string modelPath;
    std::vector<std::string> keywordPaths;
    std::vector<float> sensitivities; // пусто: 0.5 для каждого слова
};

// Адаптер над Picovoice Porcupine (C SDK)
class PorcupineDetector : public IWakewordDetector {
public:
    explicit PorcupineDetector(const PorcupineOptions& options);
    ~PorcupineDetector() override;

    std::size_t FrameLength() const override { return _frameLength; }
    unsigned int SampleRate() const override { return _sampleRate; }

    int Process(const int16_t* pcm, std::size_t length) override;

    std::string KeywordLabel(int index) const override;

    static std::string Version();

private:
    std::unique_ptr<pv_porcupine, PorcupineDeleter> _handle;
    std::vector<std::string> _labels;
    std::size_t _frameLength;
    unsigned int _sampleRate;
};

} // namespace wakecap
