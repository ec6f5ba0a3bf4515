#include "wakecap/PorcupineDetector.hpp"
#include "wakecap/debug_log.hpp"

#include <pv_porcupine.h>

#include <filesystem>

namespace wakecap {

namespace {

std::string PorcupineError(pv_status_t status, const std::string& context) {
    std::string message = context + ": " + pv_status_to_string(status);

    char** stack = nullptr;
    int32_t depth = 0;
    if (pv_get_error_stack(&stack, &depth) == PV_STATUS_SUCCESS) {
        for (int32_t i = 0; i < depth; ++i) {
            message += "\n  [" + std::to_string(i) + "] " + stack[i];
        }
        pv_free_error_stack(stack);
    }
    return message;
}

} // namespace

void PorcupineDeleter::operator()(pv_porcupine* ptr) const noexcept {
    if (ptr) {
        pv_porcupine_delete(ptr);
    }
}

PorcupineDetector::PorcupineDetector(const PorcupineOptions& options)
    : _frameLength(0)
    , _sampleRate(0) {
    if (options.accessKey.empty()) {
        throw WakewordException("Porcupine access key is not set");
    }
    if (options.modelPath.empty()) {
        throw WakewordException("Porcupine model path is not set");
    }
    if (options.keywordPaths.empty()) {
        throw WakewordException("At least one Porcupine keyword path is required");
    }

    std::vector<float> sensitivities = options.sensitivities;
    if (sensitivities.empty()) {
        sensitivities.assign(options.keywordPaths.size(), 0.5f);
    }
    if (sensitivities.size() != options.keywordPaths.size()) {
        throw WakewordException("Number of sensitivities does not match number of keywords");
    }

    std::vector<const char*> keywordPaths;
    keywordPaths.reserve(options.keywordPaths.size());
    for (const auto& path : options.keywordPaths) {
        keywordPaths.push_back(path.c_str());
        _labels.push_back(std::filesystem::path(path).stem().string());
    }

    WAKECAP_LOG_INFO("Porcupine " << Version() << ", model path: " << options.modelPath);

    pv_porcupine_t* handle = nullptr;
    pv_status_t status = pv_porcupine_init(options.accessKey.c_str(),
                                           options.modelPath.c_str(),
                                           static_cast<int32_t>(keywordPaths.size()),
                                           keywordPaths.data(),
                                           sensitivities.data(),
                                           &handle);
    if (status != PV_STATUS_SUCCESS) {
        throw WakewordException(PorcupineError(status, "pv_porcupine_init failed"));
    }
    _handle.reset(handle);

    _frameLength = static_cast<std::size_t>(pv_porcupine_frame_length());
    _sampleRate = static_cast<unsigned int>(pv_sample_rate());

    WAKECAP_LOG_INFO("Porcupine initialized with frame length " << _frameLength
                     << " at " << _sampleRate << " Hz, " << _labels.size() << " keyword(s)");
}

PorcupineDetector::~PorcupineDetector() = default;

int PorcupineDetector::Process(const int16_t* pcm, std::size_t length) {
    if (!pcm || length != _frameLength) {
        throw WakewordException("Porcupine expects frames of " + std::to_string(_frameLength)
                                + " samples, got " + std::to_string(length));
    }

    int32_t keywordIndex = -1;
    pv_status_t status = pv_porcupine_process(_handle.get(), pcm, &keywordIndex);
    if (status != PV_STATUS_SUCCESS) {
        throw WakewordException(PorcupineError(status, "pv_porcupine_process failed"));
    }
    return static_cast<int>(keywordIndex);
}

std::string PorcupineDetector::KeywordLabel(int index) const {
    if (index < 0 || static_cast<std::size_t>(index) >= _labels.size()) {
        return "keyword #" + std::to_string(index);
    }
    return _labels[static_cast<std::size_t>(index)];
}

std::string PorcupineDetector::Version() {
    return pv_porcupine_version();
}

} // namespace wakecap
