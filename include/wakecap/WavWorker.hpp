#pragma once

#include "ISavingWorker.hpp"

namespace wakecap {

// WAV, 32-bit float, через libsndfile
class WavWorker : public ISavingWorker {
public:
    std::size_t Save(const std::string& filename,
                     const AudioFormat& format,
                     const std::vector<float>& samples) override;
};

} // namespace wakecap
