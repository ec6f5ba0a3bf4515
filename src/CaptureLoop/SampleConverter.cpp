#include "wakecap/SampleConverter.hpp"

#include <cmath>
#include <limits>

namespace wakecap {

int16_t FloatToPcm16(float sample, bool& clamped) {
    constexpr float kScale = static_cast<float>(std::numeric_limits<int16_t>::max());
    constexpr float kMax = static_cast<float>(std::numeric_limits<int16_t>::max());
    constexpr float kMin = static_cast<float>(std::numeric_limits<int16_t>::min());

    clamped = false;
    if (std::isnan(sample)) {
        clamped = true;
        return 0;
    }

    const float scaled = sample * kScale;
    if (scaled > kMax) {
        clamped = true;
        return std::numeric_limits<int16_t>::max();
    }
    if (scaled < kMin) {
        clamped = true;
        return std::numeric_limits<int16_t>::min();
    }
    return static_cast<int16_t>(scaled);
}

std::size_t FloatToPcm16(const float* input, std::size_t count, std::vector<int16_t>& output) {
    output.resize(count);

    std::size_t clampedCount = 0;
    for (std::size_t i = 0; i < count; ++i) {
        bool clamped = false;
        output[i] = FloatToPcm16(input[i], clamped);
        if (clamped) {
            ++clampedCount;
        }
    }
    return clampedCount;
}

} // namespace wakecap
