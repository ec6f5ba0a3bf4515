#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace wakecap {

// float [-1.0, 1.0] -> int16: умножение на INT16_MAX с отбрасыванием дробной части.
// Значения вне диапазона int16 прижимаются к границе, NaN превращается в 0.
// Возвращает число прижатых сэмплов.
std::size_t FloatToPcm16(const float* input, std::size_t count, std::vector<int16_t>& output);

int16_t FloatToPcm16(float sample, bool& clamped);

} // namespace wakecap
