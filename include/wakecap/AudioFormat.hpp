#pragma once

namespace wakecap {

// Согласованный формат потока: число каналов и частота дискретизации
struct AudioFormat {
    unsigned int channels = 1;
    unsigned int sampleRate = 16000;
};

} // namespace wakecap
