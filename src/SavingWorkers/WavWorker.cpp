#include "wakecap/WavWorker.hpp"
#include "wakecap/debug_log.hpp"

#include <sndfile.h>

namespace wakecap {

std::size_t WavWorker::Save(const std::string& filename,
                            const AudioFormat& format,
                            const std::vector<float>& samples) {
    if (format.channels == 0 || format.sampleRate == 0) {
        throw SavingWorkerException("Invalid WAV format: " + std::to_string(format.channels)
                                    + " channel(s), " + std::to_string(format.sampleRate) + " Hz");
    }
    if (samples.empty()) {
        WAKECAP_LOG_WARN("No audio data to save, writing empty file " << filename);
    }

    SF_INFO sfinfo{};
    sfinfo.samplerate = static_cast<int>(format.sampleRate);
    sfinfo.channels = static_cast<int>(format.channels);
    sfinfo.format = SF_FORMAT_WAV | SF_FORMAT_FLOAT;

    WAKECAP_DEBUG_LOG("Creating WAV: " << format.channels << " channel(s), "
                      << format.sampleRate << " Hz, 32-bit float");

    SNDFILE* outfile = sf_open(filename.c_str(), SFM_WRITE, &sfinfo);
    if (!outfile) {
        throw SavingWorkerException("Could not open output file " + filename + ": "
                                    + sf_strerror(nullptr));
    }

    WAKECAP_LOG_INFO("Writing " << samples.size() << " samples to WAV file");

    sf_count_t written = 0;
    if (!samples.empty()) {
        written = sf_write_float(outfile, samples.data(), static_cast<sf_count_t>(samples.size()));
    }
    std::string writeError = sf_strerror(outfile);
    int closeStatus = sf_close(outfile);

    if (written != static_cast<sf_count_t>(samples.size())) {
        throw SavingWorkerException("Wrote " + std::to_string(written) + " samples to " + filename
                                    + ", expected " + std::to_string(samples.size()) + ": " + writeError);
    }
    if (closeStatus != 0) {
        throw SavingWorkerException("Failed to finalize " + filename + ": " + sf_error_number(closeStatus));
    }

    return samples.size();
}

} // namespace wakecap
