#include "wakecap/CaptureController.hpp"
#include "wakecap/CaptureLoop.hpp"
#include "wakecap/CaptureState.hpp"
#include "wakecap/CommandRouter.hpp"
#include "wakecap/CommandServer.hpp"
#include "wakecap/DaemonConfig.hpp"
#include "wakecap/PorcupineDetector.hpp"
#include "wakecap/RtAudioSource.hpp"
#include "wakecap/WavWorker.hpp"
#include "wakecap/debug_log.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace wakecap;

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void handle_signal(int) {
    g_interrupted = 1;
}

} // namespace

int main(int argc, char** argv) {
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    const std::string program = argc > 0 ? argv[0] : "wakecapd";
    std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    DaemonConfig config;
    try {
        config = ParseConfig(args);
    } catch (const ConfigException& e) {
        WAKECAP_LOG_ERROR(e.what());
        std::cerr << Usage(program);
        return 1;
    }

    if (config.showHelp) {
        std::cout << Usage(program);
        return 0;
    }
    if (config.listDevices) {
        RtAudioSource::ListDevices();
        return 0;
    }

    WAKECAP_LOG_INFO("Starting audio recording application");

    std::shared_ptr<PorcupineDetector> detector;
    std::shared_ptr<RtAudioSource> source;
    try {
        PorcupineOptions options;
        options.accessKey = config.accessKey;
        options.modelPath = config.modelPath;
        options.keywordPaths = config.keywordPaths;
        options.sensitivities = config.sensitivities;
        detector = std::make_shared<PorcupineDetector>(options);

        source = std::make_shared<RtAudioSource>(detector->SampleRate());
    } catch (const WakewordException& e) {
        WAKECAP_LOG_ERROR("Unable to create Porcupine: " << e.what());
        return 1;
    } catch (const AudioSourceException& e) {
        WAKECAP_LOG_ERROR("Failed to get default input device: " << e.what());
        return 1;
    }

    const AudioFormat format = source->CurrentFormat();
    const std::size_t capacity =
        static_cast<std::size_t>(format.sampleRate) * format.channels * config.bufferSeconds;
    WAKECAP_LOG_INFO("Initializing buffer with size: " << capacity << " (" << config.bufferSeconds << " s)");

    std::shared_ptr<CaptureState> state;
    try {
        state = std::make_shared<CaptureState>(capacity, config.outputDirectory);
    } catch (const std::exception& e) {
        WAKECAP_LOG_ERROR("Failed to allocate audio buffer of " << capacity << " samples: " << e.what());
        return 1;
    }

    CaptureLoop loop(state, source, detector, std::chrono::milliseconds(config.pollIntervalMs));
    try {
        loop.Start();
    } catch (const AudioSourceException& e) {
        WAKECAP_LOG_ERROR("Failed to start audio capture: " << e.what());
        return 1;
    }

    auto controller = std::make_shared<CaptureController>(state, source, std::make_shared<WavWorker>());
    auto router = std::make_shared<CommandRouter>(controller);

    CommandServer server(router, config.httpAddress, config.httpPort);
    try {
        server.Start();
    } catch (const std::runtime_error& e) {
        WAKECAP_LOG_ERROR(e.what());
        state->MarkHalting();
        loop.Join();
        return 1;
    }

    // Ждем /halt или сигнал; Ctrl-C идет тем же путем, что и /halt
    while (!state->WaitForShutdown(std::chrono::milliseconds(100))) {
        if (g_interrupted) {
            WAKECAP_LOG_INFO("Interrupted");
            controller->Halt();
        }
    }

    // Даем потоку захвата закрыть аудиопоток, а HTTP-ответу на /halt уйти клиенту
    std::this_thread::sleep_for(std::chrono::milliseconds(config.haltGraceMs));
    server.Stop();

    if (!loop.IsStopped()) {
        WAKECAP_LOG_WARN("Capture loop did not stop within " << config.haltGraceMs << " ms, exiting anyway");
        std::cout.flush();
        std::_Exit(EXIT_SUCCESS);
    }
    loop.Join();

    WAKECAP_LOG_INFO("Exiting.");
    return 0;
}
