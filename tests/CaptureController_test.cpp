#include "wakecap/CaptureController.hpp"
#include "wakecap/CaptureState.hpp"
#include "wakecap/WavWorker.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>
#include <sndfile.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <memory>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using wakecap::CaptureController;
using wakecap::CaptureState;
using wakecap::SaveResult;

namespace {

std::chrono::system_clock::time_point LocalTime(int year, int month, int day, int hour, int min, int sec) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = sec;
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

// Часы, которые сдвигаются на секунду при каждом вызове: имена файлов не совпадают
CaptureController::Clock SteppingClock(std::chrono::system_clock::time_point start) {
    auto next = std::make_shared<std::chrono::system_clock::time_point>(start);
    return [next]() {
        auto now = *next;
        *next += 1s;
        return now;
    };
}

std::vector<float> ReadWav(const std::string& path, SF_INFO& info) {
    info = SF_INFO{};
    SNDFILE* file = sf_open(path.c_str(), SFM_READ, &info);
    if (!file) {
        ADD_FAILURE() << "cannot open " << path << ": " << sf_strerror(nullptr);
        return {};
    }
    std::vector<float> samples(static_cast<std::size_t>(info.frames * info.channels));
    sf_read_float(file, samples.data(), static_cast<sf_count_t>(samples.size()));
    sf_close(file);
    return samples;
}

class CaptureControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        state = std::make_shared<CaptureState>(8, (tmp.Path() / "out").string());
        source = std::make_shared<test_utils::FakeAudioSource>();
        worker = std::make_shared<test_utils::MemorySavingWorker>();
        controller = std::make_unique<CaptureController>(
            state, source, worker, SteppingClock(LocalTime(2024, 3, 5, 13, 4, 9)));
    }

    test_utils::TempDir tmp;
    std::shared_ptr<CaptureState> state;
    std::shared_ptr<test_utils::FakeAudioSource> source;
    std::shared_ptr<test_utils::MemorySavingWorker> worker;
    std::unique_ptr<CaptureController> controller;
};

} // namespace

TEST_F(CaptureControllerTest, RecordingTogglesAreIdempotent) {
    EXPECT_TRUE(controller->StartRecording().ok);
    EXPECT_TRUE(controller->StartRecording().ok);
    EXPECT_TRUE(state->IsRecording());

    EXPECT_TRUE(controller->StopRecording().ok);
    EXPECT_TRUE(controller->StopRecording().ok);
    EXPECT_FALSE(state->IsRecording());
}

TEST_F(CaptureControllerTest, StopDoesNotClearHistory) {
    auto samples = test_utils::Ramp(1.0f, 5);
    state->PushHistory(samples.data(), samples.size());

    controller->StopRecording();

    EXPECT_EQ(state->SnapshotHistory(), samples);
}

TEST_F(CaptureControllerTest, FileNameUsesLocalTimestamp) {
    EXPECT_EQ(CaptureController::RecordingFileName(LocalTime(2024, 3, 5, 13, 4, 9)),
              "recording_20240305_130409.wav");
}

TEST_F(CaptureControllerTest, SaveCreatesDirectoryAndWritesSnapshot) {
    auto samples = test_utils::Ramp(1.0f, 6);
    state->PushHistory(samples.data(), samples.size());

    auto result = controller->SaveAudio();

    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_EQ(result.sampleCount, 6u);
    EXPECT_EQ(result.path, (tmp.Path() / "out" / "recording_20240305_130409.wav").string());
    EXPECT_EQ(worker->lastFilename, result.path);
    EXPECT_TRUE(std::filesystem::is_directory(tmp.Path() / "out"));
    ASSERT_EQ(worker->saves.size(), 1u);
    EXPECT_EQ(worker->saves[0], samples);
}

TEST_F(CaptureControllerTest, RepeatedSaveReturnsIdenticalSnapshot) {
    auto samples = test_utils::Ramp(1.0f, 11);
    state->PushHistory(samples.data(), samples.size());

    auto first = controller->SaveAudio();
    auto second = controller->SaveAudio();

    ASSERT_TRUE(first.ok);
    ASSERT_TRUE(second.ok);
    EXPECT_NE(first.path, second.path);
    ASSERT_EQ(worker->saves.size(), 2u);
    EXPECT_EQ(worker->saves[0], worker->saves[1]);
    EXPECT_EQ(worker->saves[0], test_utils::Ramp(4.0f, 8));
}

TEST_F(CaptureControllerTest, SaveUsesFormatAtSaveTime) {
    auto samples = test_utils::Ramp(1.0f, 4);
    state->PushHistory(samples.data(), samples.size());

    source->SetFormat(2, 44100);
    ASSERT_TRUE(controller->SaveAudio().ok);

    EXPECT_EQ(worker->lastFormat.channels, 2u);
    EXPECT_EQ(worker->lastFormat.sampleRate, 44100u);
}

TEST_F(CaptureControllerTest, WriteFailureIsReportedAndRecoverable) {
    worker->fail = true;
    auto failed = controller->SaveAudio();
    EXPECT_FALSE(failed.ok);
    EXPECT_EQ(failed.error, "disk full");

    worker->fail = false;
    auto saved = controller->SaveAudio();
    EXPECT_TRUE(saved.ok) << saved.error;
}

TEST_F(CaptureControllerTest, DirectoryFailureIsReported) {
    const auto blocker = tmp.Path() / "blocker";
    std::ofstream(blocker) << "not a directory";

    auto blockedState = std::make_shared<CaptureState>(8, (blocker / "sub").string());
    CaptureController blocked(blockedState, source, worker);

    auto result = blocked.SaveAudio();
    EXPECT_FALSE(result.ok);
    EXPECT_FALSE(result.error.empty());
    EXPECT_TRUE(worker->saves.empty());
}

TEST_F(CaptureControllerTest, HaltStopsRecordingAndRequestsShutdown) {
    ASSERT_TRUE(state->IsRecording());
    ASSERT_FALSE(state->ShutdownRequested());

    EXPECT_TRUE(controller->Halt().ok);

    EXPECT_FALSE(state->IsRecording());
    EXPECT_TRUE(state->IsHalting());
    EXPECT_TRUE(state->ShutdownRequested());
    EXPECT_TRUE(state->WaitForShutdown(0ms));

    // Повторный halt ничего не ломает, флаг не сбрасывается
    EXPECT_TRUE(controller->Halt().ok);
    controller->StartRecording();
    EXPECT_TRUE(state->IsHalting());
}

TEST_F(CaptureControllerTest, StatusReflectsState) {
    auto samples = test_utils::Ramp(1.0f, 3);
    state->PushHistory(samples.data(), samples.size());
    controller->StopRecording();

    auto status = controller->Status();
    EXPECT_FALSE(status.recording);
    EXPECT_FALSE(status.halting);
    EXPECT_EQ(status.bufferedSamples, 3u);
    EXPECT_EQ(status.capacity, 8u);
    EXPECT_EQ(status.outputDirectory, (tmp.Path() / "out").string());
    EXPECT_FALSE(status.capturing);

    source->Start();
    EXPECT_TRUE(controller->Status().capturing);
    source->Stop();
    EXPECT_FALSE(controller->Status().capturing);
}

namespace {

class SlowSavingWorker : public wakecap::ISavingWorker {
public:
    std::size_t Save(const std::string&, const wakecap::AudioFormat&,
                     const std::vector<float>& samples) override {
        const int active = ++inFlight;
        int seen = maxInFlight.load();
        while (active > seen && !maxInFlight.compare_exchange_weak(seen, active)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        --inFlight;
        return samples.size();
    }

    std::atomic<int> inFlight{0};
    std::atomic<int> maxInFlight{0};
};

} // namespace

TEST(CaptureControllerSaveTest, SameSecondSavesDoNotOverlap) {
    test_utils::TempDir tmp;
    auto state = std::make_shared<CaptureState>(8, tmp.Path().string());
    auto worker = std::make_shared<SlowSavingWorker>();
    const auto fixed = std::chrono::system_clock::now();
    CaptureController controller(state, std::make_shared<test_utils::FakeAudioSource>(), worker,
                                 [fixed] { return fixed; });

    SaveResult first;
    SaveResult second;
    std::thread a([&] { first = controller.SaveAudio(); });
    std::thread b([&] { second = controller.SaveAudio(); });
    a.join();
    b.join();

    EXPECT_TRUE(first.ok);
    EXPECT_TRUE(second.ok);
    EXPECT_EQ(first.path, second.path);
    EXPECT_EQ(worker->maxInFlight.load(), 1);
}

TEST(CaptureStateTest, SnapshotsStayChronologicalUnderConcurrentPushes) {
    auto state = std::make_shared<CaptureState>(1000, "captures");
    std::atomic<bool> done{false};

    std::thread producer([&state, &done]() {
        float next = 0.0f;
        std::vector<float> block(37);
        for (int i = 0; i < 2000; ++i) {
            for (auto& sample : block) {
                sample = next;
                next += 1.0f;
            }
            state->PushHistory(block.data(), block.size());
        }
        done = true;
    });

    bool chronological = true;
    while (!done && chronological) {
        auto snapshot = state->SnapshotHistory();
        chronological = snapshot.size() <= 1000u;
        for (std::size_t i = 1; chronological && i < snapshot.size(); ++i) {
            chronological = snapshot[i] == snapshot[i - 1] + 1.0f;
        }
    }
    producer.join();

    EXPECT_TRUE(chronological);

    EXPECT_EQ(state->HistorySize(), 1000u);
}

TEST(CaptureEndToEndTest, RollingHistorySurvivesIntoSavedFiles) {
    test_utils::TempDir tmp;

    // buffer_seconds = 1, sample_rate = 8000
    auto state = std::make_shared<CaptureState>(1 * 8000, tmp.Path().string());
    auto source = std::make_shared<test_utils::FakeAudioSource>();
    source->SetFormat(1, 8000);
    CaptureController controller(state, source, std::make_shared<wakecap::WavWorker>(),
                                 SteppingClock(LocalTime(2024, 1, 2, 3, 4, 5)));

    std::vector<float> first(8000, 0.0f);
    state->PushHistory(first.data(), first.size());

    auto saved1 = controller.SaveAudio();
    ASSERT_TRUE(saved1.ok) << saved1.error;
    EXPECT_EQ(saved1.sampleCount, 8000u);

    std::vector<float> second(4000);
    for (std::size_t i = 0; i < second.size(); ++i) {
        second[i] = static_cast<float>(i + 1) / 8000.0f;
    }
    state->PushHistory(second.data(), second.size());

    auto saved2 = controller.SaveAudio();
    ASSERT_TRUE(saved2.ok) << saved2.error;
    EXPECT_EQ(saved2.sampleCount, 8000u);
    EXPECT_NE(saved1.path, saved2.path);

    SF_INFO info1;
    SF_INFO info2;
    auto file1 = ReadWav(saved1.path, info1);
    auto file2 = ReadWav(saved2.path, info2);

    EXPECT_EQ(info1.frames, 8000);
    EXPECT_EQ(info2.frames, 8000);
    EXPECT_EQ(info2.samplerate, 8000);
    EXPECT_EQ(info2.channels, 1);
    EXPECT_EQ(info2.format & SF_FORMAT_SUBMASK, SF_FORMAT_FLOAT);

    ASSERT_EQ(file1.size(), 8000u);
    ASSERT_EQ(file2.size(), 8000u);
    EXPECT_TRUE(std::equal(file2.begin(), file2.begin() + 4000, file1.begin() + 4000));
    EXPECT_TRUE(std::equal(file2.begin() + 4000, file2.end(), second.begin()));
}
