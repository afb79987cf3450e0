#include <catch2/catch_test_macros.hpp>

#include "capture_source.hpp"
#include "mock_audio_backend.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <string>
#include <thread>
#include <vector>

namespace {

struct Delivered {
    std::vector<AudioFrame> frames;

    CaptureSource::FrameCallback sink() {
        return [this](AudioFrame&& f) { frames.push_back(std::move(f)); };
    }

    size_t samples() const {
        size_t n = 0;
        for (const auto& f : frames) n += f.pcm.size();
        return n;
    }
};

} // namespace

TEST_CASE("CaptureSource lifecycle", "[capture]") {
    MockAudioBackend backend({SampleFormat::F32, 48000, 2});
    AllowListPermissionService permissions(true, true);
    PauseGate gate;
    Delivered out;

    CaptureSource mic(SourceId::Microphone, backend, permissions, gate,
                      {.target_rate = 16000, .warmup_frames = 3, .device_id = ""});

    SECTION("StartOpensDefaultDevice") {
        REQUIRE(mic.state() == CaptureSourceState::Stopped);
        REQUIRE(mic.start(out.sink()));
        REQUIRE(mic.state() == CaptureSourceState::Running);
        REQUIRE(backend.is_open(SourceId::Microphone));
        REQUIRE(mic.device()->id == "default-mic");
        REQUIRE(mic.native_format()->sample_rate == 48000);
        REQUIRE(mic.native_format()->channels == 2);
    }

    SECTION("StartTwiceIsNoop") {
        REQUIRE(mic.start(out.sink()));
        REQUIRE(mic.start(out.sink()));
        REQUIRE(backend.open_count(SourceId::Microphone) == 1);
    }

    SECTION("StopReleasesDevice") {
        REQUIRE(mic.start(out.sink()));
        mic.stop();
        REQUIRE(mic.state() == CaptureSourceState::Stopped);
        REQUIRE_FALSE(backend.is_open(SourceId::Microphone));
        REQUIRE_FALSE(mic.device());
        mic.stop();
        REQUIRE(mic.state() == CaptureSourceState::Stopped);
    }

    SECTION("WarmupBuffersAreDropped") {
        REQUIRE(mic.start(out.sink()));
        for (int i = 0; i < 5; ++i) REQUIRE(backend.feed_silence(SourceId::Microphone, 480));

        auto st = mic.stats();
        REQUIRE(st.callbacks == 5);
        REQUIRE(st.warmup_dropped == 3);
        REQUIRE(st.frames_delivered == 2);
        REQUIRE(out.frames.size() == 2);
    }

    SECTION("DeliversCanonicalFrames") {
        REQUIRE(mic.start(out.sink()));
        size_t pos = 0;
        for (int i = 0; i < 103; ++i) {
            REQUIRE(backend.feed(SourceId::Microphone, make_tone(backend.format(), 480, 440.0, pos)));
        }

        REQUIRE(out.frames.size() == 100);
        REQUIRE(out.samples() == 16000);
        for (const auto& f : out.frames) {
            REQUIRE(f.source == SourceId::Microphone);
            REQUIRE(f.sample_rate == 16000);
            REQUIRE(f.channels == 1);
            REQUIRE(f.pcm.size() == 160);
        }
        REQUIRE(out.frames.front().captured_at <= out.frames.back().captured_at);
    }

    SECTION("NothingArrivesAfterStop") {
        REQUIRE(mic.start(out.sink()));
        for (int i = 0; i < 4; ++i) backend.feed_silence(SourceId::Microphone);
        mic.stop();
        REQUIRE_FALSE(backend.feed_silence(SourceId::Microphone));
        REQUIRE(out.frames.size() == 1);
    }

    SECTION("PausedGateDropsFrames") {
        REQUIRE(mic.start(out.sink()));
        for (int i = 0; i < 3; ++i) backend.feed_silence(SourceId::Microphone);

        gate.pause();
        backend.feed_silence(SourceId::Microphone);
        backend.feed_silence(SourceId::Microphone);
        REQUIRE(out.frames.empty());
        REQUIRE(mic.stats().paused_dropped == 2);

        gate.resume();
        backend.feed_silence(SourceId::Microphone);
        REQUIRE(out.frames.size() == 1);
    }

    SECTION("StreamErrorReportsDeviceLost") {
        std::vector<std::string> lost;
        mic.set_device_lost_callback([&](SourceId id, const std::string& reason) {
            REQUIRE(id == SourceId::Microphone);
            lost.push_back(reason);
        });
        REQUIRE(mic.start(out.sink()));
        backend.fail(SourceId::Microphone, "node removed");
        REQUIRE(lost == std::vector<std::string>{"node removed"});
    }

    SECTION("StopRacingStreamErrorCompletes") {
        std::atomic<int> lost{0};
        mic.set_device_lost_callback([&](SourceId, const std::string&) { ++lost; });
        REQUIRE(mic.start(out.sink()));

        // The node vanishes while stop() tears the stream down. The error is
        // delivered on another thread that holds the backend lock, which the
        // teardown needs next.
        std::thread unplug;
        backend.set_release_hook([&](SourceId id) {
            unplug = std::thread([&backend, id] { backend.fail(id, "node removed"); });
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        });

        auto stopped = std::async(std::launch::async, [&] { mic.stop(); });
        REQUIRE(stopped.wait_for(std::chrono::seconds(2)) == std::future_status::ready);
        backend.set_release_hook(nullptr);
        unplug.join();

        REQUIRE(mic.state() == CaptureSourceState::Stopped);
        REQUIRE_FALSE(backend.is_open(SourceId::Microphone));
        // The stream was already released when the error arrived.
        REQUIRE(lost == 0);
    }

    SECTION("RestartRacingStreamErrorCompletes") {
        REQUIRE(mic.start(out.sink()));

        std::thread unplug;
        bool armed = true;
        backend.set_release_hook([&](SourceId id) {
            if (!armed) return;
            armed = false;
            unplug = std::thread([&backend, id] { backend.fail(id, "node removed"); });
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        });

        auto restarted = std::async(std::launch::async, [&] { return mic.restart(false); });
        REQUIRE(restarted.wait_for(std::chrono::seconds(2)) == std::future_status::ready);
        backend.set_release_hook(nullptr);
        unplug.join();

        REQUIRE(restarted.get());
        REQUIRE(mic.state() == CaptureSourceState::Running);
        REQUIRE(backend.is_open(SourceId::Microphone));
    }
}

TEST_CASE("CaptureSource failures", "[capture]") {
    MockAudioBackend backend;
    PauseGate gate;
    Delivered out;

    SECTION("PermissionDenied") {
        AllowListPermissionService permissions(true, false);
        CaptureSource sys(SourceId::SystemOutput, backend, permissions, gate, {});
        auto res = sys.start(out.sink());
        REQUIRE_FALSE(res);
        REQUIRE(res.error().code == ErrorCode::CapturePermissionDenied);
        REQUIRE(sys.state() == CaptureSourceState::Stopped);
        REQUIRE(backend.open_count(SourceId::SystemOutput) == 0);
    }

    SECTION("DeviceUnavailable") {
        AllowListPermissionService permissions(true, true);
        backend.set_unavailable("usb-mic", true);
        CaptureSource mic(SourceId::Microphone, backend, permissions, gate,
                          {.device_id = "usb-mic"});
        auto res = mic.start(out.sink());
        REQUIRE_FALSE(res);
        REQUIRE(res.error().code == ErrorCode::CaptureUnavailable);
        REQUIRE(mic.state() == CaptureSourceState::Stopped);
    }

    SECTION("UnsupportedNativeFormat") {
        MockAudioBackend odd({SampleFormat::Unknown, 48000, 2});
        AllowListPermissionService permissions(true, true);
        CaptureSource mic(SourceId::Microphone, odd, permissions, gate, {});
        auto res = mic.start(out.sink());
        REQUIRE_FALSE(res);
        REQUIRE(res.error().code == ErrorCode::FormatNegotiationError);
        REQUIRE(mic.state() == CaptureSourceState::Stopped);
        REQUIRE_FALSE(odd.is_open(SourceId::Microphone));
    }
}

TEST_CASE("CaptureSource restart", "[capture]") {
    MockAudioBackend backend({SampleFormat::S16, 44100, 1});
    AllowListPermissionService permissions(true, true);
    PauseGate gate;
    Delivered out;

    CaptureSource mic(SourceId::Microphone, backend, permissions, gate,
                      {.target_rate = 16000, .warmup_frames = 1, .device_id = "usb-mic"});
    REQUIRE(mic.start(out.sink()));

    SECTION("RestartOnConfiguredDevice") {
        REQUIRE(mic.restart(false));
        REQUIRE(mic.state() == CaptureSourceState::Running);
        REQUIRE(mic.device()->id == "usb-mic");
        REQUIRE(backend.open_count(SourceId::Microphone) == 2);
    }

    SECTION("FallbackToDefaultIsDegraded") {
        REQUIRE(mic.restart(true));
        REQUIRE(mic.state() == CaptureSourceState::Degraded);
        REQUIRE(mic.device()->id == "default-mic");
    }

    SECTION("WarmupAppliesAfterEachOpen") {
        backend.feed_silence(SourceId::Microphone, 441);
        backend.feed_silence(SourceId::Microphone, 441);
        REQUIRE(out.frames.size() == 1);

        REQUIRE(mic.restart(false));
        backend.feed_silence(SourceId::Microphone, 441);
        REQUIRE(out.frames.size() == 1);
        backend.feed_silence(SourceId::Microphone, 441);
        REQUIRE(out.frames.size() == 2);
        REQUIRE(mic.stats().warmup_dropped == 2);
    }

    SECTION("FailedReopenStaysRestarting") {
        REQUIRE(mic.begin_restart());
        REQUIRE(mic.state() == CaptureSourceState::Restarting);
        REQUIRE_FALSE(backend.is_open(SourceId::Microphone));

        backend.set_unavailable("usb-mic", true);
        auto res = mic.reopen(false);
        REQUIRE_FALSE(res);
        REQUIRE(mic.state() == CaptureSourceState::Restarting);

        mic.abandon_restart();
        REQUIRE(mic.state() == CaptureSourceState::Stopped);
    }

    SECTION("RestartOfStoppedSourceFails") {
        mic.stop();
        REQUIRE_FALSE(mic.begin_restart());
        REQUIRE_FALSE(mic.restart(false));
    }
}
