#include <catch2/catch_test_macros.hpp>

#include "capture_source.hpp"
#include "device_change_coordinator.hpp"
#include "mock_audio_backend.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

DeviceChangeCoordinator::Options fast_options() {
    DeviceChangeCoordinator::Options opts;
    opts.debounce = 50ms;
    opts.settle = 10ms;
    opts.first_frame_timeout = 100ms;
    opts.max_attempts = 3;
    opts.backoff = {10ms, 10ms, 10ms};
    return opts;
}

struct Recorder {
    std::mutex mu;
    std::vector<SourceId> restarted;
    std::vector<std::pair<SourceId, DeviceIdentity>> degraded;
    std::vector<std::pair<SourceId, Error>> failed;

    DeviceChangeCoordinator::Listener listener() {
        return {
            .on_restarted = [this](SourceId id, const DeviceIdentity&) {
                std::lock_guard lock(mu);
                restarted.push_back(id);
            },
            .on_degraded = [this](SourceId id, const DeviceIdentity& dev) {
                std::lock_guard lock(mu);
                degraded.emplace_back(id, dev);
            },
            .on_failed = [this](SourceId id, const Error& err) {
                std::lock_guard lock(mu);
                failed.emplace_back(id, err);
            },
        };
    }

    size_t restarted_count() {
        std::lock_guard lock(mu);
        return restarted.size();
    }
    size_t degraded_count() {
        std::lock_guard lock(mu);
        return degraded.size();
    }
    size_t failed_count() {
        std::lock_guard lock(mu);
        return failed.size();
    }
};

// Plays the audio thread: a buffer every few milliseconds for each source.
class Feeder {
public:
    Feeder(MockAudioBackend& backend, std::vector<SourceId> sources)
        : thread_([&backend, sources](std::stop_token st) {
              while (!st.stop_requested()) {
                  for (auto id : sources) backend.feed_silence(id);
                  std::this_thread::sleep_for(5ms);
              }
          }) {}

private:
    std::jthread thread_;
};

struct Counter {
    std::atomic<uint64_t> frames{0};
    CaptureSource::FrameCallback sink() {
        return [this](AudioFrame&&) { frames.fetch_add(1); };
    }
};

} // namespace

TEST_CASE("DeviceChangeCoordinator restarts", "[coordinator]") {
    MockAudioBackend backend;
    AllowListPermissionService permissions(true, true);
    Recorder rec;
    DeviceChangeCoordinator coord(fast_options(), rec.listener());

    Counter mic_frames, sys_frames;
    CaptureSource mic(SourceId::Microphone, backend, permissions, coord.gate(),
                      {.target_rate = 16000, .warmup_frames = 0, .device_id = "usb-mic"});
    CaptureSource sys(SourceId::SystemOutput, backend, permissions, coord.gate(),
                      {.target_rate = 16000, .warmup_frames = 0, .device_id = ""});
    REQUIRE(mic.start(mic_frames.sink()));
    REQUIRE(sys.start(sys_frames.sink()));
    coord.attach(mic);
    coord.attach(sys);

    SECTION("BurstCoalescesIntoOneRestart") {
        Feeder feeder(backend, {SourceId::Microphone, SourceId::SystemOutput});

        coord.request_restart(SourceId::Microphone, "default changed");
        coord.request_restart(SourceId::Microphone, "node removed");
        coord.request_restart(SourceId::SystemOutput, "default changed");
        coord.request_restart(SourceId::Microphone, "node added");

        REQUIRE(wait_until([&] { return rec.restarted_count() == 2; }));
        REQUIRE(wait_until([&] { return !coord.metrics().restart_in_flight; }));

        auto m = coord.metrics();
        REQUIRE(m.requests == 4);
        REQUIRE(m.device_changes == 1);
        REQUIRE(m.fallbacks == 0);
        REQUIRE(m.failures == 0);
        REQUIRE(m.sources[0].restarts == 1);
        REQUIRE(m.sources[1].restarts == 1);
        REQUIRE_FALSE(m.paused);

        REQUIRE(backend.open_count(SourceId::Microphone) == 2);
        REQUIRE(backend.open_count(SourceId::SystemOutput) == 2);
        REQUIRE(mic.state() == CaptureSourceState::Running);
        REQUIRE(sys.state() == CaptureSourceState::Running);
        REQUIRE(mic.device()->id == "usb-mic");

        // Audio flows again once the gate reopens.
        auto before = mic_frames.frames.load();
        REQUIRE(wait_until([&] { return mic_frames.frames.load() > before + 5; }));
    }

    SECTION("OnlyRequestedSourceRestarts") {
        Feeder feeder(backend, {SourceId::Microphone, SourceId::SystemOutput});
        coord.request_restart(SourceId::SystemOutput, "sink removed");

        REQUIRE(wait_until([&] { return rec.restarted_count() == 1; }));
        REQUIRE(backend.open_count(SourceId::Microphone) == 1);
        REQUIRE(backend.open_count(SourceId::SystemOutput) == 2);
        std::lock_guard lock(rec.mu);
        REQUIRE(rec.restarted.front() == SourceId::SystemOutput);
    }

    SECTION("RetriesThenFallsBackToDefault") {
        Feeder feeder(backend, {SourceId::Microphone, SourceId::SystemOutput});
        backend.set_unavailable("usb-mic", true);
        coord.request_restart(SourceId::Microphone, "node removed");

        REQUIRE(wait_until([&] { return rec.degraded_count() == 1; }, 3000ms));
        REQUIRE(rec.restarted_count() == 0);
        REQUIRE(rec.failed_count() == 0);
        {
            std::lock_guard lock(rec.mu);
            REQUIRE(rec.degraded.front().first == SourceId::Microphone);
            REQUIRE(rec.degraded.front().second.id == "default-mic");
        }

        REQUIRE(mic.state() == CaptureSourceState::Degraded);
        auto opens = backend.opens();
        size_t usb = 0, fallback = 0;
        for (const auto& o : opens) {
            if (o.source != SourceId::Microphone) continue;
            if (o.device_id == "usb-mic") ++usb;
            else ++fallback;
        }
        REQUIRE(usb == 4); // initial open plus three attempts
        REQUIRE(fallback == 1);

        auto m = coord.metrics();
        REQUIRE(m.fallbacks == 1);
        REQUIRE(m.failures == 0);
        REQUIRE(m.sources[0].restarts == 1);
    }

    SECTION("SilentDeviceTimesOutAndOtherSourceContinues") {
        // Only the system source produces audio; the microphone never does.
        Feeder feeder(backend, {SourceId::SystemOutput});
        coord.request_restart(SourceId::Microphone, "default changed");

        REQUIRE(wait_until([&] { return rec.failed_count() == 1; }, 3000ms));
        {
            std::lock_guard lock(rec.mu);
            REQUIRE(rec.failed.front().first == SourceId::Microphone);
            REQUIRE(rec.failed.front().second.code == ErrorCode::DeviceChangeTimeout);
        }
        REQUIRE(mic.state() == CaptureSourceState::Stopped);
        REQUIRE_FALSE(backend.is_open(SourceId::Microphone));

        auto m = coord.metrics();
        REQUIRE(m.failures == 1);
        REQUIRE(m.fallbacks == 1);
        REQUIRE_FALSE(m.paused);
        REQUIRE_FALSE(m.restart_in_flight);

        auto before = sys_frames.frames.load();
        REQUIRE(wait_until([&] { return sys_frames.frames.load() > before + 5; }));
    }

    SECTION("StopCancelsPendingRestart") {
        coord.request_restart(SourceId::Microphone, "default changed");
        coord.stop();
        std::this_thread::sleep_for(100ms);

        REQUIRE(backend.open_count(SourceId::Microphone) == 1);
        REQUIRE(mic.state() == CaptureSourceState::Running);
        REQUIRE(coord.metrics().device_changes == 0);
        REQUIRE_FALSE(coord.gate().paused());
    }

    SECTION("ManualPauseAndResume") {
        coord.pause_all();
        REQUIRE(coord.metrics().paused);
        backend.feed_silence(SourceId::Microphone);
        REQUIRE(mic_frames.frames.load() == 0);
        REQUIRE(mic.stats().paused_dropped == 1);

        coord.resume_all();
        REQUIRE_FALSE(coord.metrics().paused);
        backend.feed_silence(SourceId::Microphone);
        REQUIRE(mic_frames.frames.load() == 1);
    }

    mic.stop();
    sys.stop();
    coord.stop();
}

TEST_CASE("DeviceChangeCoordinator queues requests during a restart", "[coordinator]") {
    MockAudioBackend backend;
    AllowListPermissionService permissions(true, true);
    Recorder rec;
    auto opts = fast_options();
    opts.first_frame_timeout = 1000ms;
    DeviceChangeCoordinator coord(opts, rec.listener());

    Counter mic_frames;
    CaptureSource mic(SourceId::Microphone, backend, permissions, coord.gate(),
                      {.target_rate = 16000, .warmup_frames = 0, .device_id = "usb-mic"});
    REQUIRE(mic.start(mic_frames.sink()));
    coord.attach(mic);

    // Reopened, now waiting for its first frame.
    coord.request_restart(SourceId::Microphone, "default changed");
    REQUIRE(wait_until([&] {
        return backend.open_count(SourceId::Microphone) == 2 && coord.metrics().restart_in_flight;
    }));

    // Longer than debounce plus settle: a concurrent restart would have reopened by now.
    coord.request_restart(SourceId::Microphone, "node added");
    std::this_thread::sleep_for(150ms);
    REQUIRE(backend.open_count(SourceId::Microphone) == 2);
    REQUIRE(coord.metrics().device_changes == 1);
    REQUIRE(coord.metrics().restart_in_flight);
    REQUIRE(rec.restarted_count() == 0);

    {
        Feeder feeder(backend, {SourceId::Microphone});
        REQUIRE(wait_until([&] { return rec.restarted_count() == 2; }, 3000ms));
        REQUIRE(wait_until([&] { return !coord.metrics().restart_in_flight; }));
    }

    auto m = coord.metrics();
    REQUIRE(m.requests == 2);
    REQUIRE(m.device_changes == 2);
    REQUIRE(m.sources[0].restarts == 2);
    REQUIRE(m.failures == 0);
    REQUIRE(backend.open_count(SourceId::Microphone) == 3);
    REQUIRE(mic.state() == CaptureSourceState::Running);

    mic.stop();
    coord.stop();
}
