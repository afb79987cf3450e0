#include <catch2/catch_test_macros.hpp>

#include "config.hpp"
#include "transport/transport_factory.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "meetcap_test_config_XXXXXX";
        // mkstemp needs a mutable char*
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        ssize_t n = ::write(fd, content.data(), content.size());
        (void)n;
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("Config", "[config]") {
    using namespace std::chrono_literals;

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.audio.target_sample_rate == 16000);
        REQUIRE(cfg.audio.channels == 1);
        REQUIRE(cfg.audio.warmup_frames == 3);
        REQUIRE(cfg.capture.microphone);
        REQUIRE(cfg.capture.system);
        REQUIRE(cfg.capture.microphone_device.empty());
        REQUIRE(cfg.transport.mode == "backend");
        REQUIRE(cfg.transport.language == "en");
        REQUIRE(cfg.transport.ring_buffer_ms == 500);
        REQUIRE(cfg.transport.max_frame_bytes == 32 * 1024);
        REQUIRE(cfg.transport.handshake_timeout_ms == 5000);
        REQUIRE(cfg.transport.close_timeout_ms == 3000);
        REQUIRE(cfg.transport.keepalive_interval_ms == 5000);
        REQUIRE(cfg.transport.reconnect_delays_ms == std::vector<uint32_t>{1000, 2000, 5000, 10000, 30000});
        REQUIRE(cfg.transport.max_reconnect_attempts == 5);
        REQUIRE(cfg.devices.debounce_ms == 400);
        REQUIRE(cfg.devices.settle_ms == 200);
        REQUIRE(cfg.devices.first_frame_timeout_ms == 2000);
        REQUIRE(cfg.devices.max_restart_attempts == 3);
        REQUIRE(cfg.devices.restart_backoff_ms == std::vector<uint32_t>{500, 1000, 1500});
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "audio": { "target_sample_rate": 24000, "warmup_frames": 5, "frame_channel_depth": 128 },
            "capture": { "system": false, "microphone_device": "alsa_input.usb-mic" },
            "transport": {
                "mode": "direct",
                "endpoint": "wss://api.deepgram.com/v1/listen",
                "meeting_id": "m-42",
                "language": "de",
                "model": "nova-3",
                "ring_buffer_ms": 1000,
                "reconnect_delays_ms": [100, 200],
                "max_reconnect_attempts": 0
            },
            "devices": { "debounce_ms": 250, "restart_backoff_ms": [50] }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.audio.target_sample_rate == 24000);
        REQUIRE(cfg.audio.warmup_frames == 5);
        REQUIRE(cfg.audio.frame_channel_depth == 128);
        REQUIRE(cfg.capture.microphone);
        REQUIRE_FALSE(cfg.capture.system);
        REQUIRE(cfg.capture.microphone_device == "alsa_input.usb-mic");
        REQUIRE(cfg.transport.mode == "direct");
        REQUIRE(cfg.transport.endpoint == "wss://api.deepgram.com/v1/listen");
        REQUIRE(cfg.transport.meeting_id == "m-42");
        REQUIRE(cfg.transport.language == "de");
        REQUIRE(cfg.transport.model == "nova-3");
        REQUIRE(cfg.transport.ring_buffer_ms == 1000);
        REQUIRE(cfg.transport.reconnect_delays_ms == std::vector<uint32_t>{100, 200});
        REQUIRE(cfg.transport.max_reconnect_attempts == 0);
        REQUIRE(cfg.devices.debounce_ms == 250);
        REQUIRE(cfg.devices.restart_backoff_ms == std::vector<uint32_t>{50});
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "transport": { "language": "fr" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.transport.language == "fr");
        // Other fields retain defaults
        REQUIRE(cfg.transport.mode == "backend");
        REQUIRE(cfg.audio.target_sample_rate == 16000);
        REQUIRE(cfg.devices.debounce_ms == 400);
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        // Falls back to defaults
        REQUIRE(cfg.transport.mode == "backend");
        REQUIRE(cfg.audio.target_sample_rate == 16000);
    }

    SECTION("LoadWrongTypeFallsBackToDefaults") {
        TmpFile f(R"({ "audio": { "target_sample_rate": "fast" }, "transport": { "language": "fr" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.audio.target_sample_rate == 16000);
        REQUIRE(cfg.transport.language == "en");
    }

    SECTION("LoadRejectsMultichannelOutput") {
        TmpFile f(R"({ "audio": { "channels": 2, "target_sample_rate": 24000 } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.audio.channels == 1);
        REQUIRE(cfg.audio.target_sample_rate == 24000);
        REQUIRE(make_transport_config(cfg, SourceId::Microphone).channels == 1);
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/meetcap_test_nonexistent_config_file.json");
        REQUIRE(cfg.transport.mode == "backend");
        REQUIRE(cfg.audio.target_sample_rate == 16000);
    }

    SECTION("EnvironmentOverridesToken") {
        Config cfg;
        cfg.transport.auth_token = "from-file";
        ::setenv("MEETCAP_AUTH_TOKEN", "from-env", 1);
        cfg.apply_environment();
        ::unsetenv("MEETCAP_AUTH_TOKEN");
        REQUIRE(cfg.transport.auth_token == "from-env");

        cfg.apply_environment();
        REQUIRE(cfg.transport.auth_token == "from-env");
    }

    SECTION("TransportOnlyChange") {
        Config a;
        Config b = a;
        REQUIRE_FALSE(a.transport_differs(b));
        REQUIRE_FALSE(a.capture_differs(b));

        b.transport.language = "es";
        b.transport.endpoint = "ws://elsewhere:9000";
        REQUIRE(a.transport_differs(b));
        REQUIRE_FALSE(a.capture_differs(b));
    }

    SECTION("CaptureChange") {
        Config a;
        Config b = a;
        b.capture.microphone_device = "usb-mic";
        REQUIRE(a.capture_differs(b));
        REQUIRE_FALSE(a.transport_differs(b));

        Config c = a;
        c.devices.settle_ms = 10;
        REQUIRE(a.capture_differs(c));
    }

    SECTION("TransportConfigPerSource") {
        Config cfg;
        cfg.transport.meeting_id = "m-1";
        cfg.transport.reconnect_delays_ms = {10, 20};
        cfg.audio.target_sample_rate = 24000;

        auto mic = make_transport_config(cfg, SourceId::Microphone);
        auto sys = make_transport_config(cfg, SourceId::SystemOutput);
        REQUIRE(mic.source == SourceId::Microphone);
        REQUIRE(sys.source == SourceId::SystemOutput);
        REQUIRE(mic.meeting_id == "m-1");
        REQUIRE(mic.sample_rate == 24000);
        REQUIRE(mic.ring_buffer == 500ms);
        REQUIRE(mic.close_timeout == 3000ms);
        REQUIRE(mic.reconnect_delays == std::vector<std::chrono::milliseconds>{10ms, 20ms});
    }
}
