#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

struct Config {
    struct Audio {
        uint32_t target_sample_rate = 16000;
        uint32_t channels = 1;
        uint32_t warmup_frames = 3;
        uint32_t frame_channel_depth = 64;
    } audio;

    struct Capture {
        bool microphone = true;
        bool system = true;
        // PipeWire node.name; empty selects the platform default.
        std::string microphone_device;
        std::string system_device;
    } capture;

    struct Transport {
        std::string mode = "backend"; // "backend" or "direct"
        std::string endpoint = "ws://localhost:8000";
        std::string auth_token;
        std::string meeting_id;
        std::string device_id = "meetcap";
        std::string language = "en";
        std::string model = "nova-2";
        uint32_t ring_buffer_ms = 500;
        uint32_t max_frame_bytes = 32 * 1024;
        uint32_t handshake_timeout_ms = 5000;
        uint32_t close_timeout_ms = 3000;
        uint32_t keepalive_interval_ms = 5000;
        uint32_t connect_timeout_ms = 10000;
        std::vector<uint32_t> reconnect_delays_ms = {1000, 2000, 5000, 10000, 30000};
        uint32_t max_reconnect_attempts = 5; // 0 = unlimited
    } transport;

    struct Devices {
        uint32_t debounce_ms = 400;
        uint32_t settle_ms = 200;
        uint32_t first_frame_timeout_ms = 2000;
        uint32_t max_restart_attempts = 3;
        std::vector<uint32_t> restart_backoff_ms = {500, 1000, 1500};
    } devices;

    // Fields only a transport consumes changed; capture can keep running.
    bool transport_differs(const Config& other) const;
    // Fields the capture pipeline consumes changed; the session must restart.
    bool capture_differs(const Config& other) const;

    static Config load(const std::string& path);
    static Config load_default();

    // Environment overrides (MEETCAP_AUTH_TOKEN).
    void apply_environment();
};

std::vector<std::chrono::milliseconds> to_durations(const std::vector<uint32_t>& ms);
