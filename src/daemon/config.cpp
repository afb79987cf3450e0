#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template <typename T>
void read(const json& obj, const char* key, T& out) {
    if (obj.contains(key)) out = obj[key].get<T>();
}

} // namespace

bool Config::transport_differs(const Config& o) const {
    const auto& a = transport;
    const auto& b = o.transport;
    return a.mode != b.mode || a.endpoint != b.endpoint || a.auth_token != b.auth_token ||
           a.meeting_id != b.meeting_id || a.device_id != b.device_id ||
           a.language != b.language || a.model != b.model ||
           a.ring_buffer_ms != b.ring_buffer_ms || a.max_frame_bytes != b.max_frame_bytes ||
           a.handshake_timeout_ms != b.handshake_timeout_ms ||
           a.close_timeout_ms != b.close_timeout_ms ||
           a.keepalive_interval_ms != b.keepalive_interval_ms ||
           a.connect_timeout_ms != b.connect_timeout_ms ||
           a.reconnect_delays_ms != b.reconnect_delays_ms ||
           a.max_reconnect_attempts != b.max_reconnect_attempts;
}

bool Config::capture_differs(const Config& o) const {
    return audio.target_sample_rate != o.audio.target_sample_rate ||
           audio.channels != o.audio.channels ||
           audio.warmup_frames != o.audio.warmup_frames ||
           audio.frame_channel_depth != o.audio.frame_channel_depth ||
           capture.microphone != o.capture.microphone ||
           capture.system != o.capture.system ||
           capture.microphone_device != o.capture.microphone_device ||
           capture.system_device != o.capture.system_device ||
           devices.debounce_ms != o.devices.debounce_ms ||
           devices.settle_ms != o.devices.settle_ms ||
           devices.first_frame_timeout_ms != o.devices.first_frame_timeout_ms ||
           devices.max_restart_attempts != o.devices.max_restart_attempts ||
           devices.restart_backoff_ms != o.devices.restart_backoff_ms;
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("audio")) {
            auto& a = j["audio"];
            read(a, "target_sample_rate", cfg.audio.target_sample_rate);
            read(a, "channels", cfg.audio.channels);
            read(a, "warmup_frames", cfg.audio.warmup_frames);
            read(a, "frame_channel_depth", cfg.audio.frame_channel_depth);
        }

        if (j.contains("capture")) {
            auto& c = j["capture"];
            read(c, "microphone", cfg.capture.microphone);
            read(c, "system", cfg.capture.system);
            read(c, "microphone_device", cfg.capture.microphone_device);
            read(c, "system_device", cfg.capture.system_device);
        }

        if (j.contains("transport")) {
            auto& t = j["transport"];
            read(t, "mode", cfg.transport.mode);
            read(t, "endpoint", cfg.transport.endpoint);
            read(t, "auth_token", cfg.transport.auth_token);
            read(t, "meeting_id", cfg.transport.meeting_id);
            read(t, "device_id", cfg.transport.device_id);
            read(t, "language", cfg.transport.language);
            read(t, "model", cfg.transport.model);
            read(t, "ring_buffer_ms", cfg.transport.ring_buffer_ms);
            read(t, "max_frame_bytes", cfg.transport.max_frame_bytes);
            read(t, "handshake_timeout_ms", cfg.transport.handshake_timeout_ms);
            read(t, "close_timeout_ms", cfg.transport.close_timeout_ms);
            read(t, "keepalive_interval_ms", cfg.transport.keepalive_interval_ms);
            read(t, "connect_timeout_ms", cfg.transport.connect_timeout_ms);
            read(t, "reconnect_delays_ms", cfg.transport.reconnect_delays_ms);
            read(t, "max_reconnect_attempts", cfg.transport.max_reconnect_attempts);
        }

        if (j.contains("devices")) {
            auto& d = j["devices"];
            read(d, "debounce_ms", cfg.devices.debounce_ms);
            read(d, "settle_ms", cfg.devices.settle_ms);
            read(d, "first_frame_timeout_ms", cfg.devices.first_frame_timeout_ms);
            read(d, "max_restart_attempts", cfg.devices.max_restart_attempts);
            read(d, "restart_backoff_ms", cfg.devices.restart_backoff_ms);
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    // Captured audio is downmixed; every frame on the wire is mono.
    if (cfg.audio.channels != 1) {
        std::println(stderr, "config: audio.channels {} not supported, using 1", cfg.audio.channels);
        cfg.audio.channels = 1;
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}

void Config::apply_environment() {
    if (const char* token = std::getenv("MEETCAP_AUTH_TOKEN"); token && *token) {
        transport.auth_token = token;
    }
}

std::vector<std::chrono::milliseconds> to_durations(const std::vector<uint32_t>& ms) {
    std::vector<std::chrono::milliseconds> out;
    out.reserve(ms.size());
    for (auto v : ms) out.emplace_back(v);
    return out;
}
