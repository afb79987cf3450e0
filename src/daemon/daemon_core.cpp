#include "daemon_core.hpp"

#include <algorithm>
#include <format>
#include <print>

using json = nlohmann::json;

namespace {

json error_response(const std::string& message) {
    return {{"status", "error"}, {"message", message}};
}

json error_response(const Error& err) {
    return {{"status", "error"}, {"code", std::string(to_string(err.code))}, {"message", err.message}};
}

json device_json(const DeviceIdentity& d) {
    return {{"id", d.id}, {"name", d.display_name}};
}

json status_json(const SessionOrchestrator::Status& st) {
    json sources = json::array();
    for (const auto& s : st.sources) {
        json src = {
            {"source", std::string(source_name(s.source))},
            {"capture", std::string(to_string(s.capture))},
            {"transport", std::string(to_string(s.transport))},
            {"frames_delivered", s.capture_stats.frames_delivered},
            {"warmup_dropped", s.capture_stats.warmup_dropped},
            {"paused_dropped", s.capture_stats.paused_dropped},
            {"channel_dropped", s.channel_dropped},
            {"frames_sent", s.transport_stats.frames_sent},
            {"bytes_sent", s.transport_stats.bytes_sent},
            {"frames_buffered", s.transport_stats.frames_buffered},
            {"bytes_evicted", s.transport_stats.bytes_evicted},
            {"oversized_rejected", s.transport_stats.oversized_rejected},
            {"protocol_errors", s.transport_stats.protocol_errors},
            {"reconnects", s.transport_stats.reconnects},
            {"sequence", s.transport_stats.sequence},
        };
        if (s.device) src["device"] = device_json(*s.device);
        sources.push_back(std::move(src));
    }

    json restarts = json::object();
    for (auto id : all_sources) {
        const auto& m = st.devices.sources[static_cast<size_t>(id)];
        restarts[std::string(source_name(id))] = {
            {"count", m.restarts},
            {"last_ms", m.last_restart_duration.count()},
        };
    }

    return {
        {"status", "ok"},
        {"state", st.running ? "running" : "idle"},
        {"sources", std::move(sources)},
        {"devices", {
            {"device_changes", st.devices.device_changes},
            {"requests", st.devices.requests},
            {"fallbacks", st.devices.fallbacks},
            {"failures", st.devices.failures},
            {"restart_in_flight", st.devices.restart_in_flight},
            {"paused", st.devices.paused},
            {"restarts", std::move(restarts)},
        }},
    };
}

} // namespace

DaemonCore::DaemonCore(Config config, bool verbose,
                       AudioBackend& backend, PermissionService& permissions, IpcServer& ipc,
                       TransportFactory transport_factory, NotifyCallback notify)
    : verbose_(verbose), backend_(backend), ipc_(ipc),
      session_(std::move(config), backend, permissions, std::move(transport_factory),
               std::move(notify)) {}

DaemonCore::~DaemonCore() = default;

json DaemonCore::handle_command(const std::string& cmd_str, const json& cmd, int client_fd) {
    if (cmd_str == "start") return handle_start(cmd);
    if (cmd_str == "stop") return handle_stop(cmd);
    if (cmd_str == "status") return handle_status(cmd);
    if (cmd_str == "reconfigure") return handle_reconfigure(cmd);
    if (cmd_str == "devices") return handle_devices(cmd);
    if (cmd_str == "subscribe") return handle_subscribe(client_fd);
    return error_response("unknown command");
}

json DaemonCore::handle_start(const json& cmd) {
    if (session_.running()) return error_response("session already running");

    auto cfg = session_.config();
    if (auto err = apply_overrides(cmd, cfg); !err.empty()) return error_response(err);
    if (auto res = session_.reconfigure(cfg); !res) return error_response(res.error());

    auto started = session_.start();
    if (!started) {
        log("Session failed to start: " + started.error().message);
        return error_response(started.error());
    }

    log(std::format("Session started (meeting '{}')", cfg.transport.meeting_id));
    auto st = status_json(session_.status());
    st["message"] = "capturing";
    return st;
}

json DaemonCore::handle_stop(const json& /*cmd*/) {
    if (!session_.running()) return error_response("no session running");
    session_.stop();
    on_session_events();
    log("Session stopped");
    return {{"status", "ok"}, {"message", "stopped"}};
}

json DaemonCore::handle_status(const json& /*cmd*/) {
    return status_json(session_.status());
}

json DaemonCore::handle_reconfigure(const json& cmd) {
    auto cfg = session_.config();
    if (auto err = apply_overrides(cmd, cfg); !err.empty()) return error_response(err);

    auto res = session_.reconfigure(std::move(cfg));
    if (!res) return error_response(res.error());
    log("Session reconfigured");
    return {{"status", "ok"}, {"message", "reconfigured"}};
}

json DaemonCore::handle_devices(const json& /*cmd*/) {
    auto list = [this](Direction dir) {
        auto def = backend_.default_device(dir);
        json arr = json::array();
        for (const auto& d : backend_.list_devices(dir)) {
            auto j = device_json(d);
            j["default"] = def && def->id == d.id;
            arr.push_back(std::move(j));
        }
        return arr;
    };
    return {{"status", "ok"}, {"inputs", list(Direction::Input)}, {"outputs", list(Direction::Output)}};
}

json DaemonCore::handle_subscribe(int client_fd) {
    if (std::ranges::find(subscribers_, client_fd) == subscribers_.end()) {
        subscribers_.push_back(client_fd);
    }
    return {{"status", "ok"}, {"message", "subscribed"}};
}

void DaemonCore::on_session_events() {
    for (const auto& ev : session_.drain_events()) {
        auto line = to_json(ev);
        log("event: " + line.dump());
        std::erase_if(subscribers_, [this, &line](int fd) { return !ipc_.send_response(fd, line); });
    }
}

void DaemonCore::remove_client(int fd) {
    std::erase(subscribers_, fd);
}

void DaemonCore::shutdown() {
    session_.stop();
    on_session_events();
}

std::string DaemonCore::apply_overrides(const json& cmd, Config& cfg) {
    auto& t = cfg.transport;
    auto take = [&cmd](const char* key, std::string& out) -> bool {
        if (!cmd.contains(key)) return true;
        if (!cmd[key].is_string()) return false;
        out = cmd[key].get<std::string>();
        return true;
    };

    for (auto [key, field] : {std::pair<const char*, std::string*>{"language", &t.language},
                              {"model", &t.model},
                              {"endpoint", &t.endpoint},
                              {"auth_token", &t.auth_token},
                              {"mode", &t.mode},
                              {"meeting_id", &t.meeting_id}}) {
        if (!take(key, *field)) return std::format("{} must be a string", key);
    }

    if (t.mode != "backend" && t.mode != "direct") {
        return std::format("unknown transport mode '{}'", t.mode);
    }
    return {};
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[meetcap] {}", msg);
    }
}
