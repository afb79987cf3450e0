#pragma once

#include "config.hpp"
#include "platform/audio_backend.hpp"
#include "platform/ipc_server.hpp"
#include "platform/permission_service.hpp"
#include "session_orchestrator.hpp"
#include "transport/transport_factory.hpp"

#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Platform-independent command handling for meetcapd. The event loop feeds
// it IPC commands and wakes it when the session has queued events.
class DaemonCore {
public:
    using NotifyCallback = std::function<void()>;

    DaemonCore(Config config, bool verbose,
               AudioBackend& backend, PermissionService& permissions, IpcServer& ipc,
               TransportFactory transport_factory, NotifyCallback notify);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd,
                                  int client_fd);

    // Pushes queued session events to subscribed clients.
    void on_session_events();

    void remove_client(int fd);

    bool session_running() const { return session_.running(); }

    void shutdown();

private:
    nlohmann::json handle_start(const nlohmann::json& cmd);
    nlohmann::json handle_stop(const nlohmann::json& cmd);
    nlohmann::json handle_status(const nlohmann::json& cmd);
    nlohmann::json handle_reconfigure(const nlohmann::json& cmd);
    nlohmann::json handle_devices(const nlohmann::json& cmd);
    nlohmann::json handle_subscribe(int client_fd);

    // Copies the transport overrides a command carries into cfg. Returns an
    // error message for a bad value.
    static std::string apply_overrides(const nlohmann::json& cmd, Config& cfg);

    void log(const std::string& msg);

    bool verbose_;
    AudioBackend& backend_;
    IpcServer& ipc_;

    SessionOrchestrator session_;
    std::vector<int> subscribers_;
};
