#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <nlohmann/json.hpp>
#include <print>
#include <string>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  start [--meeting ID] [overrides]   Start capturing and streaming");
    std::println(stderr, "  stop                               Stop the session");
    std::println(stderr, "  status                             Show session status");
    std::println(stderr, "  reconfigure [overrides]            Change transport settings live");
    std::println(stderr, "  devices                            List capture devices");
    std::println(stderr, "  watch                              Print session events until interrupted");
    std::println(stderr, "Overrides:");
    std::println(stderr, "  --language TAG --model NAME --endpoint URL --token TOKEN --mode backend|direct");
}

static void print_status(const json& r) {
    std::println("State: {}", r.value("state", "unknown"));
    if (r.contains("sources")) {
        for (const auto& s : r["sources"]) {
            std::string device = s.contains("device") ? s["device"].value("name", "") : "-";
            std::println("  {:<4} capture={:<10} transport={:<12} sent={} buffered={} evicted={}B  [{}]",
                         s.value("source", "?"), s.value("capture", "?"), s.value("transport", "?"),
                         s.value("frames_sent", 0), s.value("frames_buffered", 0),
                         s.value("bytes_evicted", 0), device);
        }
    }
    if (r.contains("devices")) {
        const auto& d = r["devices"];
        std::println("Device changes: {} (fallbacks {}, failures {}){}", d.value("device_changes", 0),
                     d.value("fallbacks", 0), d.value("failures", 0),
                     d.value("restart_in_flight", false) ? ", restart in progress" : "");
    }
}

static void print_devices(const json& r) {
    for (const char* group : {"inputs", "outputs"}) {
        std::println("{}:", group);
        if (!r.contains(group)) continue;
        for (const auto& d : r[group]) {
            std::println("  {} {} ({})", d.value("default", false) ? "*" : " ",
                         d.value("name", ""), d.value("id", ""));
        }
    }
}

static void print_event(const json& ev) {
    auto kind = ev.value("event", "");
    auto source = ev.value("source", "?");
    if (kind == "transcript") {
        std::string speaker = ev.value("speaker", "");
        std::println("[{}] {:<5} {}{}", source, ev.value("kind", ""),
                     speaker.empty() ? "" : speaker + ": ", ev.value("text", ""));
    } else if (ev.contains("error")) {
        std::println("[{}] {}: {}", source, kind, ev["error"].value("message", ""));
    } else {
        std::println("[{}] {}", source, kind);
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    json overrides = json::object();

    // Parse optional args
    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (i + 1 >= argc) {
            std::println(stderr, "Missing value for {}", arg);
            return 1;
        }
        if (arg == "--meeting") overrides["meeting_id"] = argv[++i];
        else if (arg == "--language") overrides["language"] = argv[++i];
        else if (arg == "--model") overrides["model"] = argv[++i];
        else if (arg == "--endpoint") overrides["endpoint"] = argv[++i];
        else if (arg == "--token") overrides["auth_token"] = argv[++i];
        else if (arg == "--mode") overrides["mode"] = argv[++i];
        else {
            std::println(stderr, "Unknown option: {}", arg);
            return 1;
        }
    }

    // Build command JSON
    json cmd;
    if (command == "start" || command == "reconfigure") {
        cmd = overrides;
        cmd["cmd"] = command;
    } else if (command == "stop" || command == "status" || command == "devices") {
        cmd = {{"cmd", command}};
    } else if (command == "watch") {
        cmd = {{"cmd", "subscribe"}};
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    // Connect and send
    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is meetcapd running?");
        return 1;
    }

    if (!client.send(cmd)) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    json response;
    if (!client.recv(response)) {
        std::println(stderr, "No response from daemon (timeout)");
        return 1;
    }

    // Display response
    auto status = response.value("status", "");
    if (status == "error") {
        std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        return 1;
    }

    if (command == "status" || command == "start") {
        print_status(response);
    } else if (command == "devices") {
        print_devices(response);
    } else if (command == "watch") {
        json ev;
        while (client.recv(ev, -1)) {
            print_event(ev);
        }
        std::println(stderr, "Daemon closed the connection");
    } else if (status == "ok") {
        std::println("{}", response.value("message", "OK"));
    } else {
        std::println("{}", response.dump(2));
    }

    return 0;
}
