#pragma once

#include "platform/audio_backend.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <pipewire/extensions/metadata.h>
#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>
#include <string>

// AudioBackend on a PipeWire graph.
//
// One thread loop serves the registry and every stream. The registry keeps
// the list of Audio/Source and Audio/Sink nodes and the "default" metadata
// (default.audio.source / default.audio.sink); changes to either are reported
// as topology changes. System output is recorded from a sink's monitor.
class PipeWireBackend : public AudioBackend {
public:
    PipeWireBackend();
    ~PipeWireBackend() override;

    PipeWireBackend(const PipeWireBackend&) = delete;
    PipeWireBackend& operator=(const PipeWireBackend&) = delete;

    // Connects to the PipeWire daemon and waits for the initial node list.
    std::expected<void, Error> init();

    std::expected<std::unique_ptr<AudioStream>, Error>
        open(const StreamRequest& request, BufferCallback on_buffer,
             StreamErrorCallback on_error) override;

    std::optional<DeviceIdentity> default_device(Direction direction) override;
    std::vector<DeviceIdentity> list_devices(Direction direction) override;

    void set_topology_listener(TopologyCallback cb) override;

private:
    struct Node {
        std::string name;
        std::string description;
        Direction direction;
    };

    static void on_global(void* userdata, uint32_t id, uint32_t permissions, const char* type,
                          uint32_t version, const spa_dict* props);
    static void on_global_remove(void* userdata, uint32_t id);
    static void on_core_done(void* userdata, uint32_t id, int seq);
    static void on_core_error(void* userdata, uint32_t id, int seq, int res, const char* message);
    static int on_metadata_property(void* userdata, uint32_t subject, const char* key,
                                    const char* type, const char* value);

    void notify_topology(Direction direction, std::string reason);
    std::optional<DeviceIdentity> find_device(Direction direction, const std::string& name);

    pw_thread_loop* loop_ = nullptr;
    pw_context* context_ = nullptr;
    pw_core* core_ = nullptr;
    pw_registry* registry_ = nullptr;
    pw_metadata* metadata_ = nullptr;
    spa_hook core_listener_{};
    spa_hook registry_listener_{};
    spa_hook metadata_listener_{};

    int sync_seq_ = 0;
    bool synced_ = false;

    // Registry state; written on the loop thread.
    std::mutex mu_;
    std::map<uint32_t, Node> nodes_;
    std::string default_source_;
    std::string default_sink_;
    TopologyCallback topology_cb_;

    static constexpr pw_core_events core_events_ = {
        .version = PW_VERSION_CORE_EVENTS,
        .done = on_core_done,
        .error = on_core_error,
    };

    static constexpr pw_registry_events registry_events_ = {
        .version = PW_VERSION_REGISTRY_EVENTS,
        .global = on_global,
        .global_remove = on_global_remove,
    };

    static constexpr pw_metadata_events metadata_events_ = {
        .version = PW_VERSION_METADATA_EVENTS,
        .property = on_metadata_property,
    };
};
