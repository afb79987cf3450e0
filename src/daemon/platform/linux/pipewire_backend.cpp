#include "platform/linux/pipewire_backend.hpp"

#include <cstring>
#include <format>
#include <nlohmann/json.hpp>
#include <print>
#include <spa/utils/result.h>

namespace {

constexpr int negotiate_timeout_s = 5;
constexpr int sync_timeout_s = 5;

std::optional<Direction> class_direction(const char* media_class) {
    if (!media_class) return std::nullopt;
    if (std::strcmp(media_class, "Audio/Source") == 0) return Direction::Input;
    if (std::strcmp(media_class, "Audio/Sink") == 0) return Direction::Output;
    return std::nullopt;
}

// Metadata values look like {"name":"alsa_output.pci-0000_00_1f.3.analog-stereo"}.
std::string metadata_name(const char* value) {
    if (!value) return {};
    auto j = nlohmann::json::parse(value, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("name") || !j["name"].is_string()) {
        return {};
    }
    return j["name"].get<std::string>();
}

// One pw_stream recording a source or a sink monitor. Every member other
// than the callbacks is touched with the loop lock held.
class PipeWireStream : public AudioStream {
public:
    PipeWireStream(pw_thread_loop* loop, SourceId source, AudioBackend::BufferCallback on_buffer,
                   AudioBackend::StreamErrorCallback on_error)
        : loop_(loop), source_(source), on_buffer_(std::move(on_buffer)),
          on_error_(std::move(on_error)) {}

    ~PipeWireStream() override {
        pw_thread_loop_lock(loop_);
        destroy_locked();
        pw_thread_loop_unlock(loop_);
    }

    PipeWireStream(const PipeWireStream&) = delete;
    PipeWireStream& operator=(const PipeWireStream&) = delete;

    std::expected<void, Error> connect_locked(pw_core* core, const StreamRequest& request) {
        std::string node_name = std::format("meetcap-{}", source_name(source_));
        auto* props = pw_properties_new(
            PW_KEY_MEDIA_TYPE, "Audio",
            PW_KEY_MEDIA_CATEGORY, "Capture",
            PW_KEY_MEDIA_ROLE, "Communication",
            PW_KEY_NODE_NAME, node_name.c_str(),
            PW_KEY_APP_NAME, "meetcap",
            nullptr
        );
        if (source_ == SourceId::SystemOutput) {
            pw_properties_set(props, PW_KEY_STREAM_CAPTURE_SINK, "true");
        }
        if (!request.device_id.empty()) {
            pw_properties_set(props, PW_KEY_TARGET_OBJECT, request.device_id.c_str());
        }

        stream_ = pw_stream_new(core, node_name.c_str(), props);
        if (!stream_) {
            return std::unexpected(Error{ErrorCode::CaptureUnavailable, "failed to create stream"});
        }
        pw_stream_add_listener(stream_, &listener_, &stream_events_, this);

        // Only the sample format is fixed; rate and channels follow the device.
        uint8_t buf[1024];
        spa_pod_builder b = SPA_POD_BUILDER_INIT(buf, sizeof(buf));
        auto info = SPA_AUDIO_INFO_RAW_INIT(.format = SPA_AUDIO_FORMAT_F32);
        const spa_pod* params[1];
        params[0] = spa_format_audio_raw_build(&b, SPA_PARAM_EnumFormat, &info);

        int ret = pw_stream_connect(
            stream_,
            PW_DIRECTION_INPUT,
            PW_ID_ANY,
            static_cast<pw_stream_flags>(
                PW_STREAM_FLAG_AUTOCONNECT | PW_STREAM_FLAG_MAP_BUFFERS | PW_STREAM_FLAG_RT_PROCESS
            ),
            params, 1
        );
        if (ret < 0) {
            destroy_locked();
            return std::unexpected(Error{ErrorCode::CaptureUnavailable,
                                         std::format("stream connect failed: {}", spa_strerror(ret))});
        }

        while (!negotiated_ && !failure_) {
            if (pw_thread_loop_timed_wait(loop_, negotiate_timeout_s) != 0) {
                failure_ = Error{ErrorCode::CaptureUnavailable, "no device answered format negotiation"};
            }
        }
        if (failure_) {
            auto err = *failure_;
            destroy_locked();
            return std::unexpected(std::move(err));
        }
        return {};
    }

    NativeFormat format() const override { return format_; }
    DeviceIdentity device() const override { return device_; }

    void set_device(DeviceIdentity device) { device_ = std::move(device); }

private:
    void destroy_locked() {
        live_.store(false, std::memory_order_release);
        if (!stream_) return;
        spa_hook_remove(&listener_);
        pw_stream_disconnect(stream_);
        pw_stream_destroy(stream_);
        stream_ = nullptr;
    }

    static void on_process(void* userdata) {
        auto* self = static_cast<PipeWireStream*>(userdata);

        auto* buf = pw_stream_dequeue_buffer(self->stream_);
        if (!buf) return;

        auto* d = &buf->buffer->datas[0];
        if (!d->data || !self->live_.load(std::memory_order_acquire)) {
            pw_stream_queue_buffer(self->stream_, buf);
            return;
        }

        const auto& fmt = self->format_;
        size_t sample_bytes = fmt.sample_format == SampleFormat::F32 ? sizeof(float) : sizeof(int16_t);
        size_t frame_bytes = sample_bytes * fmt.channels;
        NativeBuffer nb{
            .format = fmt,
            .data = static_cast<const uint8_t*>(d->data) + d->chunk->offset,
            .frames = frame_bytes ? d->chunk->size / frame_bytes : 0,
        };
        self->on_buffer_(nb);

        pw_stream_queue_buffer(self->stream_, buf);
    }

    static void on_param_changed(void* userdata, uint32_t id, const spa_pod* param) {
        auto* self = static_cast<PipeWireStream*>(userdata);
        if (!param || id != SPA_PARAM_Format) return;

        spa_audio_info_raw info{};
        if (spa_format_audio_raw_parse(param, &info) < 0) {
            self->failure_ = Error{ErrorCode::FormatNegotiationError, "unparseable stream format"};
        } else {
            NativeFormat fmt;
            if (info.format == SPA_AUDIO_FORMAT_F32) fmt.sample_format = SampleFormat::F32;
            else if (info.format == SPA_AUDIO_FORMAT_S16) fmt.sample_format = SampleFormat::S16;
            fmt.sample_rate = info.rate;
            fmt.channels = info.channels;
            self->format_ = fmt;
            self->negotiated_ = true;
            self->live_.store(true, std::memory_order_release);
        }
        pw_thread_loop_signal(self->loop_, false);
    }

    static void on_state_changed(void* userdata, enum pw_stream_state old,
                                 enum pw_stream_state state, const char* error) {
        auto* self = static_cast<PipeWireStream*>(userdata);
        bool lost = state == PW_STREAM_STATE_ERROR ||
                    (state == PW_STREAM_STATE_UNCONNECTED && old != PW_STREAM_STATE_UNCONNECTED);
        if (!lost) return;

        std::println(stderr, "audio[{}]: stream state {} -> {}{}{}", source_name(self->source_),
                     pw_stream_state_as_string(old), pw_stream_state_as_string(state),
                     error ? ": " : "", error ? error : "");

        Error err{ErrorCode::CaptureUnavailable, error ? error : "stream disconnected"};
        if (!self->negotiated_) {
            self->failure_ = err;
            pw_thread_loop_signal(self->loop_, false);
            return;
        }
        self->live_.store(false, std::memory_order_release);
        if (self->on_error_) self->on_error_(err);
    }

    pw_thread_loop* loop_;
    SourceId source_;
    AudioBackend::BufferCallback on_buffer_;
    AudioBackend::StreamErrorCallback on_error_;

    pw_stream* stream_ = nullptr;
    spa_hook listener_{};

    NativeFormat format_;
    DeviceIdentity device_;
    bool negotiated_ = false;
    std::optional<Error> failure_;
    std::atomic<bool> live_{false};

    static constexpr pw_stream_events stream_events_ = {
        .version = PW_VERSION_STREAM_EVENTS,
        .state_changed = on_state_changed,
        .param_changed = on_param_changed,
        .process = on_process,
    };
};

} // namespace

PipeWireBackend::PipeWireBackend() {
    pw_init(nullptr, nullptr);
}

PipeWireBackend::~PipeWireBackend() {
    if (loop_) pw_thread_loop_stop(loop_);
    if (metadata_) {
        spa_hook_remove(&metadata_listener_);
        pw_proxy_destroy(reinterpret_cast<pw_proxy*>(metadata_));
    }
    if (registry_) {
        spa_hook_remove(&registry_listener_);
        pw_proxy_destroy(reinterpret_cast<pw_proxy*>(registry_));
    }
    if (core_) {
        spa_hook_remove(&core_listener_);
        pw_core_disconnect(core_);
    }
    if (context_) pw_context_destroy(context_);
    if (loop_) pw_thread_loop_destroy(loop_);
    pw_deinit();
}

std::expected<void, Error> PipeWireBackend::init() {
    loop_ = pw_thread_loop_new("meetcap", nullptr);
    if (!loop_) {
        return std::unexpected(Error{ErrorCode::CaptureUnavailable, "failed to create thread loop"});
    }

    context_ = pw_context_new(pw_thread_loop_get_loop(loop_), nullptr, 0);
    if (!context_) {
        return std::unexpected(Error{ErrorCode::CaptureUnavailable, "failed to create context"});
    }

    int ret = pw_thread_loop_start(loop_);
    if (ret < 0) {
        return std::unexpected(Error{ErrorCode::CaptureUnavailable,
                                     std::format("thread loop start failed: {}", spa_strerror(ret))});
    }

    pw_thread_loop_lock(loop_);
    core_ = pw_context_connect(context_, nullptr, 0);
    if (!core_) {
        pw_thread_loop_unlock(loop_);
        return std::unexpected(Error{ErrorCode::CaptureUnavailable,
                                     "cannot connect to the PipeWire daemon"});
    }
    pw_core_add_listener(core_, &core_listener_, &core_events_, this);

    registry_ = pw_core_get_registry(core_, PW_VERSION_REGISTRY, 0);
    pw_registry_add_listener(registry_, &registry_listener_, &registry_events_, this);

    sync_seq_ = pw_core_sync(core_, PW_ID_CORE, 0);
    while (!synced_) {
        if (pw_thread_loop_timed_wait(loop_, sync_timeout_s) != 0) break;
    }
    bool synced = synced_;
    pw_thread_loop_unlock(loop_);

    if (!synced) {
        return std::unexpected(Error{ErrorCode::CaptureUnavailable, "PipeWire registry sync timed out"});
    }
    return {};
}

std::expected<std::unique_ptr<AudioStream>, Error>
PipeWireBackend::open(const StreamRequest& request, BufferCallback on_buffer,
                      StreamErrorCallback on_error) {
    if (!core_) {
        return std::unexpected(Error{ErrorCode::CaptureUnavailable, "PipeWire not connected"});
    }

    auto direction = source_direction(request.source);
    std::optional<DeviceIdentity> target = request.device_id.empty()
        ? default_device(direction)
        : find_device(direction, request.device_id);
    if (!target) {
        return std::unexpected(Error{
            ErrorCode::CaptureUnavailable,
            request.device_id.empty()
                ? std::format("no {} device available", direction == Direction::Input ? "input" : "output")
                : std::format("device {} not found", request.device_id)});
    }

    auto stream = std::make_unique<PipeWireStream>(loop_, request.source, std::move(on_buffer),
                                                   std::move(on_error));
    stream->set_device(*target);

    StreamRequest resolved = request;
    resolved.device_id = target->id;

    pw_thread_loop_lock(loop_);
    auto connected = stream->connect_locked(core_, resolved);
    pw_thread_loop_unlock(loop_);

    if (!connected) return std::unexpected(connected.error());
    return stream;
}

std::optional<DeviceIdentity> PipeWireBackend::default_device(Direction direction) {
    std::string name;
    {
        std::lock_guard lock(mu_);
        name = direction == Direction::Input ? default_source_ : default_sink_;
    }
    if (!name.empty()) {
        if (auto dev = find_device(direction, name)) return dev;
    }

    auto all = list_devices(direction);
    if (all.empty()) return std::nullopt;
    return all.front();
}

std::vector<DeviceIdentity> PipeWireBackend::list_devices(Direction direction) {
    std::lock_guard lock(mu_);
    std::vector<DeviceIdentity> out;
    for (const auto& [id, node] : nodes_) {
        if (node.direction != direction) continue;
        out.push_back(DeviceIdentity{node.name, node.description, node.direction});
    }
    return out;
}

void PipeWireBackend::set_topology_listener(TopologyCallback cb) {
    // The loop lock keeps a callback already running from outliving this call.
    if (loop_) pw_thread_loop_lock(loop_);
    {
        std::lock_guard lock(mu_);
        topology_cb_ = std::move(cb);
    }
    if (loop_) pw_thread_loop_unlock(loop_);
}

std::optional<DeviceIdentity> PipeWireBackend::find_device(Direction direction,
                                                           const std::string& name) {
    std::lock_guard lock(mu_);
    for (const auto& [id, node] : nodes_) {
        if (node.direction == direction && node.name == name) {
            return DeviceIdentity{node.name, node.description, node.direction};
        }
    }
    return std::nullopt;
}

void PipeWireBackend::notify_topology(Direction direction, std::string reason) {
    TopologyCallback cb;
    {
        std::lock_guard lock(mu_);
        if (!synced_) return;
        cb = topology_cb_;
    }
    if (cb) cb(TopologyChange{direction, std::move(reason)});
}

void PipeWireBackend::on_global(void* userdata, uint32_t id, uint32_t /*permissions*/,
                                const char* type, uint32_t /*version*/, const spa_dict* props) {
    auto* self = static_cast<PipeWireBackend*>(userdata);
    if (!props) return;

    if (std::strcmp(type, PW_TYPE_INTERFACE_Metadata) == 0) {
        const char* name = spa_dict_lookup(props, PW_KEY_METADATA_NAME);
        if (!name || std::strcmp(name, "default") != 0 || self->metadata_) return;
        self->metadata_ = static_cast<pw_metadata*>(
            pw_registry_bind(self->registry_, id, type, PW_VERSION_METADATA, 0));
        if (self->metadata_) {
            pw_metadata_add_listener(self->metadata_, &self->metadata_listener_,
                                     &metadata_events_, self);
        }
        return;
    }

    if (std::strcmp(type, PW_TYPE_INTERFACE_Node) != 0) return;
    auto direction = class_direction(spa_dict_lookup(props, PW_KEY_MEDIA_CLASS));
    if (!direction) return;

    const char* name = spa_dict_lookup(props, PW_KEY_NODE_NAME);
    const char* desc = spa_dict_lookup(props, PW_KEY_NODE_DESCRIPTION);
    if (!name) return;

    {
        std::lock_guard lock(self->mu_);
        self->nodes_[id] = Node{name, desc ? desc : name, *direction};
    }
    self->notify_topology(*direction, std::format("device added: {}", name));
}

void PipeWireBackend::on_global_remove(void* userdata, uint32_t id) {
    auto* self = static_cast<PipeWireBackend*>(userdata);
    std::optional<Node> removed;
    {
        std::lock_guard lock(self->mu_);
        auto it = self->nodes_.find(id);
        if (it == self->nodes_.end()) return;
        removed = std::move(it->second);
        self->nodes_.erase(it);
    }
    self->notify_topology(removed->direction, std::format("device removed: {}", removed->name));
}

void PipeWireBackend::on_core_done(void* userdata, uint32_t id, int seq) {
    auto* self = static_cast<PipeWireBackend*>(userdata);
    if (id != PW_ID_CORE || seq != self->sync_seq_) return;
    {
        std::lock_guard lock(self->mu_);
        self->synced_ = true;
    }
    pw_thread_loop_signal(self->loop_, false);
}

void PipeWireBackend::on_core_error(void* userdata, uint32_t id, int /*seq*/, int res,
                                    const char* message) {
    auto* self = static_cast<PipeWireBackend*>(userdata);
    std::println(stderr, "audio: core error on {}: {} ({})", id, message ? message : "",
                 spa_strerror(res));
    if (id == PW_ID_CORE) pw_thread_loop_signal(self->loop_, false);
}

int PipeWireBackend::on_metadata_property(void* userdata, uint32_t subject, const char* key,
                                          const char* /*type*/, const char* value) {
    auto* self = static_cast<PipeWireBackend*>(userdata);
    if (subject != PW_ID_CORE || !key) return 0;

    std::optional<Direction> changed;
    {
        std::lock_guard lock(self->mu_);
        if (std::strcmp(key, "default.audio.source") == 0) {
            auto name = metadata_name(value);
            if (name != self->default_source_) {
                self->default_source_ = std::move(name);
                changed = Direction::Input;
            }
        } else if (std::strcmp(key, "default.audio.sink") == 0) {
            auto name = metadata_name(value);
            if (name != self->default_sink_) {
                self->default_sink_ = std::move(name);
                changed = Direction::Output;
            }
        }
    }
    if (changed) self->notify_topology(*changed, std::format("{} changed", key));
    return 0;
}
