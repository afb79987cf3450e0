#pragma once

#include "audio_frame.hpp"

// Capability check for capturing a source. The host UI owns any prompting;
// request_capture_permission() returns the user's answer.
class PermissionService {
public:
    virtual ~PermissionService() = default;
    virtual bool has_capture_permission(SourceId kind) = 0;
    virtual bool request_capture_permission(SourceId kind) = 0;
};

// Grants exactly the sources enabled in the configuration. PipeWire has no
// consent dialog of its own, so this is what the Linux daemon uses.
class AllowListPermissionService : public PermissionService {
public:
    AllowListPermissionService(bool microphone, bool system)
        : microphone_(microphone), system_(system) {}

    bool has_capture_permission(SourceId kind) override {
        return kind == SourceId::Microphone ? microphone_ : system_;
    }
    bool request_capture_permission(SourceId kind) override {
        return has_capture_permission(kind);
    }

private:
    bool microphone_;
    bool system_;
};
