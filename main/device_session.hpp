#pragma once

#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <cstdint>
#include "esp_err.h"
#include "device_link.hpp"
#include "device_protocol.hpp"
#include "command_outbox.hpp"
#include "scheduler.hpp"
#include "collaborators.hpp"

class BusAdapter;
class PerceptionPipeline;
struct GatewayConfig;

// Owns the single device session slot and the outbox. Every entry point runs on the
// main scheduling context; transports post their events there first. Vision calls go
// to the worker and their results come back through the main context.
class DeviceSessionManager : public DeviceCommandSink {
public:
    enum class SessionState {
        CONNECTING,
        HANDSHAKING,
        ACTIVE,
        CLOSED
    };

    struct DeviceSession {
        std::string session_id;
        int fd = -1;
        // Distinguishes connections that reuse a socket number
        uint32_t generation = 0;
        SessionState state = SessionState::CONNECTING;
    };

    struct SessionTiming {
        uint32_t listen_stop_delay_ms = 500;
        uint32_t flush_interval_ms = 100;
    };

    using ConnectionCallback = std::function<void(bool connected)>;

    DeviceSessionManager(Scheduler& scheduler, Scheduler& worker, DeviceLink& link, BusAdapter& bus,
                         PerceptionPipeline& perception, GatewayConfig& config,
                         SpeechProvider* speech, const SessionTiming& timing);

    void setConnectionCallback(ConnectionCallback callback);

    // Transport events
    void onConnected(int fd);
    void onTextFrame(int fd, const std::string& text);
    void onBinaryFrame(int fd, size_t length);
    void onClosed(int fd);

    // DeviceCommandSink
    void sendToDevice(const std::string& message) override;
    int nextRequestId() override;
    void requestSceneAnalysis() override;

    void flushOutbox();
    // Periodic frame request while monitoring is on. Never queued.
    void startMonitoringTicks();
    // Closes the device socket and stops timers that would touch the session.
    void shutdown();

    bool hasSession() const { return session_.has_value(); }
    bool isActive() const;
    SessionState getState() const;
    std::string getSessionId() const;
    const CommandOutbox& outbox() const { return outbox_; }
    uint32_t binaryFrameCount() const { return binary_frames_; }

    static const char* stateName(SessionState state);

private:
    void dispatch(const DeviceMessage& message);
    void handleHello();
    void handleListen(const DeviceMessage& message);
    void handleAudio(const DeviceMessage& message);
    void handleImage(const DeviceMessage& message);
    void handleMcp(const DeviceMessage& message);
    void startAnalysis(const std::vector<uint8_t>& image);
    void onAnalysisDone(const std::vector<uint8_t>& image, esp_err_t status, const VisionResult& result);

    bool canSend() const;
    esp_err_t sendNow(const std::string& message);
    void flushStep();
    void monitoringTick();
    void transition(SessionState state);

    Scheduler& scheduler_;
    Scheduler& worker_;
    DeviceLink& link_;
    BusAdapter& bus_;
    PerceptionPipeline& perception_;
    GatewayConfig& config_;
    SpeechProvider* speech_;
    SessionTiming timing_;

    std::optional<DeviceSession> session_;
    CommandOutbox outbox_;
    ConnectionCallback connection_callback_;

    bool flushing_;
    bool force_analysis_;
    bool stopped_;
    bool ticks_started_;
    int request_id_;
    uint32_t generation_;
    uint32_t binary_frames_;

    static const char* TAG;
};
