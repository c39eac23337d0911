#include "device_session.hpp"
#include "bus_adapter.hpp"
#include "perception_pipeline.hpp"
#include "gateway_config.hpp"
#include "esp_log.h"
#include "cJSON.h"
#include <cstdlib>

const char* DeviceSessionManager::TAG = "DeviceSession";

DeviceSessionManager::DeviceSessionManager(Scheduler& scheduler, Scheduler& worker, DeviceLink& link, BusAdapter& bus,
                                           PerceptionPipeline& perception, GatewayConfig& config,
                                           SpeechProvider* speech, const SessionTiming& timing)
    : scheduler_(scheduler)
    , worker_(worker)
    , link_(link)
    , bus_(bus)
    , perception_(perception)
    , config_(config)
    , speech_(speech)
    , timing_(timing)
    , flushing_(false)
    , force_analysis_(false)
    , stopped_(false)
    , ticks_started_(false)
    , request_id_(0)
    , generation_(0)
    , binary_frames_(0)
{
}

void DeviceSessionManager::setConnectionCallback(ConnectionCallback callback) {
    connection_callback_ = callback;
}

void DeviceSessionManager::onConnected(int fd) {
    if (stopped_) {
        link_.closeLink(fd);
        return;
    }

    if (session_ && session_->fd != fd) {
        ESP_LOGW(TAG, "New device connection (fd=%d) supersedes session on fd=%d", fd, session_->fd);
        link_.closeLink(session_->fd);
    }

    session_ = DeviceSession{};
    session_->fd = fd;
    session_->generation = ++generation_;
    session_->state = SessionState::CONNECTING;
    ESP_LOGI(TAG, "Device connected (fd=%d)", fd);

    transition(SessionState::ACTIVE);
    if (connection_callback_) {
        connection_callback_(true);
    }
}

void DeviceSessionManager::onTextFrame(int fd, const std::string& text) {
    if (!session_ || session_->fd != fd) {
        ESP_LOGW(TAG, "Dropping frame from stale connection fd=%d", fd);
        return;
    }

    DeviceMessage message;
    if (DeviceProtocol::parse(text, message) != ESP_OK) {
        ESP_LOGE(TAG, "Invalid JSON from device (%zu bytes)", text.size());
        return;
    }

    ESP_LOGI(TAG, "Device message: type=%s", message.type_name.c_str());
    dispatch(message);
}

void DeviceSessionManager::onBinaryFrame(int fd, size_t length) {
    if (!session_ || session_->fd != fd) {
        return;
    }
    binary_frames_++;
    if (binary_frames_ == 1 || binary_frames_ % 100 == 0) {
        ESP_LOGD(TAG, "Received %u audio frames (%zu bytes)", (unsigned)binary_frames_, length);
    }
}

void DeviceSessionManager::onClosed(int fd) {
    if (!session_ || session_->fd != fd) {
        ESP_LOGD(TAG, "Close of superseded connection fd=%d ignored", fd);
        return;
    }

    transition(SessionState::CLOSED);
    session_.reset();
    ESP_LOGW(TAG, "Device disconnected (fd=%d)", fd);

    if (connection_callback_) {
        connection_callback_(false);
    }
}

void DeviceSessionManager::dispatch(const DeviceMessage& message) {
    switch (message.type) {
        case DeviceMessage::Type::HELLO:
            handleHello();
            break;
        case DeviceMessage::Type::LISTEN:
            handleListen(message);
            break;
        case DeviceMessage::Type::AUDIO:
            handleAudio(message);
            break;
        case DeviceMessage::Type::IMAGE:
            handleImage(message);
            break;
        case DeviceMessage::Type::MCP:
            handleMcp(message);
            break;
        case DeviceMessage::Type::WHEEL:
            ESP_LOGI(TAG, "Wheel event: %s", message.detail.c_str());
            break;
        case DeviceMessage::Type::BUTTON:
            ESP_LOGI(TAG, "Button event: %s", message.detail.c_str());
            break;
        case DeviceMessage::Type::STATUS:
            ESP_LOGD(TAG, "Device status: %s", message.payload.c_str());
            break;
        default:
            ESP_LOGD(TAG, "Unknown message type '%s' dropped", message.type_name.c_str());
            break;
    }
}

void DeviceSessionManager::handleHello() {
    session_->session_id = DeviceProtocol::generateSessionId();
    transition(SessionState::HANDSHAKING);

    esp_err_t ret = sendNow(DeviceProtocol::helloAck(session_->session_id));
    if (ret != ESP_OK) {
        ESP_LOGW(TAG, "Hello reply failed: %s", esp_err_to_name(ret));
    }

    std::string init = DeviceProtocol::initializeRequest(nextRequestId(), config_.visionIngestUrl(),
                                                         config_.vision_token);
    ret = sendNow(init);
    if (ret != ESP_OK) {
        ESP_LOGW(TAG, "MCP initialize push failed: %s", esp_err_to_name(ret));
    }

    // The reply may have failed because the socket went away underneath us
    if (session_) {
        transition(SessionState::ACTIVE);
        ESP_LOGI(TAG, "Hello handshake completed, session: %s", session_->session_id.c_str());
    }
}

void DeviceSessionManager::handleListen(const DeviceMessage& message) {
    ESP_LOGI(TAG, "Device listen state: %s", message.state.c_str());
    if (message.state != "detect" && message.state != "start") {
        return;
    }

    uint32_t generation = session_->generation;
    esp_err_t ret = scheduler_.postDelayed(timing_.listen_stop_delay_ms, [this, generation]() {
        if (stopped_ || !session_ || session_->generation != generation) {
            return;
        }
        esp_err_t send_ret = sendNow(DeviceProtocol::ttsStop());
        if (send_ret != ESP_OK) {
            ESP_LOGW(TAG, "TTS stop not delivered: %s", esp_err_to_name(send_ret));
        } else {
            ESP_LOGI(TAG, "Sent TTS stop to end listen session");
        }
        flushOutbox();
    });
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to schedule listen stop: %s", esp_err_to_name(ret));
    }
}

void DeviceSessionManager::handleAudio(const DeviceMessage& message) {
    if (message.data.empty()) {
        ESP_LOGD(TAG, "Audio message without data");
        return;
    }

    bool noise = perception_.detectNoise(message.data);
    bus_.publishStateOnOff("binary_sensor/noise_detected", noise);

    if (!speech_) {
        ESP_LOGD(TAG, "No speech provider, skipping recognition");
        return;
    }

    std::string text;
    esp_err_t ret = speech_->recognize(message.data, text);
    if (ret != ESP_OK) {
        ESP_LOGW(TAG, "Speech recognition failed: %s", esp_err_to_name(ret));
        return;
    }
    if (text.empty()) {
        return;
    }

    ESP_LOGI(TAG, "STT result: %s", text.c_str());
    cJSON* data = cJSON_CreateObject();
    cJSON_AddStringToObject(data, "text", text.c_str());
    char* data_json = cJSON_PrintUnformatted(data);
    cJSON_Delete(data);
    if (data_json) {
        bus_.fireEvent("voice_command", data_json);
        free(data_json);
    }
}

void DeviceSessionManager::handleImage(const DeviceMessage& message) {
    if (message.data.empty()) {
        ESP_LOGD(TAG, "Image message without data");
        return;
    }

    bus_.publishImage(message.data);

    bool motion = perception_.detectMotion(message.data);
    bus_.publishStateOnOff("binary_sensor/motion_detected", motion);

    bool force = force_analysis_;
    force_analysis_ = false;
    if (!motion && !force) {
        return;
    }

    if (!perception_.beginAnalysis(force)) {
        return;
    }
    startAnalysis(message.data);
}

void DeviceSessionManager::startAnalysis(const std::vector<uint8_t>& image) {
    std::string prompt = config_.scenePrompt();
    esp_err_t ret = worker_.post([this, image, prompt]() {
        VisionResult result;
        esp_err_t status = perception_.runAnalysis(image, prompt, result);
        esp_err_t post_ret = scheduler_.postWait([this, image, status, result]() {
            onAnalysisDone(image, status, result);
        });
        if (post_ret != ESP_OK) {
            ESP_LOGW(TAG, "Analysis result discarded: %s", esp_err_to_name(post_ret));
        }
    });
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to queue scene analysis: %s", esp_err_to_name(ret));
        perception_.finishAnalysis(image, ret);
    }
}

void DeviceSessionManager::onAnalysisDone(const std::vector<uint8_t>& image, esp_err_t status,
                                          const VisionResult& result) {
    if (!perception_.finishAnalysis(image, status) || stopped_) {
        return;
    }

    ESP_LOGI(TAG, "Vision analysis: confidence=%.2f", result.confidence);
    bus_.publishState("sensor/last_event", BusAdapter::truncate(result.description, BusAdapter::MAX_STATE_CHARS));

    if (result.confidence >= config_.confidence_threshold) {
        cJSON* data = cJSON_CreateObject();
        cJSON_AddStringToObject(data, "description", result.description.c_str());
        cJSON_AddNumberToObject(data, "confidence", result.confidence);
        char* data_json = cJSON_PrintUnformatted(data);
        cJSON_Delete(data);
        if (data_json) {
            bus_.fireEvent("alert", data_json);
            free(data_json);
        }
        ESP_LOGI(TAG, "Alert fired: confidence=%.2f", result.confidence);
    }
}

void DeviceSessionManager::handleMcp(const DeviceMessage& message) {
    ESP_LOGI(TAG, "MCP response from device: %s", BusAdapter::truncate(message.payload, 500).c_str());
    bus_.publishState("sensor/last_event", "MCP: " + BusAdapter::truncate(message.payload, BusAdapter::MAX_STATE_CHARS));
}

void DeviceSessionManager::sendToDevice(const std::string& message) {
    // Queued messages go first so delivery order always matches call order
    if (canSend() && outbox_.empty() && !flushing_) {
        esp_err_t ret = sendNow(message);
        if (ret == ESP_OK) {
            ESP_LOGI(TAG, "Sent to device via WebSocket");
            return;
        }
        ESP_LOGW(TAG, "WebSocket send failed: %s", esp_err_to_name(ret));
    }

    outbox_.enqueue(message);
    if (canSend()) {
        flushOutbox();
    }
}

int DeviceSessionManager::nextRequestId() {
    return ++request_id_;
}

void DeviceSessionManager::requestSceneAnalysis() {
    force_analysis_ = true;
    sendToDevice(DeviceProtocol::requestFrame());
}

void DeviceSessionManager::flushOutbox() {
    if (flushing_ || stopped_ || !canSend() || outbox_.empty()) {
        return;
    }

    ESP_LOGI(TAG, "Flushing %zu queued commands", outbox_.size());
    flushing_ = true;
    flushStep();
}

void DeviceSessionManager::flushStep() {
    if (stopped_ || !canSend()) {
        flushing_ = false;
        return;
    }

    CommandEnvelope envelope;
    if (!outbox_.popFront(envelope)) {
        flushing_ = false;
        return;
    }

    esp_err_t ret = sendNow(envelope.message);
    if (ret != ESP_OK) {
        ESP_LOGW(TAG, "Failed to deliver queued command #%llu: %s",
                 (unsigned long long)envelope.sequence, esp_err_to_name(ret));
        outbox_.pushFront(envelope);
        flushing_ = false;
        return;
    }
    ESP_LOGI(TAG, "Delivered queued command #%llu", (unsigned long long)envelope.sequence);

    if (outbox_.empty()) {
        flushing_ = false;
        return;
    }

    ret = scheduler_.postDelayed(timing_.flush_interval_ms, [this]() { flushStep(); });
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to schedule next flush step: %s", esp_err_to_name(ret));
        flushing_ = false;
    }
}

void DeviceSessionManager::startMonitoringTicks() {
    if (ticks_started_) {
        return;
    }
    ticks_started_ = true;

    esp_err_t ret = scheduler_.postDelayed(config_.monitoring_interval * 1000, [this]() { monitoringTick(); });
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to schedule monitoring tick: %s", esp_err_to_name(ret));
        ticks_started_ = false;
    }
}

void DeviceSessionManager::monitoringTick() {
    if (stopped_) {
        return;
    }

    if (perception_.isMonitoringEnabled() && isActive()) {
        esp_err_t ret = sendNow(DeviceProtocol::requestFrame());
        if (ret != ESP_OK) {
            ESP_LOGD(TAG, "Frame request not delivered: %s", esp_err_to_name(ret));
        }
    }

    // Interval may have been changed from the bus since the last tick
    esp_err_t ret = scheduler_.postDelayed(config_.monitoring_interval * 1000, [this]() { monitoringTick(); });
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to schedule monitoring tick: %s", esp_err_to_name(ret));
        ticks_started_ = false;
    }
}

void DeviceSessionManager::shutdown() {
    stopped_ = true;
    if (session_) {
        ESP_LOGI(TAG, "Closing device session on fd=%d", session_->fd);
        link_.closeLink(session_->fd);
        transition(SessionState::CLOSED);
        session_.reset();
    }
}

bool DeviceSessionManager::isActive() const {
    return session_ && session_->state == SessionState::ACTIVE;
}

DeviceSessionManager::SessionState DeviceSessionManager::getState() const {
    return session_ ? session_->state : SessionState::CLOSED;
}

std::string DeviceSessionManager::getSessionId() const {
    return session_ ? session_->session_id : std::string();
}

const char* DeviceSessionManager::stateName(SessionState state) {
    switch (state) {
        case SessionState::CONNECTING:  return "CONNECTING";
        case SessionState::HANDSHAKING: return "HANDSHAKING";
        case SessionState::ACTIVE:      return "ACTIVE";
        case SessionState::CLOSED:      return "CLOSED";
        default:                        return "UNKNOWN";
    }
}

bool DeviceSessionManager::canSend() const {
    return session_ && (session_->state == SessionState::ACTIVE || session_->state == SessionState::HANDSHAKING);
}

esp_err_t DeviceSessionManager::sendNow(const std::string& message) {
    if (!canSend()) {
        return ESP_ERR_INVALID_STATE;
    }
    return link_.sendText(session_->fd, message);
}

void DeviceSessionManager::transition(SessionState state) {
    if (!session_) {
        return;
    }
    ESP_LOGD(TAG, "Session fd=%d: %s -> %s", session_->fd, stateName(session_->state), stateName(state));
    session_->state = state;
}
