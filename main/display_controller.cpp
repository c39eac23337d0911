#include "display_controller.hpp"
#include "device_protocol.hpp"
#include "esp_log.h"

static const char *TAG = "Display";

// Emoji names the device firmware can render
static const char* const EMOTIONS[] = {
    "neutral", "happy", "laughing", "funny", "sad", "angry", "crying",
    "loving", "embarrassed", "surprised", "shocked", "thinking", "winking",
    "cool", "relaxed", "delicious", "kissy", "confident", "sleepy", "silly", "confused",
};

struct ModeInfo {
    DisplayController::DisplayMode mode;
    const char* name;
    const char* emotion;
};

static const ModeInfo MODES[] = {
    {DisplayController::DisplayMode::CLOCK,   "Clock",   "neutral"},
    {DisplayController::DisplayMode::WEATHER, "Weather", "cool"},
    {DisplayController::DisplayMode::STATUS,  "Status",  "thinking"},
    {DisplayController::DisplayMode::AI_LOG,  "AI Log",  "confident"},
    {DisplayController::DisplayMode::CUSTOM,  "Custom",  "neutral"},
};

DisplayController::DisplayController(DeviceCommandSink& device)
    : device_(device)
    , mode_(DisplayMode::CLOCK)
    , powered_(true)
{
}

bool DisplayController::parseMode(const std::string& name, DisplayMode& mode) {
    for (const auto& info : MODES) {
        if (name == info.name) {
            mode = info.mode;
            return true;
        }
    }
    return false;
}

const char* DisplayController::modeName(DisplayMode mode) {
    for (const auto& info : MODES) {
        if (info.mode == mode) {
            return info.name;
        }
    }
    return "Clock";
}

const char* DisplayController::emotionFor(DisplayMode mode) {
    for (const auto& info : MODES) {
        if (info.mode == mode) {
            return info.emotion;
        }
    }
    return "neutral";
}

bool DisplayController::isValidEmotion(const std::string& emotion) {
    for (const char* known : EMOTIONS) {
        if (emotion == known) {
            return true;
        }
    }
    return false;
}

void DisplayController::setMode(DisplayMode mode) {
    mode_ = mode;
    const char* emotion = emotionFor(mode);
    ESP_LOGI(TAG, "Setting display mode to: %s (emotion: %s)", modeName(mode), emotion);
    device_.sendToDevice(DeviceProtocol::llmEmotion(emotion));
}

void DisplayController::setPower(bool on) {
    powered_ = on;
    ESP_LOGI(TAG, "Setting display power: %s", on ? "ON" : "OFF");
    if (on) {
        device_.sendToDevice(DeviceProtocol::llmEmotion("neutral"));
    }
}

void DisplayController::showMessage(const std::string& text) {
    ESP_LOGD(TAG, "Showing message: %s", text.c_str());
    device_.sendToDevice(DeviceProtocol::ttsSentence(text));
}

esp_err_t DisplayController::showEmotion(const std::string& emotion) {
    if (!isValidEmotion(emotion)) {
        ESP_LOGW(TAG, "Invalid emotion: %s", emotion.c_str());
        return ESP_ERR_INVALID_ARG;
    }
    device_.sendToDevice(DeviceProtocol::llmEmotion(emotion));
    return ESP_OK;
}

void DisplayController::showAlert(const std::string& status, const std::string& message, const std::string& emotion) {
    ESP_LOGD(TAG, "Showing alert: %s - %s", status.c_str(), message.c_str());
    device_.sendToDevice(DeviceProtocol::alert(status, message, emotion));
}
