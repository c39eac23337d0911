#include "command_router.hpp"
#include "bus_adapter.hpp"
#include "display_controller.hpp"
#include "perception_pipeline.hpp"
#include "gateway_config.hpp"
#include "device_protocol.hpp"
#include "esp_log.h"
#include "cJSON.h"
#include <cstdlib>
#include <cerrno>
#include <strings.h>
#include <cmath>

static const char *TAG = "CommandRouter";

CommandRouter::CommandRouter(BusAdapter& bus, DisplayController& display, PerceptionPipeline& perception,
                             GatewayConfig& config, DeviceCommandSink& device)
    : bus_(bus)
    , display_(display)
    , perception_(perception)
    , config_(config)
    , device_(device)
{
    routes_ = {
        {{"switch", "monitoring"},           {&CommandRouter::handleMonitoring, true}},
        {{"button", "analyze_scene"},        {&CommandRouter::handleAnalyzeScene, false}},
        {{"text", "custom_prompt"},          {&CommandRouter::handleCustomPrompt, true}},
        {{"number", "monitoring_interval"},  {&CommandRouter::handleMonitoringInterval, true}},
        {{"number", "confidence_threshold"}, {&CommandRouter::handleConfidenceThreshold, true}},
        {{"switch", "voice_assistant"},      {&CommandRouter::handleVoiceAssistant, true}},
        {{"notify", "tts"},                  {&CommandRouter::handleTts, false}},
        {{"siren", "alarm"},                 {&CommandRouter::handleSiren, true}},
        {{"select", "display_mode"},         {&CommandRouter::handleDisplayMode, true}},
        {{"text", "display_message"},        {&CommandRouter::handleDisplayMessage, true}},
        {{"switch", "display_power"},        {&CommandRouter::handleDisplayPower, true}},
        {{"raw", "mcp"},                     {&CommandRouter::handleRawMcp, false}},
    };
}

esp_err_t CommandRouter::route(const std::string& component, const std::string& object_id,
                               const std::string& payload) {
    ESP_LOGI(TAG, "Command %s/%s: %s", component.c_str(), object_id.c_str(),
             BusAdapter::truncate(payload, 100).c_str());

    auto it = routes_.find(std::make_pair(component, object_id));
    if (it == routes_.end()) {
        ESP_LOGW(TAG, "No handler for %s/%s", component.c_str(), object_id.c_str());
        return ESP_ERR_NOT_FOUND;
    }

    std::string echo = payload;
    esp_err_t ret = (this->*(it->second.handler))(payload, echo);
    if (ret != ESP_OK) {
        ESP_LOGW(TAG, "Command %s/%s rejected: %s", component.c_str(), object_id.c_str(), esp_err_to_name(ret));
        return ret;
    }

    if (it->second.echo) {
        bus_.publishState(component + "/" + object_id, echo);
    }
    return ESP_OK;
}

BusAdapter::StateMap CommandRouter::currentStates() const {
    BusAdapter::StateMap states;
    states["switch/monitoring"] = perception_.isMonitoringEnabled() ? "ON" : "OFF";
    states["text/custom_prompt"] = BusAdapter::truncate(config_.custom_prompt, BusAdapter::MAX_STATE_CHARS);
    states["number/monitoring_interval"] = std::to_string(config_.monitoring_interval);
    states["number/confidence_threshold"] = std::to_string(std::lround(config_.confidence_threshold * 100.0f));
    states["switch/voice_assistant"] = config_.voice_assistant ? "ON" : "OFF";
    states["select/display_mode"] = DisplayController::modeName(display_.getMode());
    states["switch/display_power"] = display_.isPowered() ? "ON" : "OFF";
    return states;
}

bool CommandRouter::parseStrictInt(const std::string& text, long& value) {
    if (text.empty()) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    long parsed = strtol(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0') {
        return false;
    }
    value = parsed;
    return true;
}

bool CommandRouter::parseStrictFloat(const std::string& text, float& value) {
    if (text.empty()) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    float parsed = strtof(text.c_str(), &end);
    if (errno != 0 || end == text.c_str() || *end != '\0' || !std::isfinite(parsed)) {
        return false;
    }
    value = parsed;
    return true;
}

bool CommandRouter::isOn(const std::string& payload) {
    return strcasecmp(payload.c_str(), "ON") == 0;
}

esp_err_t CommandRouter::handleMonitoring(const std::string& payload, std::string& echo) {
    bool enabled = isOn(payload);
    perception_.setMonitoringEnabled(enabled);
    echo = enabled ? "ON" : "OFF";
    ESP_LOGI(TAG, "Monitoring %s", enabled ? "enabled" : "disabled");
    return ESP_OK;
}

esp_err_t CommandRouter::handleAnalyzeScene(const std::string& payload, std::string& echo) {
    display_.showAlert("Analyzing", "Analyzing scene...", "thinking");
    device_.requestSceneAnalysis();
    return ESP_OK;
}

esp_err_t CommandRouter::handleCustomPrompt(const std::string& payload, std::string& echo) {
    config_.custom_prompt = payload;
    return ESP_OK;
}

esp_err_t CommandRouter::handleMonitoringInterval(const std::string& payload, std::string& echo) {
    long seconds = 0;
    if (!parseStrictInt(payload, seconds) || seconds <= 0) {
        return ESP_ERR_INVALID_ARG;
    }
    config_.monitoring_interval = (uint32_t)seconds;
    return ESP_OK;
}

esp_err_t CommandRouter::handleConfidenceThreshold(const std::string& payload, std::string& echo) {
    float percent = 0;
    if (!parseStrictFloat(payload, percent) || percent < 0 || percent > 100) {
        return ESP_ERR_INVALID_ARG;
    }
    config_.confidence_threshold = percent / 100.0f;
    return ESP_OK;
}

esp_err_t CommandRouter::handleVoiceAssistant(const std::string& payload, std::string& echo) {
    config_.voice_assistant = isOn(payload);
    return ESP_OK;
}

esp_err_t CommandRouter::handleTts(const std::string& payload, std::string& echo) {
    display_.showMessage(payload);
    return ESP_OK;
}

esp_err_t CommandRouter::handleSiren(const std::string& payload, std::string& echo) {
    if (isOn(payload)) {
        display_.showAlert("ALARM", "Alarm triggered!", "shocked");
    } else {
        esp_err_t ret = display_.showEmotion("neutral");
        if (ret != ESP_OK) {
            return ret;
        }
    }
    return ESP_OK;
}

esp_err_t CommandRouter::handleDisplayMode(const std::string& payload, std::string& echo) {
    DisplayController::DisplayMode mode;
    if (!DisplayController::parseMode(payload, mode)) {
        return ESP_ERR_INVALID_ARG;
    }
    display_.setMode(mode);
    return ESP_OK;
}

esp_err_t CommandRouter::handleDisplayMessage(const std::string& payload, std::string& echo) {
    display_.showMessage(payload);
    return ESP_OK;
}

esp_err_t CommandRouter::handleDisplayPower(const std::string& payload, std::string& echo) {
    bool on = isOn(payload);
    display_.setPower(on);
    echo = on ? "ON" : "OFF";
    return ESP_OK;
}

esp_err_t CommandRouter::handleRawMcp(const std::string& payload, std::string& echo) {
    if (payload.empty()) {
        return ESP_ERR_INVALID_ARG;
    }

    std::string name = payload;
    std::string arguments = "{}";

    cJSON* root = cJSON_Parse(payload.c_str());
    if (cJSON_IsObject(root)) {
        // Without a usable name the payload itself is the tool name
        cJSON* name_item = cJSON_GetObjectItem(root, "name");
        if (cJSON_IsString(name_item) && name_item->valuestring[0] != '\0') {
            name = name_item->valuestring;
        }

        cJSON* args_item = cJSON_GetObjectItem(root, "arguments");
        if (cJSON_IsObject(args_item)) {
            char* args_json = cJSON_PrintUnformatted(args_item);
            if (args_json) {
                arguments = args_json;
                free(args_json);
            }
        }
    }
    cJSON_Delete(root);

    ESP_LOGI(TAG, "Forwarding tool call '%s' to device", name.c_str());
    device_.sendToDevice(DeviceProtocol::toolCall(device_.nextRequestId(), name, arguments));
    return ESP_OK;
}
