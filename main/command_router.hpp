#pragma once

#include <string>
#include <map>
#include <utility>
#include "esp_err.h"
#include "device_link.hpp"
#include "bus_adapter.hpp"

class DisplayController;
class PerceptionPipeline;
struct GatewayConfig;

// Turns bus commands into device directives and configuration changes.
// Stateful entities echo the applied value to their state topic.
class CommandRouter {
public:
    CommandRouter(BusAdapter& bus, DisplayController& display, PerceptionPipeline& perception,
                  GatewayConfig& config, DeviceCommandSink& device);

    // ESP_ERR_NOT_FOUND for an unknown entity, ESP_ERR_INVALID_ARG for a payload the
    // entity cannot take. Nothing is echoed in either case.
    esp_err_t route(const std::string& component, const std::string& object_id, const std::string& payload);

    // State of every entity this router backs, formatted as its echo would be
    BusAdapter::StateMap currentStates() const;

    static bool parseStrictInt(const std::string& text, long& value);
    static bool parseStrictFloat(const std::string& text, float& value);
    // Switch payloads compare without regard to case
    static bool isOn(const std::string& payload);

private:
    using Handler = esp_err_t (CommandRouter::*)(const std::string& payload, std::string& echo);

    struct Route {
        Handler handler;
        bool echo;
    };

    esp_err_t handleMonitoring(const std::string& payload, std::string& echo);
    esp_err_t handleAnalyzeScene(const std::string& payload, std::string& echo);
    esp_err_t handleCustomPrompt(const std::string& payload, std::string& echo);
    esp_err_t handleMonitoringInterval(const std::string& payload, std::string& echo);
    esp_err_t handleConfidenceThreshold(const std::string& payload, std::string& echo);
    esp_err_t handleVoiceAssistant(const std::string& payload, std::string& echo);
    esp_err_t handleTts(const std::string& payload, std::string& echo);
    esp_err_t handleSiren(const std::string& payload, std::string& echo);
    esp_err_t handleDisplayMode(const std::string& payload, std::string& echo);
    esp_err_t handleDisplayMessage(const std::string& payload, std::string& echo);
    esp_err_t handleDisplayPower(const std::string& payload, std::string& echo);
    esp_err_t handleRawMcp(const std::string& payload, std::string& echo);

    BusAdapter& bus_;
    DisplayController& display_;
    PerceptionPipeline& perception_;
    GatewayConfig& config_;
    DeviceCommandSink& device_;

    std::map<std::pair<std::string, std::string>, Route> routes_;
};
