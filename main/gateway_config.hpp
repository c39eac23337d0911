#pragma once

#include <string>
#include <cstdint>
#include "esp_err.h"
#include "esp_log.h"

// Gateway settings: compiled defaults, then the options file, then NVS overrides.
// The runtime block is changed by bus commands and only touched from the main context.
struct GatewayConfig {
    // Network
    std::string wifi_ssid;
    std::string wifi_password;
    std::string host_ip;                    // filled in once the station has an address
    uint16_t websocket_port = 8000;
    uint16_t http_port = 8001;

    // Bus
    std::string mqtt_url;                   // overrides host/port when set
    std::string mqtt_host = "core-mosquitto";
    uint16_t mqtt_port = 1883;
    std::string mqtt_user;
    std::string mqtt_password;
    std::string discovery_prefix = "homeassistant";
    std::string node_id = "sensecap_watcher";

    // Tool broker and automation API
    std::string sensecraft_mcp_url;
    std::string ha_api_url = "http://supervisor/core/api";
    std::string ha_token;

    // Vision backend
    std::string vision_url;                 // e.g. http://ollama.local:11434
    std::string vision_model = "llava";
    std::string vision_token = "sensecap-local";

    // Runtime
    std::string custom_prompt;
    uint32_t monitoring_interval = 60;      // seconds
    float confidence_threshold = 0.7f;      // 0.0 - 1.0
    bool voice_assistant = false;
    float motion_threshold = 0.05f;
    float noise_threshold = 500.0f;

    // Storage
    std::string data_dir = "/data";
    std::string snapshot_dir = "/data/snapshots";
    std::string firmware_path = "/data/firmware.bin";

    std::string log_level = "info";

    // Applies every known key of a JSON options object. Unknown keys are ignored and
    // keys of the wrong type keep their current value. ESP_ERR_INVALID_ARG when the
    // text is not a JSON object.
    esp_err_t applyOptionsJson(const std::string& json);
    // ESP_ERR_NOT_FOUND when the file does not exist.
    esp_err_t loadOptionsFile(const std::string& path);

    std::string brokerUri() const;
    std::string visionIngestUrl() const;
    std::string scenePrompt() const;
    esp_log_level_t logLevel() const;
    // One line with secrets masked
    std::string summary() const;

    static std::string maskSecret(const std::string& secret);
};
