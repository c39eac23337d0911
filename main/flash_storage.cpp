#include "flash_storage.hpp"
#include "gateway_config.hpp"
#include "esp_log.h"
#include "nvs_flash.h"
#include <vector>
#include <cmath>

static const char *TAG = "FlashStorage";

// NVS keys are limited to 15 characters
const char* FlashStorage::NVS_NAMESPACE = "watcher_gw";
const char* FlashStorage::WIFI_SSID_KEY = "wifi_ssid";
const char* FlashStorage::WIFI_PASSWORD_KEY = "wifi_password";
const char* FlashStorage::MQTT_URL_KEY = "mqtt_url";
const char* FlashStorage::MQTT_USERNAME_KEY = "mqtt_user";
const char* FlashStorage::MQTT_PASSWORD_KEY = "mqtt_password";
const char* FlashStorage::HA_TOKEN_KEY = "ha_token";
const char* FlashStorage::MCP_URL_KEY = "mcp_url";
const char* FlashStorage::VISION_URL_KEY = "vision_url";
const char* FlashStorage::PROMPT_KEY = "custom_prompt";
const char* FlashStorage::INTERVAL_KEY = "mon_interval";
const char* FlashStorage::CONFIDENCE_KEY = "confidence_pct";
const char* FlashStorage::VOICE_KEY = "voice_assist";

FlashStorage::FlashStorage() : nvs_handle_(0), initialized_(false) {
}

FlashStorage::~FlashStorage() {
    if (initialized_) {
        nvs_close(nvs_handle_);
    }
}

esp_err_t FlashStorage::initialize() {
    if (initialized_) {
        return ESP_OK;
    }

    esp_err_t err = nvs_open(NVS_NAMESPACE, NVS_READWRITE, &nvs_handle_);
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "Error opening NVS handle: %s", esp_err_to_name(err));
        return err;
    }

    initialized_ = true;
    ESP_LOGI(TAG, "Flash storage initialized");
    return ESP_OK;
}

bool FlashStorage::commit(esp_err_t set_result, const char* key) {
    esp_err_t commit_result = set_result == ESP_OK ? nvs_commit(nvs_handle_) : set_result;
    if (commit_result != ESP_OK) {
        ESP_LOGE(TAG, "Error saving key %s: %s", key, esp_err_to_name(commit_result));
        return false;
    }
    return true;
}

int FlashStorage::loadGatewayOverrides(GatewayConfig& config) {
    int applied = 0;
    std::string text;
    int32_t number = 0;

    struct StringOverride {
        const char* key;
        std::string* target;
    };
    const StringOverride strings[] = {
        {WIFI_SSID_KEY, &config.wifi_ssid},
        {WIFI_PASSWORD_KEY, &config.wifi_password},
        {MQTT_URL_KEY, &config.mqtt_url},
        {MQTT_USERNAME_KEY, &config.mqtt_user},
        {MQTT_PASSWORD_KEY, &config.mqtt_password},
        {HA_TOKEN_KEY, &config.ha_token},
        {MCP_URL_KEY, &config.sensecraft_mcp_url},
        {VISION_URL_KEY, &config.vision_url},
        {PROMPT_KEY, &config.custom_prompt},
    };
    for (const auto& entry : strings) {
        if (loadString(entry.key, text)) {
            *entry.target = text;
            applied++;
        }
    }

    if (loadInt(INTERVAL_KEY, number) && number > 0) {
        config.monitoring_interval = (uint32_t)number;
        applied++;
    }
    if (loadInt(CONFIDENCE_KEY, number) && number >= 0 && number <= 100) {
        config.confidence_threshold = number / 100.0f;
        applied++;
    }
    if (loadInt(VOICE_KEY, number)) {
        config.voice_assistant = number != 0;
        applied++;
    }

    ESP_LOGI(TAG, "Applied %d settings from flash", applied);
    return applied;
}

bool FlashStorage::saveRuntimeSettings(const GatewayConfig& config) {
    if (!initialized_ && initialize() != ESP_OK) {
        return false;
    }

    esp_err_t err = nvs_set_str(nvs_handle_, PROMPT_KEY, config.custom_prompt.c_str());
    if (err == ESP_OK) {
        err = nvs_set_i32(nvs_handle_, INTERVAL_KEY, (int32_t)config.monitoring_interval);
    }
    if (err == ESP_OK) {
        err = nvs_set_i32(nvs_handle_, CONFIDENCE_KEY, (int32_t)lroundf(config.confidence_threshold * 100.0f));
    }
    if (err == ESP_OK) {
        err = nvs_set_i32(nvs_handle_, VOICE_KEY, config.voice_assistant ? 1 : 0);
    }
    if (!commit(err, "runtime settings")) {
        return false;
    }

    ESP_LOGD(TAG, "Runtime settings saved to flash");
    return true;
}

bool FlashStorage::loadString(const char* key, std::string& value) {
    if (!initialized_ && initialize() != ESP_OK) {
        return false;
    }

    size_t required_size = 0;
    esp_err_t err = nvs_get_str(nvs_handle_, key, nullptr, &required_size);

    if (err == ESP_OK && required_size > 0) {
        std::vector<char> buffer(required_size);
        err = nvs_get_str(nvs_handle_, key, buffer.data(), &required_size);

        if (err == ESP_OK) {
            value = std::string(buffer.data());
            return true;
        }
    }

    if (err != ESP_ERR_NVS_NOT_FOUND && err != ESP_OK) {
        ESP_LOGW(TAG, "Error reading key %s: %s", key, esp_err_to_name(err));
    }
    return false;
}

bool FlashStorage::loadInt(const char* key, int32_t& value) {
    if (!initialized_ && initialize() != ESP_OK) {
        return false;
    }

    esp_err_t err = nvs_get_i32(nvs_handle_, key, &value);
    return (err == ESP_OK);
}
