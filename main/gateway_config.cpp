#include "gateway_config.hpp"
#include "cJSON.h"
#include <cstdio>
#include <sstream>

static const char *TAG = "GatewayConfig";

static const char* DEFAULT_SCENE_PROMPT =
    "Describe what you see in this image. Focus on any people, animals, or unusual activity.";

static void readString(const cJSON* root, const char* key, std::string& target) {
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(root, key);
    if (!item) {
        return;
    }
    if (cJSON_IsString(item) && item->valuestring) {
        target = item->valuestring;
    } else {
        ESP_LOGW(TAG, "Option '%s' must be a string, keeping default", key);
    }
}

static void readPort(const cJSON* root, const char* key, uint16_t& target) {
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(root, key);
    if (!item) {
        return;
    }
    if (cJSON_IsNumber(item) && item->valuedouble >= 1 && item->valuedouble <= 65535) {
        target = static_cast<uint16_t>(item->valueint);
    } else {
        ESP_LOGW(TAG, "Option '%s' must be a port number, keeping %u", key, target);
    }
}

static void readFloat(const cJSON* root, const char* key, float& target) {
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(root, key);
    if (!item) {
        return;
    }
    if (cJSON_IsNumber(item)) {
        target = static_cast<float>(item->valuedouble);
    } else {
        ESP_LOGW(TAG, "Option '%s' must be a number, keeping %.2f", key, target);
    }
}

static void readSeconds(const cJSON* root, const char* key, uint32_t& target) {
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(root, key);
    if (!item) {
        return;
    }
    if (cJSON_IsNumber(item) && item->valuedouble >= 1) {
        target = static_cast<uint32_t>(item->valuedouble);
    } else {
        ESP_LOGW(TAG, "Option '%s' must be a positive number, keeping %u", key, (unsigned)target);
    }
}

esp_err_t GatewayConfig::applyOptionsJson(const std::string& json) {
    cJSON* root = cJSON_Parse(json.c_str());
    if (!cJSON_IsObject(root)) {
        cJSON_Delete(root);
        ESP_LOGE(TAG, "Options are not a JSON object, using defaults");
        return ESP_ERR_INVALID_ARG;
    }

    readString(root, "wifi_ssid", wifi_ssid);
    readString(root, "wifi_password", wifi_password);
    readPort(root, "websocket_port", websocket_port);
    readPort(root, "ota_port", http_port);
    readPort(root, "http_port", http_port);

    readString(root, "mqtt_url", mqtt_url);
    readString(root, "mqtt_host", mqtt_host);
    readPort(root, "mqtt_port", mqtt_port);
    readString(root, "mqtt_user", mqtt_user);
    readString(root, "mqtt_password", mqtt_password);
    readString(root, "discovery_prefix", discovery_prefix);
    readString(root, "node_id", node_id);

    readString(root, "sensecraft_mcp_url", sensecraft_mcp_url);
    readString(root, "ha_api_url", ha_api_url);
    readString(root, "ha_token", ha_token);

    readString(root, "vision_url", vision_url);
    readString(root, "vision_model", vision_model);
    readString(root, "vision_token", vision_token);

    readString(root, "custom_prompt", custom_prompt);
    readSeconds(root, "monitoring_interval", monitoring_interval);
    readFloat(root, "confidence_threshold", confidence_threshold);
    readFloat(root, "motion_threshold", motion_threshold);
    readFloat(root, "noise_threshold", noise_threshold);

    readString(root, "data_dir", data_dir);
    readString(root, "snapshot_dir", snapshot_dir);
    readString(root, "firmware_path", firmware_path);
    readString(root, "log_level", log_level);

    const cJSON* voice = cJSON_GetObjectItemCaseSensitive(root, "voice_assistant");
    if (cJSON_IsBool(voice)) {
        voice_assistant = cJSON_IsTrue(voice);
    }

    if (confidence_threshold < 0.0f || confidence_threshold > 1.0f) {
        ESP_LOGW(TAG, "confidence_threshold %.2f out of range, using 0.7", confidence_threshold);
        confidence_threshold = 0.7f;
    }

    cJSON_Delete(root);
    return ESP_OK;
}

esp_err_t GatewayConfig::loadOptionsFile(const std::string& path) {
    FILE* file = fopen(path.c_str(), "rb");
    if (!file) {
        ESP_LOGW(TAG, "No options file at %s, using defaults", path.c_str());
        return ESP_ERR_NOT_FOUND;
    }

    std::string content;
    char buffer[512];
    size_t read_len;
    while ((read_len = fread(buffer, 1, sizeof(buffer), file)) > 0) {
        content.append(buffer, read_len);
    }
    fclose(file);

    ESP_LOGI(TAG, "Loaded options from %s (%zu bytes)", path.c_str(), content.size());
    return applyOptionsJson(content);
}

std::string GatewayConfig::brokerUri() const {
    if (!mqtt_url.empty()) {
        return mqtt_url;
    }
    return "mqtt://" + mqtt_host + ":" + std::to_string(mqtt_port);
}

std::string GatewayConfig::visionIngestUrl() const {
    return "http://" + host_ip + ":" + std::to_string(http_port) + "/vision-ingest";
}

std::string GatewayConfig::scenePrompt() const {
    return custom_prompt.empty() ? DEFAULT_SCENE_PROMPT : custom_prompt;
}

esp_log_level_t GatewayConfig::logLevel() const {
    if (log_level == "error") return ESP_LOG_ERROR;
    if (log_level == "warn" || log_level == "warning") return ESP_LOG_WARN;
    if (log_level == "debug") return ESP_LOG_DEBUG;
    if (log_level == "verbose") return ESP_LOG_VERBOSE;
    return ESP_LOG_INFO;
}

std::string GatewayConfig::maskSecret(const std::string& secret) {
    if (secret.empty()) {
        return "<unset>";
    }
    if (secret.size() <= 4) {
        return "****";
    }
    return secret.substr(0, 2) + "****" + secret.substr(secret.size() - 2);
}

std::string GatewayConfig::summary() const {
    std::ostringstream ss;
    ss << "ws_port=" << websocket_port
       << " http_port=" << http_port
       << " broker=" << brokerUri()
       << " mqtt_user=" << (mqtt_user.empty() ? "<unset>" : mqtt_user)
       << " mqtt_password=" << maskSecret(mqtt_password)
       << " node=" << node_id
       << " mcp=" << (sensecraft_mcp_url.empty() ? "<disabled>" : "<set>")
       << " ha_token=" << maskSecret(ha_token)
       << " vision=" << (vision_url.empty() ? "<disabled>" : vision_url)
       << " interval=" << monitoring_interval
       << " confidence=" << confidence_threshold
       << " log_level=" << log_level;
    return ss.str();
}
