#pragma once

#include <string>
#include "esp_err.h"
#include "nvs.h"

struct GatewayConfig;

// NVS backed settings. Credentials provisioned once, plus the runtime settings
// changed from the bus so they survive a reboot.
class FlashStorage {
public:
    FlashStorage();
    ~FlashStorage();

    esp_err_t initialize();

    // Applies every key present in NVS on top of `config`. Returns the number of keys applied.
    int loadGatewayOverrides(GatewayConfig& config);
    bool saveRuntimeSettings(const GatewayConfig& config);

private:
    bool loadString(const char* key, std::string& value);
    bool loadInt(const char* key, int32_t& value);
    bool commit(esp_err_t set_result, const char* key);

    nvs_handle_t nvs_handle_;
    bool initialized_;

    static const char* NVS_NAMESPACE;
    static const char* WIFI_SSID_KEY;
    static const char* WIFI_PASSWORD_KEY;
    static const char* MQTT_URL_KEY;
    static const char* MQTT_USERNAME_KEY;
    static const char* MQTT_PASSWORD_KEY;
    static const char* HA_TOKEN_KEY;
    static const char* MCP_URL_KEY;
    static const char* VISION_URL_KEY;
    static const char* PROMPT_KEY;
    static const char* INTERVAL_KEY;
    static const char* CONFIDENCE_KEY;
    static const char* VOICE_KEY;
};
