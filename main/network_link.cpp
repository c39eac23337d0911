#include "network_link.hpp"
#include "esp_log.h"
#include "esp_netif.h"
#include <cstring>
#include <cstdio>

static const char *TAG = "NetworkLink";

NetworkLink::NetworkLink()
    : current_state_(LinkState::IDLE)
    , event_group_(xEventGroupCreate())
    , netif_(nullptr)
    , wifi_handler_(nullptr)
    , ip_handler_(nullptr)
    , stopping_(false)
{
    host_ip_[0] = '\0';
}

NetworkLink::~NetworkLink() {
    disconnect();
    if (wifi_handler_) {
        esp_event_handler_instance_unregister(WIFI_EVENT, ESP_EVENT_ANY_ID, wifi_handler_);
    }
    if (ip_handler_) {
        esp_event_handler_instance_unregister(IP_EVENT, IP_EVENT_STA_GOT_IP, ip_handler_);
    }
    if (event_group_) {
        vEventGroupDelete(event_group_);
    }
}

esp_err_t NetworkLink::initialize() {
    ESP_LOGI(TAG, "Initializing WiFi station");

    if (!event_group_) {
        return ESP_ERR_NO_MEM;
    }

    // esp_netif_init() and esp_event_loop_create_default() are called in main()
    netif_ = esp_netif_create_default_wifi_sta();
    if (!netif_) {
        ESP_LOGE(TAG, "Failed to create station interface");
        return ESP_FAIL;
    }

    wifi_init_config_t cfg = WIFI_INIT_CONFIG_DEFAULT();
    esp_err_t ret = esp_wifi_init(&cfg);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "esp_wifi_init failed: %s", esp_err_to_name(ret));
        return ret;
    }

    ret = esp_event_handler_instance_register(WIFI_EVENT, ESP_EVENT_ANY_ID, &wifiEventHandler, this, &wifi_handler_);
    if (ret == ESP_OK) {
        ret = esp_event_handler_instance_register(IP_EVENT, IP_EVENT_STA_GOT_IP, &wifiEventHandler, this, &ip_handler_);
    }
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to register WiFi event handlers: %s", esp_err_to_name(ret));
        return ret;
    }

    setState(LinkState::IDLE);
    return ESP_OK;
}

esp_err_t NetworkLink::connect(const std::string& ssid, const std::string& password) {
    if (ssid.empty()) {
        ESP_LOGE(TAG, "No WiFi SSID configured");
        setState(LinkState::FAILED);
        return ESP_ERR_INVALID_ARG;
    }

    wifi_config_t wifi_config = {};
    strncpy((char*)wifi_config.sta.ssid, ssid.c_str(), sizeof(wifi_config.sta.ssid) - 1);
    strncpy((char*)wifi_config.sta.password, password.c_str(), sizeof(wifi_config.sta.password) - 1);
    wifi_config.sta.threshold.authmode = password.empty() ? WIFI_AUTH_OPEN : WIFI_AUTH_WPA2_PSK;

    esp_err_t ret = esp_wifi_set_mode(WIFI_MODE_STA);
    if (ret == ESP_OK) {
        ret = esp_wifi_set_config(WIFI_IF_STA, &wifi_config);
    }
    if (ret == ESP_OK) {
        stopping_ = false;
        setState(LinkState::CONNECTING);
        ret = esp_wifi_start();
    }
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to start WiFi station: %s", esp_err_to_name(ret));
        setState(LinkState::FAILED);
        return ret;
    }

    ESP_LOGI(TAG, "Connecting to WiFi network '%s'", ssid.c_str());
    return ESP_OK;
}

esp_err_t NetworkLink::waitForIp(uint32_t timeout_ms) {
    EventBits_t bits = xEventGroupWaitBits(event_group_, GOT_IP_BIT, pdFALSE, pdTRUE, pdMS_TO_TICKS(timeout_ms));
    if (!(bits & GOT_IP_BIT)) {
        ESP_LOGW(TAG, "No IP address after %u ms", (unsigned)timeout_ms);
        return ESP_ERR_TIMEOUT;
    }
    return ESP_OK;
}

esp_err_t NetworkLink::reconnect() {
    if (current_state_ == LinkState::IDLE || stopping_) {
        return ESP_ERR_INVALID_STATE;
    }

    setState(LinkState::CONNECTING);
    esp_err_t ret = esp_wifi_connect();
    if (ret == ESP_ERR_WIFI_CONN) {
        // An attempt is already under way
        return ESP_OK;
    }
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to redial WiFi: %s", esp_err_to_name(ret));
    }
    return ret;
}

esp_err_t NetworkLink::disconnect() {
    if (current_state_ == LinkState::IDLE) {
        return ESP_OK;
    }

    stopping_ = true;
    esp_err_t ret = esp_wifi_stop();
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to stop WiFi: %s", esp_err_to_name(ret));
    }
    xEventGroupClearBits(event_group_, GOT_IP_BIT);
    setState(LinkState::IDLE);
    return ret;
}

void NetworkLink::setStateCallback(StateCallback callback) {
    callback_ = callback;
}

std::string NetworkLink::getHostIp() const {
    return std::string(host_ip_);
}

void NetworkLink::wifiEventHandler(void* arg, esp_event_base_t event_base, int32_t event_id, void* event_data) {
    NetworkLink* self = static_cast<NetworkLink*>(arg);

    if (event_base == WIFI_EVENT) {
        switch (event_id) {
            case WIFI_EVENT_STA_START:
                ESP_LOGI(TAG, "WiFi station started");
                esp_wifi_connect();
                break;

            case WIFI_EVENT_STA_DISCONNECTED:
                xEventGroupClearBits(self->event_group_, GOT_IP_BIT);
                if (self->stopping_) {
                    break;
                }
                ESP_LOGW(TAG, "WiFi disconnected, retrying...");
                self->setState(LinkState::CONNECTING);
                esp_wifi_connect();
                break;

            default:
                break;
        }
    } else if (event_base == IP_EVENT && event_id == IP_EVENT_STA_GOT_IP) {
        ip_event_got_ip_t* event = (ip_event_got_ip_t*) event_data;
        snprintf(self->host_ip_, sizeof(self->host_ip_), IPSTR, IP2STR(&event->ip_info.ip));
        ESP_LOGI(TAG, "Got IP: %s", self->host_ip_);
        xEventGroupSetBits(self->event_group_, GOT_IP_BIT);
        self->setState(LinkState::CONNECTED);
    }
}

void NetworkLink::setState(LinkState state) {
    current_state_ = state;
    ESP_LOGD(TAG, "Link state changed to %d", (int)state);

    if (callback_) {
        callback_(state, getHostIp());
    }
}
