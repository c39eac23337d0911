#pragma once

#include <string>
#include <functional>
#include "esp_wifi.h"
#include "esp_event.h"
#include "freertos/FreeRTOS.h"
#include "freertos/event_groups.h"

// Wi-Fi station bring-up. Reconnects by itself after a drop and keeps track of the
// address the device should dial back to.
class NetworkLink {
public:
    enum class LinkState {
        IDLE,
        CONNECTING,
        CONNECTED,
        FAILED
    };

    using StateCallback = std::function<void(LinkState state, const std::string& ip)>;

    NetworkLink();
    ~NetworkLink();

    esp_err_t initialize();
    esp_err_t connect(const std::string& ssid, const std::string& password);
    // ESP_ERR_TIMEOUT when no address was obtained in time
    esp_err_t waitForIp(uint32_t timeout_ms);
    // Dials again after a stalled attempt
    esp_err_t reconnect();
    esp_err_t disconnect();

    void setStateCallback(StateCallback callback);

    LinkState getState() const { return current_state_; }
    std::string getHostIp() const;

private:
    static void wifiEventHandler(void* arg, esp_event_base_t event_base, int32_t event_id, void* event_data);

    void setState(LinkState state);

    volatile LinkState current_state_;
    StateCallback callback_;
    EventGroupHandle_t event_group_;
    esp_netif_t* netif_;
    esp_event_handler_instance_t wifi_handler_;
    esp_event_handler_instance_t ip_handler_;
    char host_ip_[16];
    bool stopping_;

    static const int GOT_IP_BIT = BIT0;
};
