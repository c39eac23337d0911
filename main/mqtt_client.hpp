#pragma once

#include <string>
#include <vector>
#include <utility>
#include <functional>
#include "mqtt_client.h"
#include "freertos/FreeRTOS.h"
#include "freertos/event_groups.h"
#include "freertos/semphr.h"
#include "esp_err.h"
#include "message_bus.hpp"

// esp-mqtt backed bus client. Callbacks run on the esp-mqtt task; subscriptions are
// remembered and replayed on every (re)connect.
class MQTTClient : public MessageBus {
public:
    enum class ConnectionState {
        DISCONNECTED,
        CONNECTING,
        CONNECTED,
        ERROR
    };

    using StateCallback = std::function<void(ConnectionState state, const std::string& message)>;

    struct MQTTConfig {
        std::string broker_uri;
        std::string username;
        std::string password;
        std::string client_id;
        int keepalive = 60;
        // Last will, published by the broker when we vanish
        std::string will_topic;
        std::string will_payload = "OFF";
        bool will_retain = true;
    };

    MQTTClient();
    ~MQTTClient();

    esp_err_t initialize(const MQTTConfig& config);
    esp_err_t connect();
    // ESP_ERR_TIMEOUT when the broker did not accept us in time
    esp_err_t waitConnected(uint32_t timeout_ms);
    esp_err_t disconnect();

    // MessageBus
    esp_err_t publish(const std::string& topic, const std::string& payload, int qos, bool retain) override;
    esp_err_t subscribe(const std::string& topic, int qos) override;
    void setMessageCallback(MessageCallback callback) override;
    bool isConnected() const override { return current_state_ == ConnectionState::CONNECTED; }

    void setStateCallback(StateCallback callback);
    ConnectionState getState() const { return current_state_; }

    static const char* stateName(ConnectionState state);

private:
    static void mqttEventHandler(void *handler_args, esp_event_base_t base, int32_t event_id, void *event_data);
    void handleMQTTEvent(esp_mqtt_event_handle_t event);
    void handleData(esp_mqtt_event_handle_t event);
    void replaySubscriptions();

    void setState(ConnectionState state, const std::string& message = "");
    std::string generateClientId();

    esp_mqtt_client_handle_t client_;
    MQTTConfig config_;
    volatile ConnectionState current_state_;
    MessageCallback message_callback_;
    StateCallback state_callback_;

    EventGroupHandle_t event_group_;
    SemaphoreHandle_t mutex_;
    std::vector<std::pair<std::string, int>> subscriptions_;

    // Reassembly of payloads split across several MQTT_EVENT_DATA events
    std::string pending_topic_;
    std::string pending_payload_;

    static const int CONNECTED_BIT = BIT0;
};
