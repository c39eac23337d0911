#include "mqtt_client.hpp"
#include "esp_log.h"
#include "esp_mac.h"
#include "esp_random.h"
#include <cstring>
#include <sstream>
#include <iomanip>

static const char *TAG = "MQTTClient";

MQTTClient::MQTTClient()
    : client_(nullptr)
    , current_state_(ConnectionState::DISCONNECTED)
    , event_group_(xEventGroupCreate())
    , mutex_(xSemaphoreCreateMutex())
{
    if (!event_group_ || !mutex_) {
        ESP_LOGE(TAG, "Failed to create synchronisation primitives");
    }
}

MQTTClient::~MQTTClient() {
    disconnect();
    if (client_) {
        esp_mqtt_client_destroy(client_);
    }
    if (event_group_) {
        vEventGroupDelete(event_group_);
    }
    if (mutex_) {
        vSemaphoreDelete(mutex_);
    }
}

esp_err_t MQTTClient::initialize(const MQTTConfig& config) {
    ESP_LOGI(TAG, "Initializing MQTT client");

    if (!event_group_ || !mutex_) {
        return ESP_ERR_NO_MEM;
    }

    config_ = config;

    if (config_.client_id.empty()) {
        config_.client_id = generateClientId();
    }

    esp_mqtt_client_config_t mqtt_cfg = {};
    mqtt_cfg.broker.address.uri = config_.broker_uri.c_str();

    mqtt_cfg.credentials.username = config_.username.empty() ? nullptr : config_.username.c_str();
    mqtt_cfg.credentials.authentication.password = config_.password.empty() ? nullptr : config_.password.c_str();
    mqtt_cfg.credentials.client_id = config_.client_id.c_str();

    mqtt_cfg.session.keepalive = config_.keepalive;
    mqtt_cfg.session.disable_clean_session = false;
    if (!config_.will_topic.empty()) {
        mqtt_cfg.session.last_will.topic = config_.will_topic.c_str();
        mqtt_cfg.session.last_will.msg = config_.will_payload.c_str();
        mqtt_cfg.session.last_will.msg_len = (int)config_.will_payload.length();
        mqtt_cfg.session.last_will.qos = 1;
        mqtt_cfg.session.last_will.retain = config_.will_retain;
    }

    mqtt_cfg.network.disable_auto_reconnect = false;
    mqtt_cfg.network.timeout_ms = 10000;
    mqtt_cfg.network.reconnect_timeout_ms = 5000;

    client_ = esp_mqtt_client_init(&mqtt_cfg);
    if (!client_) {
        ESP_LOGE(TAG, "Failed to initialize MQTT client");
        return ESP_FAIL;
    }

    esp_err_t ret = esp_mqtt_client_register_event(client_, MQTT_EVENT_ANY, mqttEventHandler, this);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to register MQTT event handler: %s", esp_err_to_name(ret));
        esp_mqtt_client_destroy(client_);
        client_ = nullptr;
        return ret;
    }

    setState(ConnectionState::DISCONNECTED, "MQTT client initialized");
    ESP_LOGI(TAG, "MQTT client initialized with broker: %s", config_.broker_uri.c_str());

    return ESP_OK;
}

esp_err_t MQTTClient::connect() {
    if (!client_) {
        ESP_LOGE(TAG, "MQTT client not initialized");
        return ESP_ERR_INVALID_STATE;
    }

    if (current_state_ == ConnectionState::CONNECTED) {
        ESP_LOGW(TAG, "MQTT client already connected");
        return ESP_OK;
    }

    setState(ConnectionState::CONNECTING, "Connecting to MQTT broker");
    ESP_LOGI(TAG, "Connecting to MQTT broker: %s", config_.broker_uri.c_str());

    esp_err_t result = esp_mqtt_client_start(client_);
    if (result != ESP_OK) {
        ESP_LOGE(TAG, "Failed to start MQTT client");
        setState(ConnectionState::ERROR, "Failed to start MQTT client");
        return result;
    }

    return ESP_OK;
}

esp_err_t MQTTClient::waitConnected(uint32_t timeout_ms) {
    EventBits_t bits = xEventGroupWaitBits(event_group_, CONNECTED_BIT, pdFALSE, pdTRUE,
                                           pdMS_TO_TICKS(timeout_ms));
    if (!(bits & CONNECTED_BIT)) {
        ESP_LOGW(TAG, "MQTT broker not reachable within %u ms", (unsigned)timeout_ms);
        return ESP_ERR_TIMEOUT;
    }
    return ESP_OK;
}

esp_err_t MQTTClient::disconnect() {
    if (!client_) {
        return ESP_OK;
    }

    if (current_state_ == ConnectionState::DISCONNECTED) {
        return ESP_OK;
    }

    ESP_LOGI(TAG, "Disconnecting from MQTT broker");
    esp_err_t result = esp_mqtt_client_stop(client_);
    if (result != ESP_OK) {
        ESP_LOGE(TAG, "Failed to stop MQTT client");
    }

    xEventGroupClearBits(event_group_, CONNECTED_BIT);
    setState(ConnectionState::DISCONNECTED, "Disconnected from MQTT broker");
    return result;
}

esp_err_t MQTTClient::publish(const std::string& topic, const std::string& payload, int qos, bool retain) {
    if (!client_ || current_state_ != ConnectionState::CONNECTED) {
        ESP_LOGD(TAG, "MQTT client not connected, dropping publish to %s", topic.c_str());
        return ESP_ERR_INVALID_STATE;
    }

    ESP_LOGD(TAG, "Publishing to topic: %s (%zu bytes)", topic.c_str(), payload.size());

    int msg_id = esp_mqtt_client_publish(client_, topic.c_str(), payload.data(), (int)payload.length(),
                                         qos, retain);

    if (msg_id == -1) {
        ESP_LOGE(TAG, "Failed to publish message to topic: %s", topic.c_str());
        return ESP_FAIL;
    }

    ESP_LOGD(TAG, "Message published successfully, msg_id: %d", msg_id);
    return ESP_OK;
}

esp_err_t MQTTClient::subscribe(const std::string& topic, int qos) {
    if (xSemaphoreTake(mutex_, pdMS_TO_TICKS(1000)) != pdTRUE) {
        ESP_LOGE(TAG, "Failed to take mutex");
        return ESP_ERR_TIMEOUT;
    }
    bool known = false;
    for (auto& subscription : subscriptions_) {
        if (subscription.first == topic) {
            subscription.second = qos;
            known = true;
        }
    }
    if (!known) {
        subscriptions_.push_back(std::make_pair(topic, qos));
    }
    xSemaphoreGive(mutex_);

    if (!client_ || current_state_ != ConnectionState::CONNECTED) {
        ESP_LOGI(TAG, "Subscription to %s deferred until connected", topic.c_str());
        return ESP_OK;
    }

    ESP_LOGI(TAG, "Subscribing to topic: %s", topic.c_str());

    int msg_id = esp_mqtt_client_subscribe(client_, topic.c_str(), qos);

    if (msg_id == -1) {
        ESP_LOGE(TAG, "Failed to subscribe to topic: %s", topic.c_str());
        return ESP_FAIL;
    }

    ESP_LOGI(TAG, "Subscribed to topic: %s, msg_id: %d", topic.c_str(), msg_id);
    return ESP_OK;
}

void MQTTClient::setMessageCallback(MessageCallback callback) {
    message_callback_ = callback;
}

void MQTTClient::setStateCallback(StateCallback callback) {
    state_callback_ = callback;
}

const char* MQTTClient::stateName(ConnectionState state) {
    switch (state) {
        case ConnectionState::DISCONNECTED: return "DISCONNECTED";
        case ConnectionState::CONNECTING:   return "CONNECTING";
        case ConnectionState::CONNECTED:    return "CONNECTED";
        case ConnectionState::ERROR:        return "ERROR";
        default:                            return "UNKNOWN";
    }
}

void MQTTClient::replaySubscriptions() {
    if (xSemaphoreTake(mutex_, pdMS_TO_TICKS(1000)) != pdTRUE) {
        ESP_LOGE(TAG, "Failed to take mutex");
        return;
    }
    std::vector<std::pair<std::string, int>> subscriptions = subscriptions_;
    xSemaphoreGive(mutex_);

    for (const auto& subscription : subscriptions) {
        int msg_id = esp_mqtt_client_subscribe(client_, subscription.first.c_str(), subscription.second);
        if (msg_id == -1) {
            ESP_LOGE(TAG, "Failed to resubscribe to topic: %s", subscription.first.c_str());
        } else {
            ESP_LOGI(TAG, "Subscribed to topic: %s, msg_id: %d", subscription.first.c_str(), msg_id);
        }
    }
}

void MQTTClient::mqttEventHandler(void *handler_args, esp_event_base_t base, int32_t event_id, void *event_data) {
    MQTTClient* self = static_cast<MQTTClient*>(handler_args);
    if (!self) {
        ESP_LOGE(TAG, "MQTT handler called with null instance");
        return;
    }

    esp_mqtt_event_handle_t event = static_cast<esp_mqtt_event_handle_t>(event_data);
    self->handleMQTTEvent(event);
}

void MQTTClient::handleMQTTEvent(esp_mqtt_event_handle_t event) {
    switch (event->event_id) {
        case MQTT_EVENT_CONNECTED:
            ESP_LOGI(TAG, "MQTT client connected");
            xEventGroupSetBits(event_group_, CONNECTED_BIT);
            setState(ConnectionState::CONNECTED, "Connected to MQTT broker");
            replaySubscriptions();
            break;

        case MQTT_EVENT_DISCONNECTED:
            ESP_LOGW(TAG, "MQTT client disconnected");
            xEventGroupClearBits(event_group_, CONNECTED_BIT);
            pending_topic_.clear();
            pending_payload_.clear();
            setState(ConnectionState::DISCONNECTED, "Disconnected from MQTT broker");
            break;

        case MQTT_EVENT_SUBSCRIBED:
            ESP_LOGI(TAG, "MQTT subscription successful, msg_id: %d", event->msg_id);
            break;

        case MQTT_EVENT_PUBLISHED:
            ESP_LOGD(TAG, "MQTT message published successfully, msg_id: %d", event->msg_id);
            break;

        case MQTT_EVENT_DATA:
            handleData(event);
            break;

        case MQTT_EVENT_ERROR:
            ESP_LOGE(TAG, "MQTT error occurred");
            if (event->error_handle && event->error_handle->error_type == MQTT_ERROR_TYPE_TCP_TRANSPORT) {
                ESP_LOGE(TAG, "Transport error, socket errno: %d", event->error_handle->esp_transport_sock_errno);
            }
            setState(ConnectionState::ERROR, "MQTT error occurred");
            break;

        default:
            ESP_LOGD(TAG, "MQTT event: %d", event->event_id);
            break;
    }
}

void MQTTClient::handleData(esp_mqtt_event_handle_t event) {
    // The topic only comes with the first chunk
    if (event->current_data_offset == 0) {
        pending_topic_.assign(event->topic, event->topic_len);
        pending_payload_.clear();
        pending_payload_.reserve(event->total_data_len);
    }
    pending_payload_.append(event->data, event->data_len);

    if ((int)pending_payload_.size() < event->total_data_len) {
        return;
    }

    ESP_LOGD(TAG, "MQTT message received on %s (%zu bytes)", pending_topic_.c_str(), pending_payload_.size());
    if (message_callback_) {
        message_callback_(pending_topic_, pending_payload_);
    }
    pending_topic_.clear();
    pending_payload_.clear();
}

void MQTTClient::setState(ConnectionState state, const std::string& message) {
    if (current_state_ != state) {
        current_state_ = state;
        ESP_LOGI(TAG, "MQTT state changed to: %s, message: %s", stateName(state), message.c_str());

        if (state_callback_) {
            state_callback_(state, message);
        }
    }
}

std::string MQTTClient::generateClientId() {
    uint8_t mac[6];
    esp_err_t ret = esp_read_mac(mac, ESP_MAC_WIFI_STA);

    std::stringstream ss;
    ss << "watcher_gw_";

    if (ret != ESP_OK) {
        ESP_LOGW(TAG, "WiFi MAC not available, using base MAC");
        ret = esp_read_mac(mac, ESP_MAC_BASE);

        if (ret != ESP_OK) {
            ESP_LOGW(TAG, "Base MAC not available, using random id");
            uint32_t random_id = esp_random();
            for (int i = 0; i < 6; ++i) {
                mac[i] = (random_id >> ((i % 4) * 8)) & 0xFF;
            }
        }
    }

    for (int i = 0; i < 6; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(mac[i]);
    }

    return ss.str();
}
