#include "tool_bridge.hpp"
#include "mcp_server.hpp"
#include "task_manager.hpp"
#include "esp_log.h"
#include "esp_crt_bundle.h"

static const char *TAG = "ToolBridge";

ToolBridge::ToolBridge(McpServer& server)
    : server_(server)
    , client_(nullptr)
    , queue_(nullptr)
    , event_group_(xEventGroupCreate())
    , dropping_(false)
{
}

ToolBridge::~ToolBridge() {
    stop();
    if (event_group_) {
        vEventGroupDelete(event_group_);
    }
}

esp_err_t ToolBridge::start(const BridgeConfig& config, TaskManager& tasks) {
    if (client_) {
        return ESP_ERR_INVALID_STATE;
    }
    if (config.url.empty()) {
        ESP_LOGI(TAG, "No tool broker URL configured, bridge disabled");
        return ESP_ERR_INVALID_ARG;
    }
    if (!event_group_) {
        return ESP_ERR_NO_MEM;
    }

    config_ = config;
    queue_ = xQueueCreate(config_.queue_length, sizeof(WorkItem*));
    if (!queue_) {
        ESP_LOGE(TAG, "Failed to create work queue");
        return ESP_ERR_NO_MEM;
    }

    xEventGroupClearBits(event_group_, WORKER_DONE_BIT);
    esp_err_t ret = tasks.createTask("mcp_worker", std::bind(&ToolBridge::workerLoop, this),
                                     config_.worker_stack_size, config_.worker_priority);
    if (ret != ESP_OK) {
        vQueueDelete(queue_);
        queue_ = nullptr;
        return ret;
    }

    esp_websocket_client_config_t ws_cfg = {};
    ws_cfg.uri = config_.url.c_str();
    ws_cfg.reconnect_timeout_ms = config_.reconnect_timeout_ms;
    ws_cfg.network_timeout_ms = config_.network_timeout_ms;
    ws_cfg.ping_interval_sec = config_.ping_interval_sec;
    ws_cfg.disable_auto_reconnect = false;
    ws_cfg.buffer_size = 4096;
    ws_cfg.crt_bundle_attach = esp_crt_bundle_attach;

    client_ = esp_websocket_client_init(&ws_cfg);
    if (!client_) {
        ESP_LOGE(TAG, "Failed to create WebSocket client");
        ret = ESP_FAIL;
    }
    if (ret == ESP_OK) {
        ret = esp_websocket_register_events(client_, WEBSOCKET_EVENT_ANY, websocketEventHandler, this);
    }
    if (ret == ESP_OK) {
        ESP_LOGI(TAG, "Connecting to tool broker...");
        ret = esp_websocket_client_start(client_);
    }
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to start tool bridge: %s", esp_err_to_name(ret));
        stop();
        return ret;
    }

    return ESP_OK;
}

esp_err_t ToolBridge::stop() {
    esp_err_t result = ESP_OK;

    // Client first so no event can land in the queue while the worker drains it
    if (client_) {
        ESP_LOGI(TAG, "Stopping tool bridge");
        if (esp_websocket_client_is_connected(client_)) {
            esp_err_t ret = esp_websocket_client_close(client_, pdMS_TO_TICKS(2000));
            if (ret != ESP_OK) {
                ESP_LOGW(TAG, "Close handshake failed: %s", esp_err_to_name(ret));
            }
        }
        // Also ends the reconnect loop; fails harmlessly when close already stopped it
        esp_err_t ret = esp_websocket_client_stop(client_);
        if (ret != ESP_OK) {
            ESP_LOGD(TAG, "WebSocket client already stopped: %s", esp_err_to_name(ret));
        }
    }

    if (queue_) {
        WorkItem* stop_item = new WorkItem{WorkItem::Kind::STOP, ""};
        if (xQueueSend(queue_, &stop_item, pdMS_TO_TICKS(1000)) != pdTRUE) {
            delete stop_item;
            ESP_LOGE(TAG, "Work queue full, worker not stopped");
            result = ESP_ERR_TIMEOUT;
        } else {
            EventBits_t bits = xEventGroupWaitBits(event_group_, WORKER_DONE_BIT, pdFALSE, pdTRUE,
                                                   pdMS_TO_TICKS(15000));
            if (!(bits & WORKER_DONE_BIT)) {
                ESP_LOGE(TAG, "Worker still busy after 15 s");
                result = ESP_ERR_TIMEOUT;
            }
        }

        if (result == ESP_OK) {
            WorkItem* item = nullptr;
            while (xQueueReceive(queue_, &item, 0) == pdTRUE) {
                delete item;
            }
            vQueueDelete(queue_);
            queue_ = nullptr;
        }
    }

    // A worker that did not stop may still use the client
    if (client_ && result == ESP_OK) {
        esp_err_t ret = esp_websocket_client_destroy(client_);
        if (ret != ESP_OK) {
            ESP_LOGE(TAG, "Failed to destroy WebSocket client: %s", esp_err_to_name(ret));
            result = ret;
        }
        client_ = nullptr;
    }

    incoming_.clear();
    if (result == ESP_OK) {
        ESP_LOGI(TAG, "Tool bridge stopped");
    }
    return result;
}

bool ToolBridge::isConnected() const {
    return client_ && esp_websocket_client_is_connected(client_);
}

bool ToolBridge::enqueue(WorkItem* item) {
    if (!queue_ || xQueueSend(queue_, &item, pdMS_TO_TICKS(100)) != pdTRUE) {
        ESP_LOGW(TAG, "Work queue full, dropping broker message");
        delete item;
        return false;
    }
    return true;
}

void ToolBridge::websocketEventHandler(void* handler_args, esp_event_base_t base, int32_t event_id, void* event_data) {
    ToolBridge* self = static_cast<ToolBridge*>(handler_args);
    esp_websocket_event_data_t* data = static_cast<esp_websocket_event_data_t*>(event_data);

    switch (event_id) {
        case WEBSOCKET_EVENT_CONNECTED:
            ESP_LOGI(TAG, "Connected to tool broker");
            self->incoming_.clear();
            self->dropping_ = false;
            self->enqueue(new WorkItem{WorkItem::Kind::CONNECTED, ""});
            break;

        case WEBSOCKET_EVENT_DISCONNECTED:
            ESP_LOGW(TAG, "Tool broker connection lost, reconnecting in %d s", self->config_.reconnect_timeout_ms / 1000);
            break;

        case WEBSOCKET_EVENT_DATA:
            self->handleData(data);
            break;

        case WEBSOCKET_EVENT_ERROR:
            ESP_LOGE(TAG, "Tool broker connection error");
            break;

        default:
            break;
    }
}

void ToolBridge::handleData(const esp_websocket_event_data_t* data) {
    // 0x1 text, 0x0 continuation; control frames are handled by the client
    if (data->op_code != 0x1 && data->op_code != 0x0) {
        return;
    }

    if (data->payload_offset == 0 && data->op_code == 0x1) {
        incoming_.clear();
        dropping_ = data->payload_len > (int)config_.max_message_size;
        if (dropping_) {
            ESP_LOGW(TAG, "Broker message of %d bytes exceeds limit, dropping", data->payload_len);
        }
    }
    if (dropping_) {
        return;
    }

    incoming_.append(data->data_ptr, data->data_len);
    if (data->payload_offset + data->data_len < data->payload_len || !data->fin) {
        return;
    }

    enqueue(new WorkItem{WorkItem::Kind::MESSAGE, std::move(incoming_)});
    incoming_.clear();
}

void ToolBridge::workerLoop() {
    WorkItem* item = nullptr;
    while (true) {
        if (xQueueReceive(queue_, &item, portMAX_DELAY) != pdTRUE) {
            continue;
        }

        if (item->kind == WorkItem::Kind::STOP) {
            delete item;
            break;
        }

        if (item->kind == WorkItem::Kind::CONNECTED) {
            server_.reset();
        } else {
            std::string reply;
            if (server_.handle(item->text, reply)) {
                if (!client_ || !esp_websocket_client_is_connected(client_)) {
                    ESP_LOGW(TAG, "Reply dropped, broker not connected");
                } else if (esp_websocket_client_send_text(client_, reply.c_str(), (int)reply.size(),
                                                          pdMS_TO_TICKS(config_.send_timeout_ms)) < 0) {
                    ESP_LOGE(TAG, "Failed to send reply to broker");
                }
            }
        }
        delete item;
    }

    xEventGroupSetBits(event_group_, WORKER_DONE_BIT);
}
