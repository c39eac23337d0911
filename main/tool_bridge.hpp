#pragma once

#include <string>
#include "esp_websocket_client.h"
#include "freertos/FreeRTOS.h"
#include "freertos/queue.h"
#include "freertos/event_groups.h"
#include "esp_err.h"

class McpServer;
class TaskManager;

// Outbound persistent connection to the remote tool broker. We dial out but act as the
// JSON-RPC server. Requests are handled on a worker task so blocking tool execution
// never stalls the WebSocket client task.
class ToolBridge {
public:
    struct BridgeConfig {
        std::string url;
        int reconnect_timeout_ms = 10000;
        int ping_interval_sec = 30;
        int network_timeout_ms = 10000;
        uint32_t send_timeout_ms = 5000;
        uint32_t worker_stack_size = 8192;
        UBaseType_t worker_priority = 4;
        uint32_t queue_length = 8;
        size_t max_message_size = 64 * 1024;
    };

    explicit ToolBridge(McpServer& server);
    ~ToolBridge();

    esp_err_t start(const BridgeConfig& config, TaskManager& tasks);
    esp_err_t stop();

    bool isConnected() const;
    bool isRunning() const { return client_ != nullptr; }

private:
    struct WorkItem {
        enum class Kind {
            CONNECTED,
            MESSAGE,
            STOP
        };
        Kind kind;
        std::string text;
    };

    static void websocketEventHandler(void* handler_args, esp_event_base_t base, int32_t event_id, void* event_data);
    void handleData(const esp_websocket_event_data_t* data);
    bool enqueue(WorkItem* item);
    void workerLoop();

    McpServer& server_;
    BridgeConfig config_;
    esp_websocket_client_handle_t client_;
    QueueHandle_t queue_;
    EventGroupHandle_t event_group_;

    // Reassembly of a text message split across data events
    std::string incoming_;
    bool dropping_;

    static const int WORKER_DONE_BIT = BIT0;
};
