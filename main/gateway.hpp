#pragma once

#include <memory>
#include <string>
#include "esp_err.h"
#include "freertos/FreeRTOS.h"
#include "freertos/timers.h"
#include "wear_levelling.h"
#include "gateway_config.hpp"
#include "task_manager.hpp"
#include "dispatcher.hpp"
#include "flash_storage.hpp"
#include "network_link.hpp"
#include "mqtt_client.hpp"
#include "entity_catalog.hpp"
#include "bus_adapter.hpp"
#include "snapshot_store.hpp"
#include "frame_decoder.hpp"
#include "esp_http_transport.hpp"
#include "ollama_vision.hpp"
#include "perception_pipeline.hpp"
#include "device_ws_server.hpp"
#include "device_session.hpp"
#include "display_controller.hpp"
#include "command_router.hpp"
#include "reconnect_controller.hpp"
#include "ha_tools.hpp"
#include "mcp_server.hpp"
#include "tool_bridge.hpp"
#include "handshake_server.hpp"

class WatcherGateway {
public:
    enum class SystemState {
        INITIALIZING,
        CONNECTING_WIFI,
        CONNECTING_BUS,
        RUNNING,
        STOPPING,
        STOPPED,
        ERROR
    };

    WatcherGateway();
    ~WatcherGateway();

    esp_err_t initialize();
    esp_err_t start();
    // Every step is attempted even when an earlier one fails.
    esp_err_t stop();

    SystemState getState() const { return current_state_; }

    static const char* stateName(SystemState state);

private:
    esp_err_t mountStorage();
    void loadConfiguration();
    esp_err_t initializeComponents();

    esp_err_t connectToWiFi();
    esp_err_t connectToBus();
    esp_err_t startServers();
    esp_err_t startToolBridge();

    // Other tasks
    void onLinkStateChanged(NetworkLink::LinkState state, const std::string& ip);
    void onBusStateChanged(MQTTClient::ConnectionState state, const std::string& message);
    void onBusCommand(const std::string& component, const std::string& object_id, const std::string& payload);
    std::string onImageIngested(const MultipartForm& form);
    void onDeviceCheckin(const CheckinInfo& info);

    // Main context
    void handleCommand(const std::string& component, const std::string& object_id, const std::string& payload);
    void onDeviceConnection(bool connected);

    static void healthTimerCallback(TimerHandle_t timer);
    void reportHealth();

    // Hands work from other tasks to the main context. Drops are logged; with wait set
    // the caller blocks for room instead of dropping.
    void postToMain(Scheduler::Job job, const char* what, bool wait = false);
    void setState(SystemState state);

    GatewayConfig config_;
    SystemState current_state_;
    wl_handle_t wl_handle_;
    TimerHandle_t health_timer_;
    bool bus_registered_;

    std::unique_ptr<TaskManager> task_manager_;
    std::unique_ptr<Dispatcher> dispatcher_;
    std::unique_ptr<Dispatcher> vision_worker_;
    std::unique_ptr<FlashStorage> flash_storage_;
    std::unique_ptr<NetworkLink> network_link_;
    std::unique_ptr<MQTTClient> mqtt_client_;
    std::unique_ptr<EntityCatalog> catalog_;
    std::unique_ptr<BusAdapter> bus_adapter_;
    std::unique_ptr<SnapshotStore> snapshot_store_;
    std::unique_ptr<JpegFrameDecoder> frame_decoder_;
    std::unique_ptr<EspHttpTransport> http_transport_;
    std::unique_ptr<OllamaVision> vision_;
    std::unique_ptr<PerceptionPipeline> perception_;
    std::unique_ptr<DeviceWsServer> ws_server_;
    std::unique_ptr<DeviceSessionManager> session_manager_;
    std::unique_ptr<DisplayController> display_;
    std::unique_ptr<CommandRouter> command_router_;
    std::unique_ptr<ReconnectController> reconnect_;
    std::unique_ptr<HaTools> ha_tools_;
    std::unique_ptr<McpServer> mcp_server_;
    std::unique_ptr<ToolBridge> tool_bridge_;
    std::unique_ptr<HandshakeServer> handshake_server_;
};
