#include "gateway.hpp"
#include "esp_log.h"
#include "esp_timer.h"
#include "freertos/task.h"
#include "esp_vfs_fat.h"
#include "esp_system.h"
#include <cstdio>
#include <functional>
#include <utility>

static const char *TAG = "WatcherGateway";

static const char* STORAGE_PARTITION = "storage";
static const uint32_t WIFI_TIMEOUT_MS = 30000;
static const uint32_t WIFI_RETRY_MIN_S = 5;
static const uint32_t WIFI_RETRY_MAX_S = 300;
static const uint32_t BUS_TIMEOUT_MS = 10000;
static const uint32_t DISPATCHER_STOP_TIMEOUT_MS = 2000;
static const uint32_t VISION_STOP_TIMEOUT_MS = 500;
static const uint32_t HEALTH_INTERVAL_S = 300;

WatcherGateway::WatcherGateway()
    : current_state_(SystemState::INITIALIZING)
    , wl_handle_(WL_INVALID_HANDLE)
    , health_timer_(nullptr)
    , bus_registered_(false)
{
}

WatcherGateway::~WatcherGateway() {
    stop();
}

const char* WatcherGateway::stateName(SystemState state) {
    switch (state) {
        case SystemState::INITIALIZING: return "INITIALIZING";
        case SystemState::CONNECTING_WIFI: return "CONNECTING_WIFI";
        case SystemState::CONNECTING_BUS: return "CONNECTING_BUS";
        case SystemState::RUNNING: return "RUNNING";
        case SystemState::STOPPING: return "STOPPING";
        case SystemState::STOPPED: return "STOPPED";
        case SystemState::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

esp_err_t WatcherGateway::initialize() {
    ESP_LOGI(TAG, "Initializing gateway");
    setState(SystemState::INITIALIZING);

    esp_err_t ret = mountStorage();
    if (ret != ESP_OK) {
        // Snapshots, options and firmware are unavailable, the bridge still works
        ESP_LOGW(TAG, "Continuing without data partition");
    }

    flash_storage_ = std::make_unique<FlashStorage>();
    ESP_ERROR_CHECK(flash_storage_->initialize());

    loadConfiguration();

    ret = initializeComponents();
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to initialize components: %s", esp_err_to_name(ret));
        setState(SystemState::ERROR);
        return ret;
    }

    ESP_LOGI(TAG, "Gateway initialized");
    return ESP_OK;
}

esp_err_t WatcherGateway::mountStorage() {
    esp_vfs_fat_mount_config_t mount_config = {};
    mount_config.format_if_mount_failed = true;
    mount_config.max_files = 8;
    mount_config.allocation_unit_size = CONFIG_WL_SECTOR_SIZE;

    esp_err_t ret = esp_vfs_fat_spiflash_mount_rw_wl(config_.data_dir.c_str(), STORAGE_PARTITION,
                                                     &mount_config, &wl_handle_);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to mount %s on %s: %s", STORAGE_PARTITION, config_.data_dir.c_str(),
                 esp_err_to_name(ret));
        wl_handle_ = WL_INVALID_HANDLE;
        return ret;
    }

    ESP_LOGI(TAG, "Data partition mounted on %s", config_.data_dir.c_str());
    return ESP_OK;
}

void WatcherGateway::loadConfiguration() {
    std::string options_path = config_.data_dir + "/options.json";
    esp_err_t ret = config_.loadOptionsFile(options_path);
    if (ret == ESP_ERR_NOT_FOUND) {
        ESP_LOGW(TAG, "No options file at %s, using defaults", options_path.c_str());
    } else if (ret != ESP_OK) {
        ESP_LOGW(TAG, "Options file %s rejected (%s), using defaults", options_path.c_str(), esp_err_to_name(ret));
    }

    int overrides = flash_storage_->loadGatewayOverrides(config_);
    if (overrides > 0) {
        ESP_LOGI(TAG, "Applied %d stored settings", overrides);
    }

    esp_log_level_set("*", config_.logLevel());
    ESP_LOGI(TAG, "Configuration: %s", config_.summary().c_str());
}

esp_err_t WatcherGateway::initializeComponents() {
    task_manager_ = std::make_unique<TaskManager>();

    dispatcher_ = std::make_unique<Dispatcher>();
    Dispatcher::DispatcherConfig dispatcher_config;
    esp_err_t ret = dispatcher_->start(*task_manager_, dispatcher_config);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to start dispatcher");
        return ret;
    }

    // Vision calls block for up to a minute, they never run on gw_main
    vision_worker_ = std::make_unique<Dispatcher>();
    Dispatcher::DispatcherConfig worker_config;
    worker_config.task_name = "gw_vision";
    worker_config.queue_length = 4;
    worker_config.priority = 4;
    ret = vision_worker_->start(*task_manager_, worker_config);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to start vision worker");
        return ret;
    }

    // Network link
    network_link_ = std::make_unique<NetworkLink>();
    ESP_ERROR_CHECK(network_link_->initialize());
    network_link_->setStateCallback(
        std::bind(&WatcherGateway::onLinkStateChanged, this,
                 std::placeholders::_1, std::placeholders::_2)
    );

    // Bus
    catalog_ = std::make_unique<EntityCatalog>(config_.node_id, config_.discovery_prefix);
    mqtt_client_ = std::make_unique<MQTTClient>();
    mqtt_client_->setStateCallback(
        std::bind(&WatcherGateway::onBusStateChanged, this,
                 std::placeholders::_1, std::placeholders::_2)
    );
    bus_adapter_ = std::make_unique<BusAdapter>(*mqtt_client_, *catalog_);
    bus_adapter_->subscribeCommands(
        std::bind(&WatcherGateway::onBusCommand, this,
                 std::placeholders::_1, std::placeholders::_2, std::placeholders::_3)
    );

    // Perception
    SnapshotStore::RetentionConfig retention;
    retention.directory = config_.snapshot_dir;
    snapshot_store_ = std::make_unique<SnapshotStore>(retention);
    frame_decoder_ = std::make_unique<JpegFrameDecoder>();
    http_transport_ = std::make_unique<EspHttpTransport>();
    if (!config_.vision_url.empty()) {
        vision_ = std::make_unique<OllamaVision>(*http_transport_, config_.vision_url, config_.vision_model);
    } else {
        ESP_LOGW(TAG, "No vision backend configured, scene analysis disabled");
    }

    PerceptionPipeline::PerceptionConfig perception_config;
    perception_config.motion_threshold = config_.motion_threshold;
    perception_config.noise_threshold = config_.noise_threshold;
    perception_ = std::make_unique<PerceptionPipeline>(
        perception_config, frame_decoder_.get(), vision_.get(), snapshot_store_.get(),
        []() { return esp_timer_get_time(); }
    );

    // Device side
    ws_server_ = std::make_unique<DeviceWsServer>();
    DeviceSessionManager::SessionTiming timing;
    session_manager_ = std::make_unique<DeviceSessionManager>(
        *dispatcher_, *vision_worker_, *ws_server_, *bus_adapter_, *perception_, config_, nullptr, timing
    );
    session_manager_->setConnectionCallback(
        std::bind(&WatcherGateway::onDeviceConnection, this, std::placeholders::_1)
    );
    display_ = std::make_unique<DisplayController>(*session_manager_);
    command_router_ = std::make_unique<CommandRouter>(*bus_adapter_, *display_, *perception_, config_,
                                                      *session_manager_);
    reconnect_ = std::make_unique<ReconnectController>(
        *bus_adapter_, std::bind(&DeviceSessionManager::flushOutbox, session_manager_.get())
    );

    // Tool broker
    ha_tools_ = std::make_unique<HaTools>(*http_transport_, config_.ha_api_url, config_.ha_token);
    mcp_server_ = std::make_unique<McpServer>(*ha_tools_);
    tool_bridge_ = std::make_unique<ToolBridge>(*mcp_server_);

    handshake_server_ = std::make_unique<HandshakeServer>();
    handshake_server_->setIngestCallback(
        std::bind(&WatcherGateway::onImageIngested, this, std::placeholders::_1)
    );
    handshake_server_->setCheckinCallback(
        std::bind(&WatcherGateway::onDeviceCheckin, this, std::placeholders::_1)
    );

    health_timer_ = xTimerCreate(
        "health_timer",
        pdMS_TO_TICKS(HEALTH_INTERVAL_S * 1000),
        pdTRUE,
        this,
        healthTimerCallback
    );
    if (!health_timer_) {
        ESP_LOGE(TAG, "Failed to create health timer");
        return ESP_FAIL;
    }

    ESP_LOGI(TAG, "All components initialized successfully");
    return ESP_OK;
}

esp_err_t WatcherGateway::start() {
    ESP_LOGI(TAG, "Starting gateway");

    esp_err_t ret = connectToWiFi();
    if (ret != ESP_OK) {
        setState(SystemState::ERROR);
        return ret;
    }

    ret = connectToBus();
    if (ret != ESP_OK) {
        setState(SystemState::ERROR);
        return ret;
    }

    ret = startServers();
    if (ret != ESP_OK) {
        setState(SystemState::ERROR);
        return ret;
    }

    // The bridge is optional and retries on its own
    startToolBridge();

    session_manager_->startMonitoringTicks();
    xTimerStart(health_timer_, 0);

    setState(SystemState::RUNNING);
    return ESP_OK;
}

esp_err_t WatcherGateway::connectToWiFi() {
    setState(SystemState::CONNECTING_WIFI);

    if (config_.wifi_ssid.empty()) {
        ESP_LOGE(TAG, "No Wi-Fi credentials configured");
        return ESP_ERR_INVALID_STATE;
    }

    esp_err_t ret = network_link_->connect(config_.wifi_ssid, config_.wifi_password);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to start Wi-Fi: %s", esp_err_to_name(ret));
        return ret;
    }

    // An access point that is down at boot is waited for, not treated as fatal
    Backoff backoff(WIFI_RETRY_MIN_S, WIFI_RETRY_MAX_S);
    while (network_link_->waitForIp(WIFI_TIMEOUT_MS) != ESP_OK) {
        uint32_t wait_s = backoff.next();
        ESP_LOGW(TAG, "No address from %s yet, retrying in %us", config_.wifi_ssid.c_str(), (unsigned)wait_s);
        vTaskDelay(pdMS_TO_TICKS(wait_s * 1000));
        ret = network_link_->reconnect();
        if (ret != ESP_OK) {
            ESP_LOGW(TAG, "Wi-Fi redial failed: %s", esp_err_to_name(ret));
        }
    }

    config_.host_ip = network_link_->getHostIp();
    ESP_LOGI(TAG, "Host address %s", config_.host_ip.c_str());
    return ESP_OK;
}

esp_err_t WatcherGateway::connectToBus() {
    setState(SystemState::CONNECTING_BUS);

    MQTTClient::MQTTConfig mqtt_config;
    mqtt_config.broker_uri = config_.brokerUri();
    mqtt_config.username = config_.mqtt_user;
    mqtt_config.password = config_.mqtt_password;
    mqtt_config.will_topic = catalog_->stateTopic("binary_sensor", "connected");

    esp_err_t ret = mqtt_client_->initialize(mqtt_config);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to initialize MQTT client: %s", esp_err_to_name(ret));
        return ret;
    }

    ret = mqtt_client_->connect();
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to start MQTT client: %s", esp_err_to_name(ret));
        return ret;
    }

    // esp-mqtt keeps retrying in the background; discovery goes out on CONNECTED
    if (mqtt_client_->waitConnected(BUS_TIMEOUT_MS) != ESP_OK) {
        ESP_LOGW(TAG, "Broker %s not reachable yet", mqtt_config.broker_uri.c_str());
    }
    return ESP_OK;
}

esp_err_t WatcherGateway::startServers() {
    DeviceWsServer::ServerConfig ws_config;
    ws_config.port = config_.websocket_port;

    DeviceWsServer::Callbacks callbacks;
    DeviceSessionManager* session = session_manager_.get();
    callbacks.on_connected = [this, session](int fd) {
        postToMain([session, fd]() { session->onConnected(fd); }, "connect", true);
    };
    callbacks.on_text = [this, session](int fd, std::string text) {
        postToMain([session, fd, text]() { session->onTextFrame(fd, text); }, "text frame");
    };
    callbacks.on_binary = [this, session](int fd, size_t length) {
        postToMain([session, fd, length]() { session->onBinaryFrame(fd, length); }, "binary frame");
    };
    callbacks.on_closed = [this, session](int fd) {
        postToMain([session, fd]() { session->onClosed(fd); }, "close", true);
    };

    esp_err_t ret = ws_server_->start(ws_config, callbacks);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to start WebSocket server: %s", esp_err_to_name(ret));
        return ret;
    }

    HandshakeServer::ServerConfig http_config;
    http_config.port = config_.http_port;
    http_config.websocket_port = config_.websocket_port;
    http_config.firmware_path = config_.firmware_path;

    ret = handshake_server_->start(http_config);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to start HTTP server: %s", esp_err_to_name(ret));
        return ret;
    }

    ESP_LOGI(TAG, "Device endpoints: ws://%s:%u/ws, http://%s:%u", config_.host_ip.c_str(),
             (unsigned)config_.websocket_port, config_.host_ip.c_str(), (unsigned)config_.http_port);
    return ESP_OK;
}

esp_err_t WatcherGateway::startToolBridge() {
    if (config_.sensecraft_mcp_url.empty()) {
        ESP_LOGI(TAG, "No tool broker configured");
        return ESP_OK;
    }

    ToolBridge::BridgeConfig bridge_config;
    bridge_config.url = config_.sensecraft_mcp_url;
    esp_err_t ret = tool_bridge_->start(bridge_config, *task_manager_);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to start tool bridge: %s", esp_err_to_name(ret));
    }
    return ret;
}

esp_err_t WatcherGateway::stop() {
    if (current_state_ == SystemState::STOPPED || current_state_ == SystemState::STOPPING) {
        return ESP_OK;
    }
    ESP_LOGI(TAG, "Stopping gateway");
    setState(SystemState::STOPPING);
    esp_err_t result = ESP_OK;

    if (health_timer_) {
        xTimerStop(health_timer_, 0);
        xTimerDelete(health_timer_, 0);
        health_timer_ = nullptr;
    }

    if (tool_bridge_ && tool_bridge_->isRunning()) {
        esp_err_t ret = tool_bridge_->stop();
        if (ret != ESP_OK) {
            ESP_LOGE(TAG, "Tool bridge stop failed: %s", esp_err_to_name(ret));
            result = ret;
        }
    }

    // Session state belongs to the main context; the dispatcher drains the shutdown before it ends
    if (session_manager_ && dispatcher_ && dispatcher_->isRunning()) {
        DeviceSessionManager* session = session_manager_.get();
        postToMain([session]() { session->shutdown(); }, "session shutdown");
    }

    if (dispatcher_ && dispatcher_->isRunning()) {
        esp_err_t ret = dispatcher_->stop(DISPATCHER_STOP_TIMEOUT_MS);
        if (ret != ESP_OK) {
            ESP_LOGE(TAG, "Dispatcher stop failed: %s", esp_err_to_name(ret));
            result = ret;
        }
    }

    // An analysis still in flight finds gw_main gone and discards its result
    if (vision_worker_ && vision_worker_->isRunning()) {
        esp_err_t ret = vision_worker_->stop(VISION_STOP_TIMEOUT_MS);
        if (ret != ESP_OK) {
            ESP_LOGE(TAG, "Vision worker stop failed: %s", esp_err_to_name(ret));
            result = ret;
        }
    }

    if (ws_server_ && ws_server_->isRunning()) {
        esp_err_t ret = ws_server_->stop();
        if (ret != ESP_OK) {
            ESP_LOGE(TAG, "WebSocket server stop failed: %s", esp_err_to_name(ret));
            result = ret;
        }
    }

    if (handshake_server_ && handshake_server_->isRunning()) {
        esp_err_t ret = handshake_server_->stop();
        if (ret != ESP_OK) {
            ESP_LOGE(TAG, "HTTP server stop failed: %s", esp_err_to_name(ret));
            result = ret;
        }
    }

    if (bus_adapter_ && mqtt_client_ && mqtt_client_->isConnected()) {
        bus_adapter_->publishStateOnOff("binary_sensor/connected", false);
    }

    if (mqtt_client_) {
        esp_err_t ret = mqtt_client_->disconnect();
        if (ret != ESP_OK) {
            ESP_LOGE(TAG, "MQTT disconnect failed: %s", esp_err_to_name(ret));
            result = ret;
        }
    }

    if (network_link_) {
        esp_err_t ret = network_link_->disconnect();
        if (ret != ESP_OK) {
            ESP_LOGE(TAG, "Wi-Fi disconnect failed: %s", esp_err_to_name(ret));
            result = ret;
        }
    }

    if (wl_handle_ != WL_INVALID_HANDLE) {
        esp_err_t ret = esp_vfs_fat_spiflash_unmount_rw_wl(config_.data_dir.c_str(), wl_handle_);
        if (ret != ESP_OK) {
            ESP_LOGE(TAG, "Unmount failed: %s", esp_err_to_name(ret));
            result = ret;
        }
        wl_handle_ = WL_INVALID_HANDLE;
    }

    setState(SystemState::STOPPED);
    return result;
}

void WatcherGateway::onLinkStateChanged(NetworkLink::LinkState state, const std::string& ip) {
    switch (state) {
        case NetworkLink::LinkState::CONNECTED:
            ESP_LOGI(TAG, "Wi-Fi up, address %s", ip.c_str());
            if (!ip.empty() && ip != config_.host_ip && current_state_ == SystemState::RUNNING) {
                // The device is told this address on its next check-in
                std::string address = ip;
                postToMain([this, address]() { config_.host_ip = address; }, "address change");
            }
            break;

        case NetworkLink::LinkState::CONNECTING:
            ESP_LOGW(TAG, "Wi-Fi down, reconnecting");
            break;

        case NetworkLink::LinkState::FAILED:
            ESP_LOGE(TAG, "Wi-Fi failed");
            break;

        default:
            break;
    }
}

void WatcherGateway::onBusStateChanged(MQTTClient::ConnectionState state, const std::string& message) {
    ESP_LOGI(TAG, "MQTT state: %s - %s", MQTTClient::stateName(state), message.c_str());

    if (state != MQTTClient::ConnectionState::CONNECTED) {
        return;
    }

    // Discovery is retained but the broker may have been restarted empty
    postToMain([this]() {
        if (bus_adapter_->registerEntities() != ESP_OK) {
            ESP_LOGW(TAG, "Discovery incomplete");
        }
        if (!bus_registered_) {
            bus_adapter_->publishInitialStates(command_router_->currentStates());
            bus_registered_ = true;
        }
        bus_adapter_->publishStateOnOff("binary_sensor/connected", session_manager_->isActive());
    }, "discovery");
}

void WatcherGateway::onBusCommand(const std::string& component, const std::string& object_id,
                                  const std::string& payload) {
    postToMain([this, component, object_id, payload]() {
        handleCommand(component, object_id, payload);
    }, "bus command");
}

void WatcherGateway::handleCommand(const std::string& component, const std::string& object_id,
                                   const std::string& payload) {
    if (command_router_->route(component, object_id, payload) != ESP_OK) {
        return;
    }

    if (object_id == "custom_prompt" || object_id == "monitoring_interval" ||
        object_id == "confidence_threshold" || object_id == "voice_assistant") {
        if (!flash_storage_->saveRuntimeSettings(config_)) {
            ESP_LOGW(TAG, "Runtime settings not persisted");
        }
    }
}

void WatcherGateway::onDeviceConnection(bool connected) {
    if (connected) {
        reconnect_->onConnected();
        return;
    }
    uint32_t delay_s = reconnect_->onDisconnected();
    ESP_LOGI(TAG, "Waiting for device to redial, expected within %us", (unsigned)delay_s);
}

std::string WatcherGateway::onImageIngested(const MultipartForm& form) {
    ESP_LOGI(TAG, "Photo ingested: %u bytes", (unsigned)form.image.size());

    bus_adapter_->publishImage(form.image);

    std::string photo_path = config_.data_dir + "/last_photo.jpg";
    FILE* file = fopen(photo_path.c_str(), "wb");
    if (file) {
        if (fwrite(form.image.data(), 1, form.image.size(), file) != form.image.size()) {
            ESP_LOGW(TAG, "Short write to %s", photo_path.c_str());
        }
        fclose(file);
    } else {
        ESP_LOGW(TAG, "Cannot write %s", photo_path.c_str());
    }

    std::string description = "Photo captured (" + std::to_string(form.image.size()) + " bytes)";
    if (vision_) {
        VisionResult result;
        esp_err_t ret = vision_->analyze(form.image, form.question, result);
        if (ret == ESP_OK && !result.description.empty()) {
            description = result.description;
        } else if (ret != ESP_OK) {
            ESP_LOGW(TAG, "Vision analysis failed: %s", esp_err_to_name(ret));
        }
    }

    bus_adapter_->publishState("sensor/last_event", BusAdapter::truncate(description, BusAdapter::MAX_STATE_CHARS));
    return description;
}

void WatcherGateway::onDeviceCheckin(const CheckinInfo& info) {
    ESP_LOGI(TAG, "Device check-in: mac=%s version=%s ip=%s", info.mac.c_str(), info.version.c_str(),
             info.device_ip.c_str());
}

void WatcherGateway::healthTimerCallback(TimerHandle_t timer) {
    WatcherGateway* gateway = static_cast<WatcherGateway*>(pvTimerGetTimerID(timer));
    if (gateway) {
        gateway->postToMain(std::bind(&WatcherGateway::reportHealth, gateway), "health report");
    }
}

void WatcherGateway::reportHealth() {
    ESP_LOGI(TAG, "Health: session=%s outbox=%u frames=%u bus=%s bridge=%s",
             session_manager_->hasSession() ? DeviceSessionManager::stateName(session_manager_->getState()) : "none",
             (unsigned)session_manager_->outbox().size(), (unsigned)session_manager_->binaryFrameCount(),
             MQTTClient::stateName(mqtt_client_->getState()),
             tool_bridge_->isConnected() ? "connected" : "down");

    ESP_LOGI(TAG, "Tasks running: %u, delayed jobs: %u",
             (unsigned)task_manager_->runningTaskCount(), (unsigned)dispatcher_->pendingTimers());
    task_manager_->checkStackWatermarks();
    ESP_LOGI(TAG, "Free heap: %u bytes, minimum free heap: %u bytes", (unsigned)esp_get_free_heap_size(),
             (unsigned)esp_get_minimum_free_heap_size());

    size_t removed = snapshot_store_->cleanup();
    if (removed > 0) {
        ESP_LOGI(TAG, "Removed %u old snapshots", (unsigned)removed);
    }
}

void WatcherGateway::postToMain(Scheduler::Job job, const char* what, bool wait) {
    if (!dispatcher_) {
        return;
    }
    esp_err_t ret = wait ? dispatcher_->postWait(std::move(job)) : dispatcher_->post(std::move(job));
    if (ret != ESP_OK) {
        ESP_LOGW(TAG, "Dropped %s: %s", what, esp_err_to_name(ret));
    }
}

void WatcherGateway::setState(SystemState state) {
    if (current_state_ != state) {
        ESP_LOGI(TAG, "State change: %s -> %s", stateName(current_state_), stateName(state));
        current_state_ = state;
    }
}
