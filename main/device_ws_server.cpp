#include "device_ws_server.hpp"
#include "esp_log.h"
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

static const char *TAG = "DeviceWsServer";

DeviceWsServer::DeviceWsServer()
    : server_(nullptr)
    , mutex_(xSemaphoreCreateMutex())
    , reassembler_(ServerConfig().max_frame_size)
{
}

DeviceWsServer::~DeviceWsServer() {
    stop();
    if (mutex_) {
        vSemaphoreDelete(mutex_);
    }
}

esp_err_t DeviceWsServer::start(const ServerConfig& config, const Callbacks& callbacks) {
    if (server_) {
        return ESP_ERR_INVALID_STATE;
    }
    if (!mutex_) {
        return ESP_ERR_NO_MEM;
    }

    config_ = config;
    callbacks_ = callbacks;
    reassembler_ = WsReassembler(config_.max_frame_size);

    httpd_config_t httpd_config = HTTPD_DEFAULT_CONFIG();
    httpd_config.server_port = config_.port;
    httpd_config.ctrl_port = config_.ctrl_port;
    httpd_config.max_uri_handlers = 2;
    httpd_config.max_open_sockets = 3;
    httpd_config.lru_purge_enable = true;
    httpd_config.stack_size = config_.stack_size;
    httpd_config.global_user_ctx = this;
    // Owned by us, httpd must not free() it
    httpd_config.global_user_ctx_free_fn = [](void*) {};
    httpd_config.close_fn = &DeviceWsServer::closeHandler;

    ESP_LOGI(TAG, "Starting WebSocket server on port %u", (unsigned)config_.port);
    esp_err_t ret = httpd_start(&server_, &httpd_config);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Error starting WebSocket server: %s", esp_err_to_name(ret));
        server_ = nullptr;
        return ret;
    }

    httpd_uri_t ws_uri = {};
    ws_uri.uri = "/ws";
    ws_uri.method = HTTP_GET;
    ws_uri.handler = &DeviceWsServer::wsHandler;
    ws_uri.user_ctx = this;
    ws_uri.is_websocket = true;

    ret = httpd_register_uri_handler(server_, &ws_uri);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to register /ws: %s", esp_err_to_name(ret));
        httpd_stop(server_);
        server_ = nullptr;
        return ret;
    }

    ESP_LOGI(TAG, "WebSocket server started");
    return ESP_OK;
}

esp_err_t DeviceWsServer::stop() {
    if (!server_) {
        return ESP_OK;
    }

    ESP_LOGI(TAG, "Stopping WebSocket server");
    esp_err_t ret = httpd_stop(server_);
    server_ = nullptr;
    if (xSemaphoreTake(mutex_, portMAX_DELAY) == pdTRUE) {
        sockets_.clear();
        xSemaphoreGive(mutex_);
    }
    return ret;
}

esp_err_t DeviceWsServer::sendText(int fd, const std::string& text) {
    if (!server_) {
        return ESP_ERR_INVALID_STATE;
    }
    if (httpd_ws_get_fd_info(server_, fd) != HTTPD_WS_CLIENT_WEBSOCKET) {
        return ESP_ERR_INVALID_STATE;
    }

    httpd_ws_frame_t frame = {};
    frame.final = true;
    frame.type = HTTPD_WS_TYPE_TEXT;
    frame.payload = (uint8_t*)text.data();
    frame.len = text.size();

    esp_err_t ret = httpd_ws_send_frame_async(server_, fd, &frame);
    if (ret != ESP_OK) {
        ESP_LOGW(TAG, "Send to fd=%d failed: %s", fd, esp_err_to_name(ret));
    }
    return ret;
}

void DeviceWsServer::closeLink(int fd) {
    if (!server_) {
        return;
    }
    esp_err_t ret = httpd_sess_trigger_close(server_, fd);
    if (ret != ESP_OK) {
        ESP_LOGW(TAG, "Failed to close fd=%d: %s", fd, esp_err_to_name(ret));
    }
}

esp_err_t DeviceWsServer::wsHandler(httpd_req_t *req) {
    DeviceWsServer* self = static_cast<DeviceWsServer*>(req->user_ctx);
    int fd = httpd_req_to_sockfd(req);

    if (req->method == HTTP_GET) {
        // Upgrade completed
        ESP_LOGI(TAG, "Device WebSocket opened (fd=%d)", fd);
        if (xSemaphoreTake(self->mutex_, portMAX_DELAY) == pdTRUE) {
            self->sockets_.insert(fd);
            xSemaphoreGive(self->mutex_);
        }
        self->reassembler_.reset(fd);
        if (self->callbacks_.on_connected) {
            self->callbacks_.on_connected(fd);
        }
        return ESP_OK;
    }

    return self->handleFrame(req, fd);
}

esp_err_t DeviceWsServer::handleFrame(httpd_req_t *req, int fd) {
    httpd_ws_frame_t frame = {};
    esp_err_t ret = httpd_ws_recv_frame(req, &frame, 0);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to read frame header: %s", esp_err_to_name(ret));
        return ret;
    }

    bool data_frame = frame.type == HTTPD_WS_TYPE_TEXT || frame.type == HTTPD_WS_TYPE_BINARY;
    if (frame.len > config_.max_frame_size ||
        (frame.type == HTTPD_WS_TYPE_CONTINUE && !reassembler_.fits(fd, frame.len))) {
        ESP_LOGE(TAG, "Frame of %zu bytes exceeds limit, closing fd=%d", frame.len, fd);
        reassembler_.reset(fd);
        return ESP_ERR_INVALID_SIZE;
    }

    std::vector<uint8_t> buffer(frame.len);
    if (frame.len > 0) {
        frame.payload = buffer.data();
        ret = httpd_ws_recv_frame(req, &frame, frame.len);
        if (ret != ESP_OK) {
            ESP_LOGE(TAG, "Failed to read frame payload: %s", esp_err_to_name(ret));
            return ret;
        }
    }

    if (data_frame || frame.type == HTTPD_WS_TYPE_CONTINUE) {
        WsReassembler::FrameKind kind = WsReassembler::FrameKind::CONTINUATION;
        if (frame.type == HTTPD_WS_TYPE_TEXT) {
            kind = WsReassembler::FrameKind::TEXT;
        } else if (frame.type == HTTPD_WS_TYPE_BINARY) {
            kind = WsReassembler::FrameKind::BINARY;
        }

        WsReassembler::Message message;
        WsReassembler::Result result = reassembler_.push(fd, kind, frame.final, buffer.data(), buffer.size(), message);
        if (result == WsReassembler::Result::TOO_LARGE) {
            return ESP_ERR_INVALID_SIZE;
        }
        if (result != WsReassembler::Result::COMPLETE) {
            return ESP_OK;
        }

        if (message.text) {
            if (callbacks_.on_text) {
                callbacks_.on_text(fd, std::move(message.data));
            }
        } else if (callbacks_.on_binary) {
            callbacks_.on_binary(fd, message.data.size());
        }
        return ESP_OK;
    }

    switch (frame.type) {
        case HTTPD_WS_TYPE_CLOSE:
            ESP_LOGI(TAG, "Device sent close (fd=%d)", fd);
            break;

        default:
            ESP_LOGD(TAG, "Ignoring control frame type %d", (int)frame.type);
            break;
    }
    return ESP_OK;
}

void DeviceWsServer::closeHandler(httpd_handle_t handle, int sockfd) {
    DeviceWsServer* self = static_cast<DeviceWsServer*>(httpd_get_global_user_ctx(handle));

    bool was_device = false;
    if (self && xSemaphoreTake(self->mutex_, portMAX_DELAY) == pdTRUE) {
        was_device = self->sockets_.erase(sockfd) > 0;
        xSemaphoreGive(self->mutex_);
    }

    if (self) {
        self->reassembler_.reset(sockfd);
    }

    // With a custom close_fn the socket is ours to close
    close(sockfd);

    if (was_device) {
        ESP_LOGI(TAG, "Device WebSocket closed (fd=%d)", sockfd);
        if (self->callbacks_.on_closed) {
            self->callbacks_.on_closed(sockfd);
        }
    }
}
