#pragma once

#include <set>
#include <string>
#include <functional>
#include "esp_http_server.h"
#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"
#include "device_link.hpp"
#include "ws_reassembler.hpp"

// WebSocket endpoint the device dials (ws://<host>:<port>/ws). Callbacks run on the
// httpd task; the owner is expected to hand them over to the main context.
class DeviceWsServer : public DeviceLink {
public:
    struct ServerConfig {
        uint16_t port = 8000;
        uint16_t ctrl_port = 32768;
        size_t max_frame_size = 1024 * 1024;   // hex encoded images are large
        uint32_t stack_size = 8192;
    };

    struct Callbacks {
        std::function<void(int fd)> on_connected;
        std::function<void(int fd, std::string text)> on_text;
        std::function<void(int fd, size_t length)> on_binary;
        std::function<void(int fd)> on_closed;
    };

    DeviceWsServer();
    ~DeviceWsServer();

    esp_err_t start(const ServerConfig& config, const Callbacks& callbacks);
    esp_err_t stop();

    // DeviceLink
    esp_err_t sendText(int fd, const std::string& text) override;
    void closeLink(int fd) override;

    bool isRunning() const { return server_ != nullptr; }

private:
    static esp_err_t wsHandler(httpd_req_t *req);
    static void closeHandler(httpd_handle_t handle, int sockfd);

    esp_err_t handleFrame(httpd_req_t *req, int fd);

    httpd_handle_t server_;
    ServerConfig config_;
    Callbacks callbacks_;
    SemaphoreHandle_t mutex_;
    std::set<int> sockets_;
    // httpd task only
    WsReassembler reassembler_;
};
