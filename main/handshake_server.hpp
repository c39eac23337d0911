#pragma once

#include <string>
#include <functional>
#include "esp_http_server.h"
#include "handshake_logic.hpp"

// Provisioning endpoints the device calls before and beside its WebSocket session:
//   GET  /version, /ota/version
//   GET  /firmware, /ota/firmware
//   POST /checkin, /ota/, /ota
//   POST /vision-ingest, /vision/explain
class HandshakeServer {
public:
    struct ServerConfig {
        uint16_t port = 8001;
        uint16_t ctrl_port = 32769;
        uint16_t websocket_port = 8000;
        std::string firmware_path = "/data/firmware.bin";
        size_t max_body_size = 512 * 1024;
        uint32_t stack_size = 10240;
    };

    // Runs on the httpd task. Returns the text for the reply message.
    using IngestCallback = std::function<std::string(const MultipartForm& form)>;
    using CheckinCallback = std::function<void(const CheckinInfo& info)>;

    HandshakeServer();
    ~HandshakeServer();

    esp_err_t start(const ServerConfig& config);
    esp_err_t stop();

    void setIngestCallback(IngestCallback callback);
    void setCheckinCallback(CheckinCallback callback);

    bool isRunning() const { return server_ != nullptr; }

private:
    static esp_err_t versionHandler(httpd_req_t *req);
    static esp_err_t firmwareHandler(httpd_req_t *req);
    static esp_err_t checkinHandler(httpd_req_t *req);
    static esp_err_t ingestHandler(httpd_req_t *req);

    esp_err_t registerHandler(const char* uri, httpd_method_t method, esp_err_t (*handler)(httpd_req_t*));
    esp_err_t readBody(httpd_req_t *req, std::string& body);
    static std::string requestHeader(httpd_req_t *req, const char* name);
    static esp_err_t sendJson(httpd_req_t *req, const char* status, const std::string& json);

    httpd_handle_t server_;
    ServerConfig config_;
    IngestCallback ingest_callback_;
    CheckinCallback checkin_callback_;
};
