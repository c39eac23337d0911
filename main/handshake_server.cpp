#include "handshake_server.hpp"
#include "esp_log.h"
#include <sys/time.h>
#include <cstdio>
#include <vector>

static const char *TAG = "HandshakeServer";

HandshakeServer::HandshakeServer()
    : server_(nullptr)
{
}

HandshakeServer::~HandshakeServer() {
    stop();
}

void HandshakeServer::setIngestCallback(IngestCallback callback) {
    ingest_callback_ = callback;
}

void HandshakeServer::setCheckinCallback(CheckinCallback callback) {
    checkin_callback_ = callback;
}

esp_err_t HandshakeServer::start(const ServerConfig& config) {
    if (server_) {
        return ESP_ERR_INVALID_STATE;
    }

    config_ = config;
    ESP_LOGI(TAG, "Starting HTTP server on port %u", (unsigned)config_.port);

    httpd_config_t httpd_config = HTTPD_DEFAULT_CONFIG();
    httpd_config.server_port = config_.port;
    httpd_config.ctrl_port = config_.ctrl_port;
    httpd_config.max_uri_handlers = 10;
    httpd_config.max_resp_headers = 8;
    httpd_config.stack_size = config_.stack_size;
    httpd_config.lru_purge_enable = true;

    esp_err_t ret = httpd_start(&server_, &httpd_config);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Error starting HTTP server: %s", esp_err_to_name(ret));
        server_ = nullptr;
        return ret;
    }

    struct Route {
        const char* uri;
        httpd_method_t method;
        esp_err_t (*handler)(httpd_req_t*);
    };
    const Route routes[] = {
        {"/version",        HTTP_GET,  &HandshakeServer::versionHandler},
        {"/ota/version",    HTTP_GET,  &HandshakeServer::versionHandler},
        {"/firmware",       HTTP_GET,  &HandshakeServer::firmwareHandler},
        {"/ota/firmware",   HTTP_GET,  &HandshakeServer::firmwareHandler},
        {"/checkin",        HTTP_POST, &HandshakeServer::checkinHandler},
        {"/ota/",           HTTP_POST, &HandshakeServer::checkinHandler},
        {"/ota",            HTTP_POST, &HandshakeServer::checkinHandler},
        {"/vision-ingest",  HTTP_POST, &HandshakeServer::ingestHandler},
        {"/vision/explain", HTTP_POST, &HandshakeServer::ingestHandler},
    };
    for (const auto& route : routes) {
        ret = registerHandler(route.uri, route.method, route.handler);
        if (ret != ESP_OK) {
            httpd_stop(server_);
            server_ = nullptr;
            return ret;
        }
    }

    ESP_LOGI(TAG, "HTTP server started successfully");
    return ESP_OK;
}

esp_err_t HandshakeServer::stop() {
    if (server_) {
        ESP_LOGI(TAG, "Stopping HTTP server");
        esp_err_t ret = httpd_stop(server_);
        server_ = nullptr;
        return ret;
    }
    return ESP_OK;
}

esp_err_t HandshakeServer::registerHandler(const char* uri, httpd_method_t method,
                                           esp_err_t (*handler)(httpd_req_t*)) {
    httpd_uri_t descriptor = {};
    descriptor.uri = uri;
    descriptor.method = method;
    descriptor.handler = handler;
    descriptor.user_ctx = this;

    esp_err_t ret = httpd_register_uri_handler(server_, &descriptor);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to register %s: %s", uri, esp_err_to_name(ret));
    }
    return ret;
}

esp_err_t HandshakeServer::readBody(httpd_req_t *req, std::string& body) {
    if (req->content_len > config_.max_body_size) {
        ESP_LOGW(TAG, "Body of %zu bytes exceeds limit", req->content_len);
        return ESP_ERR_INVALID_SIZE;
    }

    body.resize(req->content_len);
    size_t received = 0;
    while (received < req->content_len) {
        int ret = httpd_req_recv(req, &body[received], req->content_len - received);
        if (ret == HTTPD_SOCK_ERR_TIMEOUT) {
            continue;
        }
        if (ret <= 0) {
            ESP_LOGE(TAG, "Failed to receive body (%d)", ret);
            return ESP_FAIL;
        }
        received += ret;
    }
    return ESP_OK;
}

std::string HandshakeServer::requestHeader(httpd_req_t *req, const char* name) {
    size_t length = httpd_req_get_hdr_value_len(req, name);
    if (length == 0) {
        return "";
    }
    std::vector<char> value(length + 1);
    if (httpd_req_get_hdr_value_str(req, name, value.data(), value.size()) != ESP_OK) {
        return "";
    }
    return std::string(value.data());
}

esp_err_t HandshakeServer::sendJson(httpd_req_t *req, const char* status, const std::string& json) {
    httpd_resp_set_status(req, status);
    httpd_resp_set_type(req, "application/json");
    return httpd_resp_send(req, json.c_str(), json.size());
}

esp_err_t HandshakeServer::versionHandler(httpd_req_t *req) {
    ESP_LOGD(TAG, "Version request: %s", req->uri);
    return sendJson(req, "200 OK", HandshakeLogic::versionJson());
}

esp_err_t HandshakeServer::firmwareHandler(httpd_req_t *req) {
    HandshakeServer* self = static_cast<HandshakeServer*>(req->user_ctx);

    FILE* file = fopen(self->config_.firmware_path.c_str(), "rb");
    if (!file) {
        ESP_LOGW(TAG, "Firmware not found at %s", self->config_.firmware_path.c_str());
        httpd_resp_set_status(req, "404 Not Found");
        httpd_resp_set_type(req, "text/plain");
        return httpd_resp_sendstr(req, "Firmware not found");
    }

    httpd_resp_set_type(req, "application/octet-stream");
    std::vector<char> chunk(4096);
    esp_err_t ret = ESP_OK;
    size_t read = 0;
    while ((read = fread(chunk.data(), 1, chunk.size(), file)) > 0) {
        ret = httpd_resp_send_chunk(req, chunk.data(), read);
        if (ret != ESP_OK) {
            ESP_LOGE(TAG, "Firmware transfer aborted: %s", esp_err_to_name(ret));
            break;
        }
    }
    fclose(file);

    if (ret != ESP_OK) {
        return ret;
    }
    return httpd_resp_send_chunk(req, nullptr, 0);
}

esp_err_t HandshakeServer::checkinHandler(httpd_req_t *req) {
    HandshakeServer* self = static_cast<HandshakeServer*>(req->user_ctx);

    std::string body;
    esp_err_t ret = self->readBody(req, body);
    if (ret == ESP_FAIL) {
        return sendJson(req, "500 Internal Server Error", HandshakeLogic::errorJson("Failed to read request body"));
    }
    if (ret != ESP_OK) {
        // Oversized bodies are treated like any other unreadable document
        body.clear();
    }

    struct timeval now = {};
    gettimeofday(&now, nullptr);
    int64_t now_ms = (int64_t)now.tv_sec * 1000 + now.tv_usec / 1000;

    CheckinInfo info;
    std::string host = requestHeader(req, "Host");
    std::string response = HandshakeLogic::buildCheckinResponse(body, host, self->config_.websocket_port,
                                                                now_ms, info);

    ESP_LOGI(TAG, "Check-in: device=%s, version=%s, ip=%s", info.mac.c_str(), info.version.c_str(),
             info.device_ip.empty() ? "unknown" : info.device_ip.c_str());
    ESP_LOGI(TAG, "Directing device to ws://%s:%u/ws", HandshakeLogic::hostFromHeader(host).c_str(),
             (unsigned)self->config_.websocket_port);

    if (self->checkin_callback_) {
        self->checkin_callback_(info);
    }
    return sendJson(req, "200 OK", response);
}

esp_err_t HandshakeServer::ingestHandler(httpd_req_t *req) {
    HandshakeServer* self = static_cast<HandshakeServer*>(req->user_ctx);

    std::string body;
    esp_err_t ret = self->readBody(req, body);
    if (ret == ESP_ERR_INVALID_SIZE) {
        return sendJson(req, "413 Payload Too Large", HandshakeLogic::ingestReplyJson(false, "Image too large"));
    }
    if (ret != ESP_OK) {
        return sendJson(req, "500 Internal Server Error",
                        HandshakeLogic::ingestReplyJson(false, "Failed to read request body"));
    }

    MultipartForm form;
    if (!HandshakeLogic::parseMultipart(body, requestHeader(req, "Content-Type"), form) || form.image.empty()) {
        return sendJson(req, "400 Bad Request", HandshakeLogic::ingestReplyJson(false, "No image received"));
    }
    body.clear();

    ESP_LOGI(TAG, "Received camera image: %zu bytes, question: %s", form.image.size(), form.question.c_str());

    std::string description = "Photo captured (" + std::to_string(form.image.size()) + " bytes)";
    if (self->ingest_callback_) {
        description = self->ingest_callback_(form);
    }
    return sendJson(req, "200 OK", HandshakeLogic::ingestReplyJson(true, description));
}
