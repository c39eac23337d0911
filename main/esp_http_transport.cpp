#include "esp_http_transport.hpp"
#include "esp_http_client.h"
#include "esp_crt_bundle.h"
#include "esp_log.h"
#include <vector>

static const char *TAG = "HttpTransport";

static esp_http_client_method_t toMethod(const std::string& method) {
    if (method == "POST") {
        return HTTP_METHOD_POST;
    }
    if (method == "PUT") {
        return HTTP_METHOD_PUT;
    }
    if (method == "DELETE") {
        return HTTP_METHOD_DELETE;
    }
    return HTTP_METHOD_GET;
}

EspHttpTransport::EspHttpTransport()
    : config_()
{
}

EspHttpTransport::EspHttpTransport(const TransportConfig& config)
    : config_(config)
{
}

esp_err_t EspHttpTransport::perform(const HttpRequest& request, HttpResponse& response) {
    esp_http_client_config_t config = {};
    config.url = request.url.c_str();
    config.method = toMethod(request.method);
    config.timeout_ms = request.timeout_ms;
    config.buffer_size = config_.buffer_size;
    config.crt_bundle_attach = esp_crt_bundle_attach;

    esp_http_client_handle_t client = esp_http_client_init(&config);
    if (!client) {
        ESP_LOGE(TAG, "Failed to create HTTP client for %s", request.url.c_str());
        return ESP_FAIL;
    }

    for (const auto& header : request.headers) {
        esp_http_client_set_header(client, header.first.c_str(), header.second.c_str());
    }

    esp_err_t ret = esp_http_client_open(client, (int)request.body.size());
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to open %s: %s", request.url.c_str(), esp_err_to_name(ret));
        esp_http_client_cleanup(client);
        return ret;
    }

    size_t written = 0;
    while (written < request.body.size()) {
        int bytes = esp_http_client_write(client, request.body.data() + written, (int)(request.body.size() - written));
        if (bytes < 0) {
            ESP_LOGE(TAG, "HTTP write error");
            ret = ESP_FAIL;
            break;
        }
        written += bytes;
    }

    if (ret == ESP_OK) {
        int content_length = esp_http_client_fetch_headers(client);
        if (content_length < 0) {
            ESP_LOGE(TAG, "Failed to read response headers");
            ret = ESP_FAIL;
        }
    }

    if (ret == ESP_OK) {
        response.status = esp_http_client_get_status_code(client);
        response.body.clear();

        std::vector<char> buffer(1024);
        while (true) {
            int bytes = esp_http_client_read(client, buffer.data(), (int)buffer.size());
            if (bytes < 0) {
                ESP_LOGE(TAG, "HTTP read error");
                ret = ESP_FAIL;
                break;
            }
            if (bytes == 0) {
                break;
            }
            if (response.body.size() + bytes > config_.max_response_size) {
                ESP_LOGE(TAG, "Response from %s exceeds %zu bytes", request.url.c_str(), config_.max_response_size);
                ret = ESP_ERR_INVALID_SIZE;
                break;
            }
            response.body.append(buffer.data(), bytes);
        }
        ESP_LOGD(TAG, "%s %s -> %d (%zu bytes)", request.method.c_str(), request.url.c_str(), response.status,
                 response.body.size());
    }

    esp_http_client_close(client);
    esp_http_client_cleanup(client);
    return ret;
}
