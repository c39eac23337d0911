#include "ollama_vision.hpp"
#include "esp_log.h"
#include "cJSON.h"
#include "mbedtls/base64.h"
#include <cstdlib>

static const char *TAG = "OllamaVision";

OllamaVision::OllamaVision(HttpTransport& transport, const std::string& base_url, const std::string& model)
    : transport_(transport)
    , base_url_(base_url)
    , model_(model)
{
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

esp_err_t OllamaVision::encodeBase64(const std::vector<uint8_t>& data, std::string& encoded) {
    size_t required = 0;
    mbedtls_base64_encode(nullptr, 0, &required, data.data(), data.size());

    encoded.assign(required, '\0');
    size_t written = 0;
    int ret = mbedtls_base64_encode((unsigned char*)&encoded[0], encoded.size(), &written, data.data(), data.size());
    if (ret != 0) {
        ESP_LOGE(TAG, "Base64 encoding failed: -0x%04x", -ret);
        return ESP_FAIL;
    }
    encoded.resize(written);
    return ESP_OK;
}

esp_err_t OllamaVision::analyze(const std::vector<uint8_t>& image, const std::string& prompt, VisionResult& result) {
    if (base_url_.empty()) {
        return ESP_ERR_INVALID_STATE;
    }
    if (image.empty()) {
        return ESP_ERR_INVALID_ARG;
    }

    std::string image_b64;
    esp_err_t ret = encodeBase64(image, image_b64);
    if (ret != ESP_OK) {
        return ret;
    }

    cJSON* payload = cJSON_CreateObject();
    cJSON_AddStringToObject(payload, "model", model_.c_str());
    cJSON_AddStringToObject(payload, "prompt", prompt.c_str());
    cJSON* images = cJSON_AddArrayToObject(payload, "images");
    cJSON_AddItemToArray(images, cJSON_CreateString(image_b64.c_str()));
    cJSON_AddBoolToObject(payload, "stream", false);
    image_b64.clear();

    HttpRequest request;
    request.method = "POST";
    request.url = base_url_ + "/api/generate";
    request.headers.push_back(std::make_pair("Content-Type", "application/json"));
    request.timeout_ms = REQUEST_TIMEOUT_MS;

    char* body = cJSON_PrintUnformatted(payload);
    cJSON_Delete(payload);
    if (!body) {
        return ESP_ERR_NO_MEM;
    }
    request.body = body;
    free(body);

    ESP_LOGI(TAG, "Analyzing %zu byte image with %s", image.size(), model_.c_str());
    HttpResponse response;
    ret = transport_.perform(request, response);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Vision request failed: %s", esp_err_to_name(ret));
        return ret;
    }
    if (response.status < 200 || response.status >= 300) {
        ESP_LOGE(TAG, "Vision request returned HTTP %d", response.status);
        return ESP_FAIL;
    }

    cJSON* root = cJSON_Parse(response.body.c_str());
    cJSON* text = cJSON_GetObjectItem(root, "response");
    result.description = cJSON_IsString(text) ? text->valuestring : "";
    cJSON_Delete(root);

    // The backend gives no score of its own
    result.confidence = result.description.empty() ? 0.0f : 1.0f;
    ESP_LOGI(TAG, "Vision result: %.120s", result.description.c_str());
    return ESP_OK;
}
