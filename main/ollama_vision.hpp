#pragma once

#include <string>
#include "collaborators.hpp"
#include "http_transport.hpp"

// Vision provider backed by an Ollama server (/api/generate with a base64 image).
class OllamaVision : public VisionProvider {
public:
    OllamaVision(HttpTransport& transport, const std::string& base_url, const std::string& model);

    esp_err_t analyze(const std::vector<uint8_t>& image, const std::string& prompt, VisionResult& result) override;

    static const int REQUEST_TIMEOUT_MS = 60000;

private:
    esp_err_t encodeBase64(const std::vector<uint8_t>& data, std::string& encoded);

    HttpTransport& transport_;
    std::string base_url_;
    std::string model_;
};
