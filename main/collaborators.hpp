#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include "esp_err.h"

struct VisionResult {
    std::string description;
    float confidence = 0.0f;
};

class VisionProvider {
public:
    virtual ~VisionProvider() = default;

    virtual esp_err_t analyze(const std::vector<uint8_t>& image, const std::string& prompt,
                              VisionResult& result) = 0;
};

class SpeechProvider {
public:
    virtual ~SpeechProvider() = default;

    virtual esp_err_t recognize(const std::vector<uint8_t>& audio, std::string& text) = 0;
    virtual esp_err_t synthesize(const std::string& text, std::vector<uint8_t>& audio) = 0;
};

struct ToolDescriptor {
    std::string name;
    std::string description;
    std::string input_schema;   // JSON object text
};

// Executes named automation tools. A failure leaves a human readable reason in `error`.
class ToolExecutor {
public:
    virtual ~ToolExecutor() = default;

    virtual std::vector<ToolDescriptor> describeTools() const = 0;
    virtual esp_err_t execute(const std::string& name, const std::string& arguments_json,
                              std::string& result, std::string& error) = 0;
};
