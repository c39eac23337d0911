#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include "esp_err.h"

// Text frame received from the device, tagged by its "type" field.
struct DeviceMessage {
    enum class Type {
        HELLO,
        LISTEN,
        AUDIO,
        IMAGE,
        MCP,
        WHEEL,
        BUTTON,
        STATUS,
        UNRECOGNIZED
    };

    Type type = Type::UNRECOGNIZED;
    std::string type_name;
    std::string state;              // listen
    std::vector<uint8_t> data;      // audio / image, decoded from payload.data
    std::string payload;            // payload object as compact JSON, "{}" when absent
    std::string detail;             // wheel direction / button action
};

class DeviceProtocol {
public:
    static const int AUDIO_SAMPLE_RATE = 24000;
    static const int AUDIO_FRAME_DURATION_MS = 60;

    // ESP_ERR_INVALID_ARG for text that is not a JSON object. Unknown types parse
    // successfully as UNRECOGNIZED.
    static esp_err_t parse(const std::string& text, DeviceMessage& message);

    static bool hexDecode(const std::string& hex, std::vector<uint8_t>& out);
    static std::string generateSessionId();

    static std::string helloAck(const std::string& session_id);
    static std::string initializeRequest(int id, const std::string& vision_url, const std::string& token);
    static std::string ttsStop();
    static std::string ttsSentence(const std::string& text);
    static std::string llmEmotion(const std::string& emotion);
    static std::string alert(const std::string& status, const std::string& message, const std::string& emotion);
    static std::string requestFrame();
    // arguments_json must be a JSON object; anything else is sent as {}
    static std::string toolCall(int id, const std::string& name, const std::string& arguments_json);

};
