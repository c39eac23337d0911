#include "device_protocol.hpp"
#include "esp_log.h"
#include "cJSON.h"
#include "esp_random.h"
#include <cstdlib>
#include <cstring>
#include <map>
#include <cstdio>

static const char *TAG = "DeviceProtocol";

using Decoder = void (*)(const cJSON* root, const cJSON* payload, DeviceMessage& message);

static std::string stringField(const cJSON* object, const char* key) {
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(object, key);
    if (cJSON_IsString(item) && item->valuestring) {
        return item->valuestring;
    }
    return "";
}

static void decodeNothing(const cJSON*, const cJSON*, DeviceMessage&) {
}

static void decodeListen(const cJSON* root, const cJSON*, DeviceMessage& message) {
    message.state = stringField(root, "state");
}

static void decodeMedia(const cJSON*, const cJSON* payload, DeviceMessage& message) {
    if (!payload) {
        return;
    }
    std::string hex = stringField(payload, "data");
    if (!DeviceProtocol::hexDecode(hex, message.data)) {
        ESP_LOGW(TAG, "Invalid hex data in %s message (%zu chars)", message.type_name.c_str(), hex.size());
        message.data.clear();
    }
}

static void decodeWheel(const cJSON*, const cJSON* payload, DeviceMessage& message) {
    if (payload) {
        message.detail = stringField(payload, "direction");
    }
}

static void decodeButton(const cJSON*, const cJSON* payload, DeviceMessage& message) {
    if (payload) {
        message.detail = stringField(payload, "action");
    }
}

struct DecoderEntry {
    DeviceMessage::Type type;
    Decoder decoder;
};

static const std::map<std::string, DecoderEntry>& decoderTable() {
    static const std::map<std::string, DecoderEntry> table = {
        {"hello",  {DeviceMessage::Type::HELLO,  decodeNothing}},
        {"listen", {DeviceMessage::Type::LISTEN, decodeListen}},
        {"audio",  {DeviceMessage::Type::AUDIO,  decodeMedia}},
        {"image",  {DeviceMessage::Type::IMAGE,  decodeMedia}},
        {"mcp",    {DeviceMessage::Type::MCP,    decodeNothing}},
        {"wheel",  {DeviceMessage::Type::WHEEL,  decodeWheel}},
        {"button", {DeviceMessage::Type::BUTTON, decodeButton}},
        {"status", {DeviceMessage::Type::STATUS, decodeNothing}},
    };
    return table;
}

static int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static std::string printAndDelete(cJSON* root) {
    std::string text;
    char* json_string = cJSON_PrintUnformatted(root);
    if (json_string) {
        text = json_string;
        free(json_string);
    }
    cJSON_Delete(root);
    return text;
}

esp_err_t DeviceProtocol::parse(const std::string& text, DeviceMessage& message) {
    cJSON* root = cJSON_Parse(text.c_str());
    if (!root) {
        return ESP_ERR_INVALID_ARG;
    }
    if (!cJSON_IsObject(root)) {
        cJSON_Delete(root);
        return ESP_ERR_INVALID_ARG;
    }

    message = DeviceMessage{};
    message.type_name = stringField(root, "type");

    const cJSON* payload = cJSON_GetObjectItemCaseSensitive(root, "payload");
    if (payload) {
        char* payload_text = cJSON_PrintUnformatted(payload);
        if (payload_text) {
            message.payload = payload_text;
            free(payload_text);
        }
    } else {
        message.payload = "{}";
    }
    if (!cJSON_IsObject(payload)) {
        payload = nullptr;
    }

    auto it = decoderTable().find(message.type_name);
    if (it != decoderTable().end()) {
        message.type = it->second.type;
        it->second.decoder(root, payload, message);
    } else {
        message.type = DeviceMessage::Type::UNRECOGNIZED;
    }

    cJSON_Delete(root);
    return ESP_OK;
}

bool DeviceProtocol::hexDecode(const std::string& hex, std::vector<uint8_t>& out) {
    out.clear();
    if (hex.size() % 2 != 0) {
        return false;
    }
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int high = hexValue(hex[i]);
        int low = hexValue(hex[i + 1]);
        if (high < 0 || low < 0) {
            out.clear();
            return false;
        }
        out.push_back(static_cast<uint8_t>((high << 4) | low));
    }
    return true;
}

std::string DeviceProtocol::generateSessionId() {
    uint8_t bytes[16];
    esp_fill_random(bytes, sizeof(bytes));
    // UUID v4: version nibble 4, variant bits 10
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    char buffer[37];
    snprintf(buffer, sizeof(buffer),
             "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
             bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5], bytes[6], bytes[7],
             bytes[8], bytes[9], bytes[10], bytes[11], bytes[12], bytes[13], bytes[14], bytes[15]);
    return buffer;
}

std::string DeviceProtocol::helloAck(const std::string& session_id) {
    cJSON* root = cJSON_CreateObject();
    cJSON_AddStringToObject(root, "type", "hello");
    cJSON_AddStringToObject(root, "transport", "websocket");
    cJSON_AddStringToObject(root, "session_id", session_id.c_str());
    cJSON* audio = cJSON_AddObjectToObject(root, "audio_params");
    cJSON_AddNumberToObject(audio, "sample_rate", AUDIO_SAMPLE_RATE);
    cJSON_AddNumberToObject(audio, "frame_duration", AUDIO_FRAME_DURATION_MS);
    return printAndDelete(root);
}

std::string DeviceProtocol::initializeRequest(int id, const std::string& vision_url, const std::string& token) {
    cJSON* root = cJSON_CreateObject();
    cJSON_AddStringToObject(root, "type", "mcp");
    cJSON* payload = cJSON_AddObjectToObject(root, "payload");
    cJSON_AddStringToObject(payload, "jsonrpc", "2.0");
    cJSON_AddNumberToObject(payload, "id", id);
    cJSON_AddStringToObject(payload, "method", "initialize");
    cJSON* params = cJSON_AddObjectToObject(payload, "params");
    cJSON* capabilities = cJSON_AddObjectToObject(params, "capabilities");
    cJSON* vision = cJSON_AddObjectToObject(capabilities, "vision");
    cJSON_AddStringToObject(vision, "url", vision_url.c_str());
    cJSON_AddStringToObject(vision, "token", token.c_str());
    return printAndDelete(root);
}

std::string DeviceProtocol::ttsStop() {
    cJSON* root = cJSON_CreateObject();
    cJSON_AddStringToObject(root, "type", "tts");
    cJSON_AddStringToObject(root, "state", "stop");
    return printAndDelete(root);
}

std::string DeviceProtocol::ttsSentence(const std::string& text) {
    cJSON* root = cJSON_CreateObject();
    cJSON_AddStringToObject(root, "type", "tts");
    cJSON_AddStringToObject(root, "state", "sentence_start");
    cJSON_AddStringToObject(root, "text", text.c_str());
    return printAndDelete(root);
}

std::string DeviceProtocol::llmEmotion(const std::string& emotion) {
    cJSON* root = cJSON_CreateObject();
    cJSON_AddStringToObject(root, "type", "llm");
    cJSON_AddStringToObject(root, "emotion", emotion.c_str());
    return printAndDelete(root);
}

std::string DeviceProtocol::alert(const std::string& status, const std::string& message, const std::string& emotion) {
    cJSON* root = cJSON_CreateObject();
    cJSON_AddStringToObject(root, "type", "alert");
    cJSON_AddStringToObject(root, "status", status.c_str());
    cJSON_AddStringToObject(root, "message", message.c_str());
    cJSON_AddStringToObject(root, "emotion", emotion.c_str());
    return printAndDelete(root);
}

std::string DeviceProtocol::requestFrame() {
    cJSON* root = cJSON_CreateObject();
    cJSON_AddStringToObject(root, "type", "request_frame");
    return printAndDelete(root);
}

std::string DeviceProtocol::toolCall(int id, const std::string& name, const std::string& arguments_json) {
    cJSON* arguments = cJSON_Parse(arguments_json.c_str());
    if (!cJSON_IsObject(arguments)) {
        cJSON_Delete(arguments);
        arguments = cJSON_CreateObject();
    }

    cJSON* root = cJSON_CreateObject();
    cJSON_AddStringToObject(root, "type", "mcp");
    cJSON* payload = cJSON_AddObjectToObject(root, "payload");
    cJSON_AddStringToObject(payload, "jsonrpc", "2.0");
    cJSON_AddNumberToObject(payload, "id", id);
    cJSON_AddStringToObject(payload, "method", "tools/call");
    cJSON* params = cJSON_AddObjectToObject(payload, "params");
    cJSON_AddStringToObject(params, "name", name.c_str());
    cJSON_AddItemToObject(params, "arguments", arguments);
    return printAndDelete(root);
}
