#include "handshake_logic.hpp"
#include "esp_log.h"
#include "cJSON.h"
#include <cctype>
#include <cstdlib>

static const char *TAG = "Handshake";

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

static std::string toLower(const std::string& text) {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) {
        lower.push_back((char)tolower((unsigned char)c));
    }
    return lower;
}

// Value of `key="..."` or `key=...` inside a header line, empty when absent
static std::string headerParam(const std::string& header, const std::string& key) {
    std::string lower = toLower(header);
    std::string needle = key + "=";
    size_t pos = 0;
    while ((pos = lower.find(needle, pos)) != std::string::npos) {
        // must start a parameter, not end another one ("filename=" contains "name=")
        if (pos == 0 || lower[pos - 1] == ' ' || lower[pos - 1] == ';' || lower[pos - 1] == '\t') {
            break;
        }
        pos += needle.size();
    }
    if (pos == std::string::npos) {
        return "";
    }

    size_t start = pos + needle.size();
    if (start < header.size() && header[start] == '"') {
        size_t end = header.find('"', start + 1);
        if (end == std::string::npos) {
            return header.substr(start + 1);
        }
        return header.substr(start + 1, end - start - 1);
    }
    size_t end = header.find_first_of("; \t\r\n", start);
    return header.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

std::string HandshakeLogic::normalizeMac(const std::string& mac) {
    if (mac.empty() || mac == "unknown") {
        return "unknown";
    }
    std::string clean;
    for (char c : mac) {
        if (c == ':' || c == '-' || c == '.') {
            continue;
        }
        clean.push_back((char)tolower((unsigned char)c));
    }
    return clean;
}

std::string HandshakeLogic::hostFromHeader(const std::string& host_header) {
    if (!host_header.empty() && host_header[0] == '[') {
        size_t close = host_header.find(']');
        if (close != std::string::npos) {
            return host_header.substr(0, close + 1);
        }
    }
    size_t colon = host_header.find(':');
    return colon == std::string::npos ? host_header : host_header.substr(0, colon);
}

std::string HandshakeLogic::buildCheckinResponse(const std::string& body, const std::string& host_header,
                                                 uint16_t ws_port, int64_t now_ms, CheckinInfo& info) {
    cJSON* device = cJSON_Parse(body.c_str());
    if (!cJSON_IsObject(device)) {
        if (!body.empty()) {
            ESP_LOGW(TAG, "Check-in body is not a JSON object, treating as empty");
        }
        cJSON_Delete(device);
        device = nullptr;
    }

    cJSON* mac = cJSON_GetObjectItem(device, "mac_address");
    info.mac = normalizeMac(cJSON_IsString(mac) ? mac->valuestring : "unknown");

    cJSON* application = cJSON_GetObjectItem(device, "application");
    cJSON* version = cJSON_GetObjectItem(application, "version");
    info.version = cJSON_IsString(version) ? version->valuestring : "unknown";

    cJSON* board = cJSON_GetObjectItem(device, "board");
    cJSON* ip = cJSON_GetObjectItem(board, "ip");
    if (cJSON_IsString(ip)) {
        info.device_ip = ip->valuestring;
    }
    cJSON_Delete(device);

    std::string host = hostFromHeader(host_header);
    if (host.empty()) {
        host = "localhost";
    }
    std::string ws_url = "ws://" + host + ":" + std::to_string(ws_port) + "/ws";

    cJSON* root = cJSON_CreateObject();
    cJSON* server_time = cJSON_AddObjectToObject(root, "server_time");
    cJSON_AddNumberToObject(server_time, "timestamp", (double)now_ms);
    cJSON_AddNumberToObject(server_time, "timezone_offset", 0);
    cJSON* websocket = cJSON_AddObjectToObject(root, "websocket");
    cJSON_AddStringToObject(websocket, "url", ws_url.c_str());
    cJSON_AddObjectToObject(root, "firmware");
    return printAndDelete(root);
}

std::string HandshakeLogic::versionJson() {
    cJSON* root = cJSON_CreateObject();
    cJSON_AddStringToObject(root, "version", "1.0.0");
    cJSON_AddStringToObject(root, "build", "1");
    cJSON_AddStringToObject(root, "date", "2024-01-01");
    return printAndDelete(root);
}

std::string HandshakeLogic::errorJson(const std::string& message) {
    cJSON* root = cJSON_CreateObject();
    cJSON_AddStringToObject(root, "error", message.c_str());
    return printAndDelete(root);
}

std::string HandshakeLogic::ingestReplyJson(bool success, const std::string& message) {
    cJSON* root = cJSON_CreateObject();
    cJSON_AddBoolToObject(root, "success", success);
    cJSON_AddStringToObject(root, "message", message.c_str());
    return printAndDelete(root);
}

bool HandshakeLogic::extractBoundary(const std::string& content_type, std::string& boundary) {
    if (toLower(content_type).find("multipart/form-data") == std::string::npos) {
        return false;
    }
    boundary = headerParam(content_type, "boundary");
    return !boundary.empty();
}

bool HandshakeLogic::parseMultipart(const std::string& body, const std::string& content_type,
                                    MultipartForm& form) {
    std::string boundary;
    if (!extractBoundary(content_type, boundary)) {
        ESP_LOGW(TAG, "Missing multipart boundary in '%s'", content_type.c_str());
        return false;
    }

    const std::string delimiter = "--" + boundary;
    size_t pos = body.find(delimiter);
    if (pos == std::string::npos) {
        return false;
    }

    int parts = 0;
    while (true) {
        pos += delimiter.size();
        // closing delimiter
        if (body.compare(pos, 2, "--") == 0) {
            break;
        }
        if (body.compare(pos, 2, "\r\n") != 0) {
            return false;
        }
        pos += 2;

        size_t headers_end = body.find("\r\n\r\n", pos);
        if (headers_end == std::string::npos) {
            return false;
        }
        std::string headers = body.substr(pos, headers_end - pos);
        size_t content_start = headers_end + 4;

        size_t next = body.find("\r\n" + delimiter, content_start);
        if (next == std::string::npos) {
            return false;
        }

        std::string name;
        bool has_filename = false;
        size_t line_start = 0;
        while (line_start < headers.size()) {
            size_t line_end = headers.find("\r\n", line_start);
            std::string line = headers.substr(line_start, line_end == std::string::npos ? std::string::npos
                                                                                       : line_end - line_start);
            if (toLower(line).compare(0, 20, "content-disposition:") == 0) {
                name = headerParam(line, "name");
                has_filename = !headerParam(line, "filename").empty();
            }
            if (line_end == std::string::npos) {
                break;
            }
            line_start = line_end + 2;
        }

        if (name == "file" || has_filename) {
            form.image.assign(body.begin() + content_start, body.begin() + next);
        } else if (name == "question") {
            form.question = body.substr(content_start, next - content_start);
        }
        parts++;

        pos = next + 2;
    }

    return parts > 0;
}
