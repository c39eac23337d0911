#pragma once

#include <string>
#include <vector>
#include <cstdint>

struct CheckinInfo {
    std::string mac = "unknown";    // lowercase, separators stripped
    std::string version = "unknown";
    std::string device_ip;
};

struct MultipartForm {
    std::vector<uint8_t> image;
    std::string question = "What do you see?";
};

// Request/response shaping for the provisioning HTTP endpoints. No sockets here.
class HandshakeLogic {
public:
    static std::string normalizeMac(const std::string& mac);

    // "192.168.1.10:8001" -> "192.168.1.10". Bracketed IPv6 keeps its brackets.
    static std::string hostFromHeader(const std::string& host_header);

    // Never fails on the body: a missing or invalid document is treated as empty.
    static std::string buildCheckinResponse(const std::string& body, const std::string& host_header,
                                            uint16_t ws_port, int64_t now_ms, CheckinInfo& info);

    static std::string versionJson();
    static std::string errorJson(const std::string& message);
    static std::string ingestReplyJson(bool success, const std::string& message);

    // Extracts the image part (named "file", or any part carrying a filename) and the
    // optional "question" part. False when the content type has no boundary or the body
    // does not contain a single delimited part.
    static bool parseMultipart(const std::string& body, const std::string& content_type, MultipartForm& form);

    static bool extractBoundary(const std::string& content_type, std::string& boundary);
};
