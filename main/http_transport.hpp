#pragma once

#include <string>
#include <vector>
#include <utility>
#include "esp_err.h"

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    int timeout_ms = 10000;
};

struct HttpResponse {
    int status = 0;
    std::string body;
};

// Blocking request/response seam for the HTTP backends.
// ESP_OK means a response arrived, whatever its status.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual esp_err_t perform(const HttpRequest& request, HttpResponse& response) = 0;
};
