#pragma once

#include "http_transport.hpp"

// esp_http_client implementation. One connection per request; HTTPS verified against
// the certificate bundle.
class EspHttpTransport : public HttpTransport {
public:
    struct TransportConfig {
        int buffer_size = 2048;
        size_t max_response_size = 256 * 1024;
    };

    EspHttpTransport();
    explicit EspHttpTransport(const TransportConfig& config);

    esp_err_t perform(const HttpRequest& request, HttpResponse& response) override;

private:
    TransportConfig config_;
};
