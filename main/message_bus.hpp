#pragma once

#include <string>
#include <functional>
#include "esp_err.h"

class MessageBus {
public:
    using MessageCallback = std::function<void(const std::string& topic, const std::string& payload)>;

    virtual ~MessageBus() = default;

    virtual esp_err_t publish(const std::string& topic, const std::string& payload, int qos, bool retain) = 0;
    virtual esp_err_t subscribe(const std::string& topic, int qos) = 0;
    virtual void setMessageCallback(MessageCallback callback) = 0;
    virtual bool isConnected() const = 0;
};
