#pragma once

#include <string>
#include "esp_err.h"

// Transport under the device session: one WebSocket connection per socket fd.
class DeviceLink {
public:
    virtual ~DeviceLink() = default;

    virtual esp_err_t sendText(int fd, const std::string& text) = 0;
    virtual void closeLink(int fd) = 0;
};

// What command producers (bus router, display) may do with the device.
class DeviceCommandSink {
public:
    virtual ~DeviceCommandSink() = default;

    // Sends now when a session can take it, otherwise queues in order.
    virtual void sendToDevice(const std::string& message) = 0;
    virtual int nextRequestId() = 0;
    // Asks the device for a frame and analyses it regardless of motion or throttling.
    virtual void requestSceneAnalysis() = 0;
};
