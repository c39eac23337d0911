#include "ws_reassembler.hpp"
#include "esp_log.h"
#include <utility>

static const char *TAG = "WsReassembler";

WsReassembler::WsReassembler(size_t max_message_size)
    : max_message_size_(max_message_size)
{
}

bool WsReassembler::fits(int fd, size_t length) const {
    if (length > max_message_size_) {
        return false;
    }
    auto it = partials_.find(fd);
    size_t held = it != partials_.end() ? it->second.data.size() : 0;
    return held + length <= max_message_size_;
}

WsReassembler::Result WsReassembler::push(int fd, FrameKind kind, bool final, const uint8_t* data, size_t length,
                                          Message& message) {
    if (kind == FrameKind::CONTINUATION) {
        if (partials_.find(fd) == partials_.end()) {
            ESP_LOGW(TAG, "Continuation without a started message (fd=%d)", fd);
            return Result::UNEXPECTED;
        }
    } else {
        // A new data frame replaces whatever was left unfinished
        Message& started = partials_[fd];
        started.text = kind == FrameKind::TEXT;
        started.data.clear();
    }

    if (!fits(fd, length)) {
        ESP_LOGE(TAG, "Message on fd=%d exceeds %zu bytes", fd, max_message_size_);
        partials_.erase(fd);
        return Result::TOO_LARGE;
    }

    Message& partial = partials_[fd];
    if (length > 0) {
        partial.data.append((const char*)data, length);
    }
    if (!final) {
        return Result::PARTIAL;
    }

    message = std::move(partial);
    partials_.erase(fd);
    return Result::COMPLETE;
}

void WsReassembler::reset(int fd) {
    partials_.erase(fd);
}
