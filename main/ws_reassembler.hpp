#pragma once

#include <map>
#include <string>
#include <cstdint>

// Joins fragmented WebSocket messages. One partial message per socket, so frames
// from two connections never mix.
class WsReassembler {
public:
    enum class FrameKind {
        TEXT,
        BINARY,
        CONTINUATION
    };

    enum class Result {
        PARTIAL,
        COMPLETE,
        TOO_LARGE,
        UNEXPECTED
    };

    struct Message {
        bool text = true;
        std::string data;
    };

    explicit WsReassembler(size_t max_message_size);

    // Whether a frame of this length still fits the socket's partial message
    bool fits(int fd, size_t length) const;
    // COMPLETE fills message and forgets the socket's partial. TOO_LARGE and
    // UNEXPECTED (continuation with nothing started) drop it.
    Result push(int fd, FrameKind kind, bool final, const uint8_t* data, size_t length, Message& message);
    void reset(int fd);

    size_t pendingSockets() const { return partials_.size(); }

private:
    size_t max_message_size_;
    std::map<int, Message> partials_;
};
