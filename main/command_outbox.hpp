#pragma once

#include <deque>
#include <string>
#include <cstdint>

struct CommandEnvelope {
    std::string message;
    uint64_t sequence = 0;
};

// Device-bound messages waiting for an active session. In memory only.
class CommandOutbox {
public:
    CommandOutbox();

    void enqueue(const std::string& message);
    bool popFront(CommandEnvelope& envelope);
    // Puts a popped envelope back at the head after a failed delivery.
    void pushFront(const CommandEnvelope& envelope);

    bool empty() const { return queue_.empty(); }
    size_t size() const { return queue_.size(); }

private:
    std::deque<CommandEnvelope> queue_;
    uint64_t next_sequence_;
};
