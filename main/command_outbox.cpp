#include "command_outbox.hpp"
#include "esp_log.h"

static const char *TAG = "CommandOutbox";

CommandOutbox::CommandOutbox() : next_sequence_(1) {
}

void CommandOutbox::enqueue(const std::string& message) {
    queue_.push_back(CommandEnvelope{message, next_sequence_++});
    ESP_LOGI(TAG, "Command queued for delivery (queue size: %zu)", queue_.size());
}

bool CommandOutbox::popFront(CommandEnvelope& envelope) {
    if (queue_.empty()) {
        return false;
    }
    envelope = queue_.front();
    queue_.pop_front();
    return true;
}

void CommandOutbox::pushFront(const CommandEnvelope& envelope) {
    queue_.push_front(envelope);
}
