#include "reconnect_controller.hpp"
#include "bus_adapter.hpp"
#include "esp_log.h"
#include <algorithm>

static const char *TAG = "Reconnect";

const uint32_t ReconnectController::MIN_DELAY_S;
const uint32_t ReconnectController::MAX_DELAY_S;

Backoff::Backoff(uint32_t min_s, uint32_t max_s)
    : min_s_(min_s)
    , max_s_(std::max(min_s, max_s))
    , delay_s_(min_s)
{
}

uint32_t Backoff::next() {
    uint32_t wait_s = delay_s_;
    delay_s_ = std::min(delay_s_ * 2, max_s_);
    return wait_s;
}

void Backoff::reset() {
    delay_s_ = min_s_;
}

ReconnectController::ReconnectController(BusAdapter& bus, FlushCallback flush)
    : bus_(bus)
    , flush_(flush)
    , backoff_(MIN_DELAY_S, MAX_DELAY_S)
    , state_(LinkState::IDLE)
{
}

void ReconnectController::onConnected() {
    backoff_.reset();
    state_ = LinkState::CONNECTED;
    ESP_LOGI(TAG, "Device connected, reconnect delay reset to %us", (unsigned)backoff_.current());

    bus_.publishStateOnOff("binary_sensor/connected", true);
    if (flush_) {
        flush_();
    }
}

uint32_t ReconnectController::onDisconnected() {
    uint32_t wait_s = backoff_.next();
    state_ = LinkState::DISCONNECTED;

    bus_.publishStateOnOff("binary_sensor/connected", false);
    ESP_LOGI(TAG, "Device disconnected. Reconnect delay: %us, next: %us", (unsigned)wait_s, (unsigned)backoff_.current());
    return wait_s;
}
