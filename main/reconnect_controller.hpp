#pragma once

#include <functional>
#include <cstdint>

class BusAdapter;

// Doubling delay between min and max, in seconds
class Backoff {
public:
    Backoff(uint32_t min_s, uint32_t max_s);

    // Returns the delay to honour now and doubles the next one.
    uint32_t next();
    void reset();
    uint32_t current() const { return delay_s_; }

private:
    uint32_t min_s_;
    uint32_t max_s_;
    uint32_t delay_s_;
};

// Backoff bookkeeping around the device link. Owns no timers: the delay it records
// is for whoever re-listens or re-dials.
class ReconnectController {
public:
    enum class LinkState {
        IDLE,
        CONNECTED,
        DISCONNECTED
    };

    using FlushCallback = std::function<void()>;

    static const uint32_t MIN_DELAY_S = 1;
    static const uint32_t MAX_DELAY_S = 60;

    ReconnectController(BusAdapter& bus, FlushCallback flush);

    void onConnected();
    // Returns the delay to honour before the next attempt and doubles the next one.
    uint32_t onDisconnected();

    uint32_t currentDelay() const { return backoff_.current(); }
    LinkState getState() const { return state_; }

private:
    BusAdapter& bus_;
    FlushCallback flush_;
    Backoff backoff_;
    LinkState state_;
};
