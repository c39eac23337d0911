#pragma once

#include <cstdint>
#include <functional>
#include "esp_err.h"

// Runs jobs on the single context that owns gateway state (outbox, session slot,
// perception state, mutable config). Producers on other tasks only ever post.
class Scheduler {
public:
    using Job = std::function<void()>;

    virtual ~Scheduler() = default;

    // Gives up when the queue stays full for a short while
    virtual esp_err_t post(Job job) = 0;
    // Waits for room as long as the scheduler runs. Never call it from the scheduler's own context.
    virtual esp_err_t postWait(Job job) = 0;
    virtual esp_err_t postDelayed(uint32_t delay_ms, Job job) = 0;
};
