#pragma once

#include <map>
#include <string>
#include "freertos/FreeRTOS.h"
#include "freertos/queue.h"
#include "freertos/semphr.h"
#include "freertos/event_groups.h"
#include "freertos/timers.h"
#include "scheduler.hpp"

class TaskManager;

// One task draining a job queue. The gateway runs two: its main scheduling context and
// a worker for blocking collaborator calls. Delayed jobs are one-shot FreeRTOS timers
// whose callback only posts into the same queue.
class Dispatcher : public Scheduler {
public:
    struct DispatcherConfig {
        std::string task_name = "gw_main";
        uint32_t queue_length = 32;
        uint32_t stack_size = 8192;
        UBaseType_t priority = 5;
        uint32_t post_timeout_ms = 100;
    };

    Dispatcher();
    ~Dispatcher();

    esp_err_t start(TaskManager& tasks, const DispatcherConfig& config);
    // Cancels pending timers, runs what is already queued, then ends the task.
    esp_err_t stop(uint32_t timeout_ms);

    esp_err_t post(Job job) override;
    esp_err_t postWait(Job job) override;
    esp_err_t postDelayed(uint32_t delay_ms, Job job) override;

    bool isRunning() const { return running_; }
    size_t pendingTimers() const;

private:
    static void timerCallback(TimerHandle_t timer);
    void fire(TimerHandle_t timer);
    void run();

    DispatcherConfig config_;
    QueueHandle_t queue_;
    SemaphoreHandle_t mutex_;
    EventGroupHandle_t event_group_;
    // A timer missing here was cancelled; its callback does nothing
    std::map<TimerHandle_t, Job> pending_;
    volatile bool running_;

    static const int STOPPED_BIT = BIT0;
};
