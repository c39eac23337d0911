#include "dispatcher.hpp"
#include "task_manager.hpp"
#include "esp_log.h"

static const char *TAG = "Dispatcher";

Dispatcher::Dispatcher()
    : queue_(nullptr)
    , mutex_(xSemaphoreCreateMutex())
    , event_group_(xEventGroupCreate())
    , running_(false)
{
}

Dispatcher::~Dispatcher() {
    if (running_) {
        stop(1000);
    }
    if (queue_) {
        Job* job = nullptr;
        while (xQueueReceive(queue_, &job, 0) == pdTRUE) {
            delete job;
        }
        vQueueDelete(queue_);
    }
    for (auto& entry : pending_) {
        xTimerDelete(entry.first, 0);
    }
    pending_.clear();
    if (event_group_) {
        vEventGroupDelete(event_group_);
    }
    if (mutex_) {
        vSemaphoreDelete(mutex_);
    }
}

esp_err_t Dispatcher::start(TaskManager& tasks, const DispatcherConfig& config) {
    if (running_) {
        return ESP_ERR_INVALID_STATE;
    }
    if (!mutex_ || !event_group_) {
        return ESP_ERR_NO_MEM;
    }

    config_ = config;
    queue_ = xQueueCreate(config_.queue_length, sizeof(Job*));
    if (!queue_) {
        ESP_LOGE(TAG, "Failed to create job queue");
        return ESP_ERR_NO_MEM;
    }

    xEventGroupClearBits(event_group_, STOPPED_BIT);
    running_ = true;
    esp_err_t ret = tasks.createTask(config_.task_name, std::bind(&Dispatcher::run, this), config_.stack_size,
                                     config_.priority);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to start task %s: %s", config_.task_name.c_str(), esp_err_to_name(ret));
        running_ = false;
        vQueueDelete(queue_);
        queue_ = nullptr;
        return ret;
    }

    ESP_LOGI(TAG, "Dispatcher %s started (queue length %u)", config_.task_name.c_str(),
             (unsigned)config_.queue_length);
    return ESP_OK;
}

esp_err_t Dispatcher::stop(uint32_t timeout_ms) {
    if (!running_) {
        return ESP_OK;
    }

    // Timers first so nothing new lands in the queue behind the stop marker
    if (xSemaphoreTake(mutex_, portMAX_DELAY) == pdTRUE) {
        for (auto& entry : pending_) {
            if (xTimerDelete(entry.first, 0) != pdPASS) {
                // Still fires later, but finds nothing to run
                ESP_LOGW(TAG, "Timer command queue full, delayed job left to lapse");
            }
        }
        pending_.clear();
        xSemaphoreGive(mutex_);
    }

    Job* marker = nullptr;
    if (xQueueSend(queue_, &marker, pdMS_TO_TICKS(timeout_ms)) != pdTRUE) {
        ESP_LOGE(TAG, "Job queue full, cannot stop main task");
        return ESP_ERR_TIMEOUT;
    }

    EventBits_t bits = xEventGroupWaitBits(event_group_, STOPPED_BIT, pdFALSE, pdTRUE, pdMS_TO_TICKS(timeout_ms));
    if (!(bits & STOPPED_BIT)) {
        ESP_LOGE(TAG, "Task %s did not stop within %u ms", config_.task_name.c_str(), (unsigned)timeout_ms);
        return ESP_ERR_TIMEOUT;
    }

    ESP_LOGI(TAG, "Dispatcher %s stopped", config_.task_name.c_str());
    return ESP_OK;
}

esp_err_t Dispatcher::post(Job job) {
    if (!running_ || !queue_) {
        return ESP_ERR_INVALID_STATE;
    }

    Job* item = new Job(std::move(job));
    if (xQueueSend(queue_, &item, pdMS_TO_TICKS(config_.post_timeout_ms)) != pdTRUE) {
        ESP_LOGW(TAG, "Job queue full, dropping job");
        delete item;
        return ESP_ERR_TIMEOUT;
    }
    return ESP_OK;
}

esp_err_t Dispatcher::postWait(Job job) {
    if (!running_ || !queue_) {
        return ESP_ERR_INVALID_STATE;
    }

    Job* item = new Job(std::move(job));
    while (running_) {
        if (xQueueSend(queue_, &item, pdMS_TO_TICKS(config_.post_timeout_ms)) == pdTRUE) {
            return ESP_OK;
        }
    }
    delete item;
    return ESP_ERR_INVALID_STATE;
}

esp_err_t Dispatcher::postDelayed(uint32_t delay_ms, Job job) {
    if (!running_) {
        return ESP_ERR_INVALID_STATE;
    }
    if (delay_ms == 0) {
        return post(std::move(job));
    }

    TickType_t period = pdMS_TO_TICKS(delay_ms);
    if (period == 0) {
        period = 1;
    }
    TimerHandle_t timer = xTimerCreate("gw_delay", period, pdFALSE, this, timerCallback);
    if (!timer) {
        ESP_LOGE(TAG, "Failed to create timer");
        return ESP_ERR_NO_MEM;
    }

    if (xSemaphoreTake(mutex_, portMAX_DELAY) != pdTRUE) {
        xTimerDelete(timer, 0);
        return ESP_FAIL;
    }
    pending_[timer] = std::move(job);
    bool started = xTimerStart(timer, 0) == pdPASS;
    if (!started) {
        pending_.erase(timer);
    }
    xSemaphoreGive(mutex_);

    if (!started) {
        ESP_LOGE(TAG, "Failed to start timer");
        xTimerDelete(timer, 0);
        return ESP_FAIL;
    }
    return ESP_OK;
}

size_t Dispatcher::pendingTimers() const {
    if (xSemaphoreTake(mutex_, pdMS_TO_TICKS(100)) != pdTRUE) {
        return 0;
    }
    size_t count = pending_.size();
    xSemaphoreGive(mutex_);
    return count;
}

void Dispatcher::timerCallback(TimerHandle_t timer) {
    Dispatcher* self = static_cast<Dispatcher*>(pvTimerGetTimerID(timer));
    if (self) {
        self->fire(timer);
    }
}

// Runs on the timer service task
void Dispatcher::fire(TimerHandle_t timer) {
    Job job;
    if (xSemaphoreTake(mutex_, portMAX_DELAY) != pdTRUE) {
        return;
    }
    auto it = pending_.find(timer);
    bool owned = it != pending_.end();
    if (owned) {
        job = std::move(it->second);
        pending_.erase(it);
    }
    xSemaphoreGive(mutex_);

    if (!owned) {
        return;
    }
    if (xTimerDelete(timer, 0) != pdPASS) {
        ESP_LOGW(TAG, "Failed to delete lapsed timer");
    }

    esp_err_t ret = post(std::move(job));
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Delayed job lost: %s", esp_err_to_name(ret));
    }
}

void Dispatcher::run() {
    Job* job = nullptr;
    while (true) {
        if (xQueueReceive(queue_, &job, portMAX_DELAY) != pdTRUE) {
            continue;
        }
        if (!job) {
            break;
        }
        (*job)();
        delete job;
    }

    running_ = false;
    xEventGroupSetBits(event_group_, STOPPED_BIT);
}
