#include "task_manager.hpp"
#include "esp_log.h"

const char* TaskManager::TAG = "TaskManager";

TaskManager::TaskManager() {
    mutex_ = xSemaphoreCreateMutex();
    if (!mutex_) {
        ESP_LOGE(TAG, "Failed to create mutex");
    }
}

TaskManager::~TaskManager() {
    for (auto& task_pair : tasks_) {
        if (task_pair.second.handle && task_pair.second.state == TaskState::RUNNING) {
            ESP_LOGW(TAG, "Task '%s' still running at teardown, deleting", task_pair.first.c_str());
            vTaskDelete(task_pair.second.handle);
        }
    }

    if (mutex_) {
        vSemaphoreDelete(mutex_);
    }
}

esp_err_t TaskManager::createTask(const std::string& name, TaskFunction task_function, uint32_t stack_size,
                                  UBaseType_t priority) {
    if (!mutex_ || xSemaphoreTake(mutex_, pdMS_TO_TICKS(1000)) != pdTRUE) {
        ESP_LOGE(TAG, "Failed to take mutex");
        return ESP_FAIL;
    }

    auto existing = tasks_.find(name);
    if (existing != tasks_.end() && existing->second.state == TaskState::RUNNING) {
        ESP_LOGW(TAG, "Task '%s' already exists", name.c_str());
        xSemaphoreGive(mutex_);
        return ESP_ERR_INVALID_STATE;
    }

    TaskParams* task_params = new TaskParams{
        .function = task_function,
        .task_name = name,
        .manager = this
    };

    // Registered before the task can run so its exit always finds the entry
    tasks_[name] = TaskInfo{
        .handle = nullptr,
        .name = name,
        .stack_size = stack_size,
        .priority = priority,
        .state = TaskState::CREATED
    };

    TaskHandle_t task_handle = nullptr;
    BaseType_t result = xTaskCreate(taskWrapper, name.c_str(), stack_size, task_params, priority, &task_handle);

    if (result != pdPASS) {
        ESP_LOGE(TAG, "Failed to create task '%s'", name.c_str());
        tasks_.erase(name);
        delete task_params;
        xSemaphoreGive(mutex_);
        return ESP_ERR_NO_MEM;
    }

    TaskInfo& info = tasks_[name];
    info.handle = task_handle;
    if (info.state == TaskState::CREATED) {
        info.state = TaskState::RUNNING;
    }

    ESP_LOGI(TAG, "Task '%s' created (stack %u, priority %u)", name.c_str(), (unsigned)stack_size,
             (unsigned)priority);
    xSemaphoreGive(mutex_);
    return ESP_OK;
}

size_t TaskManager::runningTaskCount() const {
    if (!mutex_ || xSemaphoreTake(mutex_, pdMS_TO_TICKS(1000)) != pdTRUE) {
        ESP_LOGE(TAG, "Failed to take mutex");
        return 0;
    }

    size_t count = 0;
    for (const auto& task_pair : tasks_) {
        if (task_pair.second.state == TaskState::RUNNING) {
            count++;
        }
    }

    xSemaphoreGive(mutex_);
    return count;
}

void TaskManager::checkStackWatermarks() const {
    if (!mutex_ || xSemaphoreTake(mutex_, pdMS_TO_TICKS(1000)) != pdTRUE) {
        ESP_LOGE(TAG, "Failed to take mutex");
        return;
    }

    for (const auto& task_pair : tasks_) {
        const TaskInfo& info = task_pair.second;
        if (!info.handle || info.state != TaskState::RUNNING) {
            continue;
        }

        uint32_t watermark = uxTaskGetStackHighWaterMark(info.handle);
        uint32_t used = info.stack_size > watermark ? info.stack_size - watermark : 0;
        uint32_t usage_percent = (used * 100) / info.stack_size;

        ESP_LOGI(TAG, "Task '%s': %u/%u bytes used (%u%%)", info.name.c_str(), (unsigned)used,
                 (unsigned)info.stack_size, (unsigned)usage_percent);

        if (usage_percent > 80) {
            ESP_LOGW(TAG, "Task '%s' stack usage is high: %u%%", info.name.c_str(), (unsigned)usage_percent);
        }
    }

    xSemaphoreGive(mutex_);
}

void TaskManager::taskWrapper(void* parameter) {
    TaskParams* params = static_cast<TaskParams*>(parameter);

    ESP_LOGI(TAG, "Task '%s' started", params->task_name.c_str());

    if (params->function) {
        params->function();
    }

    params->manager->updateTaskState(params->task_name, TaskState::FINISHED);
    ESP_LOGI(TAG, "Task '%s' ended", params->task_name.c_str());

    delete params;
    vTaskDelete(nullptr);
}

void TaskManager::updateTaskState(const std::string& name, TaskState state) {
    if (!mutex_ || xSemaphoreTake(mutex_, portMAX_DELAY) != pdTRUE) {
        return;
    }
    auto it = tasks_.find(name);
    if (it != tasks_.end()) {
        it->second.state = state;
    }
    xSemaphoreGive(mutex_);
}
