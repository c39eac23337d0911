#pragma once

#include <map>
#include <string>
#include <functional>
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "freertos/semphr.h"
#include "esp_err.h"

// Bookkeeping for the gateway's own FreeRTOS tasks. Task bodies are expected to
// return on their own; the wrapper then deletes the task.
class TaskManager {
public:
    enum class TaskState {
        CREATED,
        RUNNING,
        FINISHED
    };

    struct TaskInfo {
        TaskHandle_t handle;
        std::string name;
        uint32_t stack_size;
        UBaseType_t priority;
        TaskState state;
    };

    using TaskFunction = std::function<void()>;

    TaskManager();
    ~TaskManager();

    esp_err_t createTask(const std::string& name, TaskFunction task_function, uint32_t stack_size,
                         UBaseType_t priority);
    size_t runningTaskCount() const;

    void checkStackWatermarks() const;

private:
    static void taskWrapper(void* parameter);
    void updateTaskState(const std::string& name, TaskState state);

    std::map<std::string, TaskInfo> tasks_;
    SemaphoreHandle_t mutex_;

    static const char* TAG;
};

struct TaskParams {
    TaskManager::TaskFunction function;
    std::string task_name;
    TaskManager* manager;
};
