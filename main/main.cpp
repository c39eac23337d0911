#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "esp_system.h"
#include "esp_log.h"
#include "esp_netif.h"
#include "esp_event.h"
#include "nvs_flash.h"

#include "gateway.hpp"

static const char *TAG = "WatcherGW";

extern "C" void app_main(void)
{
    ESP_LOGI(TAG, "SenseCAP Watcher gateway starting...");

    esp_err_t ret = nvs_flash_init();
    if (ret == ESP_ERR_NVS_NO_FREE_PAGES || ret == ESP_ERR_NVS_NEW_VERSION_FOUND) {
        ESP_ERROR_CHECK(nvs_flash_erase());
        ret = nvs_flash_init();
    }
    ESP_ERROR_CHECK(ret);

    ESP_ERROR_CHECK(esp_netif_init());
    ESP_ERROR_CHECK(esp_event_loop_create_default());

    // Lives for the lifetime of the firmware
    static WatcherGateway gateway;
    esp_err_t ret_init = gateway.initialize();
    if (ret_init != ESP_OK) {
        ESP_LOGE(TAG, "Failed to initialize gateway: %s", esp_err_to_name(ret_init));
        return;
    }

    esp_err_t ret_start = gateway.start();
    if (ret_start != ESP_OK) {
        ESP_LOGE(TAG, "Failed to start gateway: %s", esp_err_to_name(ret_start));
        gateway.stop();
        return;
    }

    ESP_LOGI(TAG, "Gateway running");

    while (true) {
        vTaskDelay(pdMS_TO_TICKS(1000));
    }
}
