#include "bus_adapter.hpp"
#include "esp_log.h"
#include "cJSON.h"
#include <cstdlib>
#include <cstring>

static const char *TAG = "BusAdapter";

BusAdapter::BusAdapter(MessageBus& bus, const EntityCatalog& catalog)
    : bus_(bus)
    , catalog_(catalog)
{
}

esp_err_t BusAdapter::registerEntities() {
    int failures = 0;

    for (const auto& entity : catalog_.entities()) {
        std::string topic = catalog_.discoveryTopic(entity.component, entity.object_id);
        if (bus_.publish(topic, catalog_.discoveryPayload(entity), 1, true) != ESP_OK) {
            ESP_LOGW(TAG, "Discovery publish failed for %s/%s", entity.component, entity.object_id);
            failures++;
        } else {
            ESP_LOGD(TAG, "Registered entity: %s/%s", entity.component, entity.object_id);
        }
    }

    for (const char* event_type : EntityCatalog::EVENT_TYPES) {
        if (bus_.publish(catalog_.eventDiscoveryTopic(event_type),
                         catalog_.eventDiscoveryPayload(event_type), 1, true) != ESP_OK) {
            ESP_LOGW(TAG, "Discovery publish failed for event %s", event_type);
            failures++;
        }
    }

    ESP_LOGI(TAG, "Registered %zu entities and 2 events (%d failures)", catalog_.entities().size(), failures);
    return failures == 0 ? ESP_OK : ESP_FAIL;
}

esp_err_t BusAdapter::publishInitialStates(const StateMap& live) {
    int published = 0;
    int failures = 0;

    for (const auto& entity : catalog_.entities()) {
        if (!entity.initial_state) {
            continue;
        }
        std::string value = entity.initial_state;
        auto current = live.find(std::string(entity.component) + "/" + entity.object_id);
        if (current != live.end()) {
            value = current->second;
        }
        std::string topic = catalog_.stateTopic(entity.component, entity.object_id);
        if (bus_.publish(topic, value, 0, true) != ESP_OK) {
            failures++;
        } else {
            published++;
        }
    }

    ESP_LOGI(TAG, "Published initial states for %d entities", published);
    return failures == 0 ? ESP_OK : ESP_FAIL;
}

void BusAdapter::publishState(const std::string& entity_id, const std::string& value, bool retain) {
    std::string topic;
    size_t slash = entity_id.find('/');
    if (slash != std::string::npos) {
        topic = catalog_.stateTopic(entity_id.substr(0, slash), entity_id.substr(slash + 1));
    } else {
        topic = catalog_.nodeId() + "/" + entity_id + "/state";
    }

    esp_err_t ret = bus_.publish(topic, value, 0, retain);
    if (ret != ESP_OK) {
        ESP_LOGW(TAG, "State for %s not published: %s", entity_id.c_str(), esp_err_to_name(ret));
        return;
    }
    ESP_LOGD(TAG, "Published state for %s: %s", entity_id.c_str(), value.c_str());
}

void BusAdapter::publishStateOnOff(const std::string& entity_id, bool on) {
    publishState(entity_id, on ? "ON" : "OFF");
}

void BusAdapter::publishImage(const std::vector<uint8_t>& image) {
    std::string payload(image.begin(), image.end());
    esp_err_t ret = bus_.publish(catalog_.imageTopic(), payload, 0, true);
    if (ret != ESP_OK) {
        ESP_LOGW(TAG, "Image (%zu bytes) not published: %s", image.size(), esp_err_to_name(ret));
    }
}

void BusAdapter::fireEvent(const std::string& event_type, const std::string& data_json) {
    cJSON* event = cJSON_CreateObject();
    cJSON_AddStringToObject(event, "event_type", event_type.c_str());

    cJSON* data = cJSON_Parse(data_json.c_str());
    if (cJSON_IsObject(data)) {
        cJSON* item = data->child;
        while (item) {
            cJSON* next = item->next;
            if (item->string && strcmp(item->string, "event_type") != 0) {
                cJSON_DetachItemViaPointer(data, item);
                cJSON_AddItemToObject(event, item->string, item);
            }
            item = next;
        }
    } else {
        ESP_LOGW(TAG, "Event %s data is not a JSON object", event_type.c_str());
    }
    cJSON_Delete(data);

    char* json_string = cJSON_PrintUnformatted(event);
    cJSON_Delete(event);
    if (!json_string) {
        ESP_LOGE(TAG, "Failed to encode event %s", event_type.c_str());
        return;
    }

    esp_err_t ret = bus_.publish(catalog_.eventTopic(event_type), json_string, 0, false);
    if (ret != ESP_OK) {
        ESP_LOGW(TAG, "Event %s not published: %s", event_type.c_str(), esp_err_to_name(ret));
    } else {
        ESP_LOGI(TAG, "Fired event %s: %s", event_type.c_str(), json_string);
    }
    free(json_string);
}

esp_err_t BusAdapter::subscribeCommands(CommandCallback callback) {
    command_callback_ = callback;
    bus_.setMessageCallback(
        std::bind(&BusAdapter::handleMessage, this, std::placeholders::_1, std::placeholders::_2)
    );

    esp_err_t ret = bus_.subscribe(catalog_.commandWildcard(), 1);
    if (ret != ESP_OK) {
        ESP_LOGE(TAG, "Failed to subscribe to %s", catalog_.commandWildcard().c_str());
        return ret;
    }
    ESP_LOGI(TAG, "Subscribed to command topics");
    return ESP_OK;
}

void BusAdapter::handleMessage(const std::string& topic, const std::string& payload) {
    std::string component;
    std::string object_id;
    if (!catalog_.parseCommandTopic(topic, component, object_id)) {
        ESP_LOGD(TAG, "Ignoring message on %s", topic.c_str());
        return;
    }

    ESP_LOGD(TAG, "HA command: %s = %s", topic.c_str(), payload.c_str());
    if (command_callback_) {
        command_callback_(component, object_id, payload);
    }
}

std::string BusAdapter::truncate(const std::string& text, size_t max_chars) {
    size_t chars = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        if (chars == max_chars) {
            return text.substr(0, pos);
        }
        unsigned char lead = static_cast<unsigned char>(text[pos]);
        size_t length = 1;
        if (lead >= 0xF0) {
            length = 4;
        } else if (lead >= 0xE0) {
            length = 3;
        } else if (lead >= 0xC0) {
            length = 2;
        }
        pos += length;
        chars++;
    }
    return text;
}
