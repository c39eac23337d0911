#include "entity_catalog.hpp"
#include "esp_log.h"
#include "cJSON.h"
#include <cstdlib>
#include <cstring>

static const char *TAG = "EntityCatalog";

const char* const EntityCatalog::EVENT_TYPES[2] = {"alert", "voice_command"};

static const std::vector<EntityDescriptor> ENTITIES = {
    {"image", "snapshot", "Watcher Snapshot", "snapshot", nullptr, false,
     "{}"},
    {"switch", "monitoring", "Watcher Monitoring", "monitoring", "OFF", true,
     "{\"payload_on\":\"ON\",\"payload_off\":\"OFF\"}"},
    {"sensor", "last_event", "Watcher Last Event", "last_event", "", false,
     "{\"icon\":\"mdi:message-text\"}"},
    {"text", "custom_prompt", "Watcher Custom Prompt", "custom_prompt", "", true,
     "{\"mode\":\"text\",\"max\":500}"},
    {"button", "analyze_scene", "Watcher Analyze Scene", "analyze_scene", nullptr, true,
     "{\"payload_press\":\"PRESS\",\"icon\":\"mdi:eye\"}"},
    {"binary_sensor", "motion_detected", "Watcher Motion Detected", "motion_detected", "OFF", false,
     "{\"payload_on\":\"ON\",\"payload_off\":\"OFF\",\"device_class\":\"motion\"}"},
    {"number", "monitoring_interval", "Watcher Monitoring Interval", "monitoring_interval", "30", true,
     "{\"min\":10,\"max\":300,\"step\":1,\"unit_of_measurement\":\"s\",\"icon\":\"mdi:timer\"}"},
    {"number", "confidence_threshold", "Watcher Confidence Threshold", "confidence_threshold", "50", true,
     "{\"min\":0,\"max\":100,\"step\":1,\"unit_of_measurement\":\"%\",\"icon\":\"mdi:percent\"}"},
    {"switch", "voice_assistant", "Watcher Voice Assistant", "voice_assistant", "OFF", true,
     "{\"payload_on\":\"ON\",\"payload_off\":\"OFF\",\"icon\":\"mdi:microphone\"}"},
    {"notify", "tts", "Watcher TTS", "tts", nullptr, true,
     "{\"icon\":\"mdi:text-to-speech\"}"},
    {"siren", "alarm", "Watcher Siren", "siren", "OFF", true,
     "{\"payload_on\":\"ON\",\"payload_off\":\"OFF\",\"available_tones\":[\"alarm\",\"alert\",\"chime\"],"
     "\"support_duration\":true,\"support_volume_set\":true}"},
    {"binary_sensor", "noise_detected", "Watcher Noise Detected", "noise_detected", "OFF", false,
     "{\"payload_on\":\"ON\",\"payload_off\":\"OFF\",\"device_class\":\"sound\"}"},
    {"select", "display_mode", "Watcher Display Mode", "display_mode", "Clock", true,
     "{\"options\":[\"Clock\",\"Weather\",\"Status\",\"AI Log\",\"Custom\"],\"icon\":\"mdi:monitor\"}"},
    {"text", "display_message", "Watcher Display Message", "display_message", "", true,
     "{\"mode\":\"text\",\"max\":100,\"icon\":\"mdi:message-text-outline\"}"},
    {"switch", "display_power", "Watcher Display Power", "display_power", "ON", true,
     "{\"payload_on\":\"ON\",\"payload_off\":\"OFF\",\"icon\":\"mdi:monitor-shimmer\"}"},
    {"binary_sensor", "connected", "Watcher Connected", "connected", "OFF", false,
     "{\"payload_on\":\"ON\",\"payload_off\":\"OFF\",\"device_class\":\"connectivity\"}"},
};

EntityCatalog::EntityCatalog(const std::string& node_id, const std::string& discovery_prefix)
    : node_id_(node_id)
    , discovery_prefix_(discovery_prefix)
{
}

const std::vector<EntityDescriptor>& EntityCatalog::entities() const {
    return ENTITIES;
}

const EntityDescriptor* EntityCatalog::find(const std::string& component, const std::string& object_id) const {
    for (const auto& entity : ENTITIES) {
        if (component == entity.component && object_id == entity.object_id) {
            return &entity;
        }
    }
    return nullptr;
}

std::string EntityCatalog::discoveryTopic(const std::string& component, const std::string& object_id) const {
    return discovery_prefix_ + "/" + component + "/" + node_id_ + "/" + object_id + "/config";
}

std::string EntityCatalog::stateTopic(const std::string& component, const std::string& object_id) const {
    return node_id_ + "/" + component + "/" + object_id + "/state";
}

std::string EntityCatalog::commandTopic(const std::string& component, const std::string& object_id) const {
    return node_id_ + "/" + component + "/" + object_id + "/set";
}

std::string EntityCatalog::commandWildcard() const {
    return node_id_ + "/+/+/set";
}

std::string EntityCatalog::eventTopic(const std::string& event_type) const {
    return node_id_ + "/event/" + event_type + "/state";
}

std::string EntityCatalog::eventDiscoveryTopic(const std::string& event_type) const {
    return discovery_prefix_ + "/event/" + node_id_ + "_" + event_type + "/config";
}

std::string EntityCatalog::imageTopic() const {
    return node_id_ + "/image/snapshot/image";
}

static cJSON* createDeviceBlock(const std::string& node_id) {
    cJSON* device = cJSON_CreateObject();
    cJSON* identifiers = cJSON_AddArrayToObject(device, "identifiers");
    cJSON_AddItemToArray(identifiers, cJSON_CreateString(node_id.c_str()));
    cJSON_AddStringToObject(device, "name", "SenseCAP Watcher");
    cJSON_AddStringToObject(device, "manufacturer", "Seeed Studio");
    cJSON_AddStringToObject(device, "model", "SenseCAP Watcher");
    return device;
}

static std::string printAndDelete(cJSON* root) {
    std::string text;
    char* json_string = cJSON_PrintUnformatted(root);
    if (json_string) {
        text = json_string;
        free(json_string);
    }
    cJSON_Delete(root);
    return text;
}

std::string EntityCatalog::discoveryPayload(const EntityDescriptor& entity) const {
    cJSON* root = cJSON_CreateObject();
    cJSON_AddStringToObject(root, "name", entity.name);
    cJSON_AddStringToObject(root, "unique_id", (node_id_ + "_" + entity.unique_suffix).c_str());

    if (strcmp(entity.component, "image") == 0) {
        cJSON_AddStringToObject(root, "image_topic", imageTopic().c_str());
    }
    if (entity.initial_state) {
        cJSON_AddStringToObject(root, "state_topic", stateTopic(entity.component, entity.object_id).c_str());
    }
    if (entity.has_command_topic) {
        cJSON_AddStringToObject(root, "command_topic", commandTopic(entity.component, entity.object_id).c_str());
    }

    cJSON* extra = cJSON_Parse(entity.extra);
    if (extra) {
        cJSON* item = extra->child;
        while (item) {
            cJSON* next = item->next;
            cJSON_DetachItemViaPointer(extra, item);
            cJSON_AddItemToObject(root, item->string, item);
            item = next;
        }
        cJSON_Delete(extra);
    } else {
        ESP_LOGE(TAG, "Invalid discovery fields for %s/%s", entity.component, entity.object_id);
    }

    cJSON_AddItemToObject(root, "device", createDeviceBlock(node_id_));
    return printAndDelete(root);
}

std::string EntityCatalog::eventDiscoveryPayload(const std::string& event_type) const {
    cJSON* root = cJSON_CreateObject();
    std::string name = event_type == "alert" ? "Watcher Alert" : "Watcher Voice Command";
    cJSON_AddStringToObject(root, "name", name.c_str());
    cJSON_AddStringToObject(root, "unique_id", (node_id_ + "_" + event_type).c_str());
    cJSON_AddStringToObject(root, "state_topic", eventTopic(event_type).c_str());
    cJSON* types = cJSON_AddArrayToObject(root, "event_types");
    cJSON_AddItemToArray(types, cJSON_CreateString(event_type.c_str()));
    cJSON_AddItemToObject(root, "device", createDeviceBlock(node_id_));
    return printAndDelete(root);
}

bool EntityCatalog::parseCommandTopic(const std::string& topic, std::string& component, std::string& object_id) const {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t slash = topic.find('/', start);
        if (slash == std::string::npos) {
            parts.push_back(topic.substr(start));
            break;
        }
        parts.push_back(topic.substr(start, slash - start));
        start = slash + 1;
    }

    if (parts.size() != 4 || parts[0] != node_id_ || parts[3] != "set" ||
        parts[1].empty() || parts[2].empty()) {
        return false;
    }
    component = parts[1];
    object_id = parts[2];
    return true;
}
