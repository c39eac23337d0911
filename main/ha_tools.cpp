#include "ha_tools.hpp"
#include "bus_adapter.hpp"
#include "esp_log.h"
#include "cJSON.h"
#include <cstdlib>
#include <iterator>

static const char *TAG = "HaTools";

static const ToolDescriptor TOOLS[] = {
    {"get_states", "Get current states of Home Assistant entities",
     "{\"type\":\"object\",\"properties\":{\"entity_ids\":{\"type\":\"array\",\"items\":{\"type\":\"string\"},"
     "\"description\":\"List of entity IDs to query\"}},\"required\":[\"entity_ids\"]}"},
    {"call_service", "Call a Home Assistant service",
     "{\"type\":\"object\",\"properties\":{\"domain\":{\"type\":\"string\",\"description\":\"The service domain "
     "(e.g., light, switch)\"},\"service\":{\"type\":\"string\",\"description\":\"The service name (e.g., turn_on, "
     "toggle)\"},\"data\":{\"type\":\"object\",\"description\":\"Service data parameters\"}},"
     "\"required\":[\"domain\",\"service\",\"data\"]}"},
    {"get_weather", "Get current weather information from a weather entity",
     "{\"type\":\"object\",\"properties\":{\"entity_id\":{\"type\":\"string\",\"description\":\"The weather entity "
     "ID (e.g., weather.home)\"}},\"required\":[\"entity_id\"]}"},
    {"send_notification", "Send a persistent notification to Home Assistant",
     "{\"type\":\"object\",\"properties\":{\"message\":{\"type\":\"string\",\"description\":\"The notification "
     "message content\"},\"title\":{\"type\":\"string\",\"description\":\"Optional notification title\"}},"
     "\"required\":[\"message\"]}"},
    {"get_calendar", "Get events from a Home Assistant calendar entity",
     "{\"type\":\"object\",\"properties\":{\"entity_id\":{\"type\":\"string\",\"description\":\"The calendar "
     "entity ID\"},\"days\":{\"type\":\"integer\",\"description\":\"Number of days ahead to fetch events\","
     "\"default\":7}},\"required\":[\"entity_id\"]}"},
    {"control_media", "Control a media player entity",
     "{\"type\":\"object\",\"properties\":{\"entity_id\":{\"type\":\"string\",\"description\":\"The media_player "
     "entity ID\"},\"action\":{\"type\":\"string\",\"enum\":[\"media_play\",\"media_pause\",\"media_stop\","
     "\"media_next_track\",\"media_previous_track\",\"toggle\"],\"description\":\"The action to perform\"}},"
     "\"required\":[\"entity_id\",\"action\"]}"},
};

static const char* const MEDIA_ACTIONS[] = {
    "media_play", "media_pause", "media_stop", "media_next_track", "media_previous_track", "toggle",
};

static bool requireString(const cJSON* args, const char* key, std::string& value, std::string& error) {
    const cJSON* item = cJSON_GetObjectItem(args, key);
    if (!cJSON_IsString(item) || item->valuestring[0] == '\0') {
        error = std::string("Missing argument: ") + key;
        return false;
    }
    value = item->valuestring;
    return true;
}

static std::string printJson(const cJSON* item) {
    std::string text;
    char* json_string = cJSON_PrintUnformatted(item);
    if (json_string) {
        text = json_string;
        free(json_string);
    }
    return text;
}

HaTools::HaTools(HttpTransport& transport, const std::string& api_url, const std::string& token)
    : transport_(transport)
    , api_url_(api_url)
    , token_(token)
{
    while (!api_url_.empty() && api_url_.back() == '/') {
        api_url_.pop_back();
    }

    handlers_ = {
        {"get_states", &HaTools::getStates},
        {"call_service", &HaTools::callService},
        {"get_weather", &HaTools::getWeather},
        {"send_notification", &HaTools::sendNotification},
        {"get_calendar", &HaTools::getCalendar},
        {"control_media", &HaTools::controlMedia},
    };
}

std::vector<ToolDescriptor> HaTools::describeTools() const {
    return std::vector<ToolDescriptor>(std::begin(TOOLS), std::end(TOOLS));
}

esp_err_t HaTools::execute(const std::string& name, const std::string& arguments_json,
                           std::string& result, std::string& error) {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        error = "Unknown tool: " + name;
        return ESP_ERR_NOT_FOUND;
    }

    cJSON* args = cJSON_Parse(arguments_json.empty() ? "{}" : arguments_json.c_str());
    if (!cJSON_IsObject(args)) {
        cJSON_Delete(args);
        error = "Arguments must be a JSON object";
        return ESP_ERR_INVALID_ARG;
    }

    esp_err_t ret = (this->*(it->second))(args, result, error);
    cJSON_Delete(args);
    return ret;
}

esp_err_t HaTools::request(const char* method, const std::string& path, const std::string& body,
                           std::string& result, std::string& error) {
    HttpRequest http_request;
    http_request.method = method;
    http_request.url = api_url_ + path;
    http_request.headers.push_back(std::make_pair("Authorization", "Bearer " + token_));
    http_request.headers.push_back(std::make_pair("Content-Type", "application/json"));
    http_request.body = body;

    HttpResponse response;
    esp_err_t ret = transport_.perform(http_request, response);
    if (ret != ESP_OK) {
        error = std::string("Request to ") + path + " failed: " + esp_err_to_name(ret);
        ESP_LOGE(TAG, "%s", error.c_str());
        return ret;
    }
    if (response.status < 200 || response.status >= 300) {
        error = "HTTP " + std::to_string(response.status) + ": " + BusAdapter::truncate(response.body, 200);
        ESP_LOGE(TAG, "%s %s -> %s", method, path.c_str(), error.c_str());
        return ESP_FAIL;
    }

    result = response.body;
    return ESP_OK;
}

esp_err_t HaTools::getStates(const cJSON* args, std::string& result, std::string& error) {
    const cJSON* ids = cJSON_GetObjectItem(args, "entity_ids");
    if (!cJSON_IsArray(ids)) {
        error = "Missing argument: entity_ids";
        return ESP_ERR_INVALID_ARG;
    }

    // One failing entity does not fail the whole query
    cJSON* states = cJSON_CreateArray();
    const cJSON* id = nullptr;
    cJSON_ArrayForEach(id, ids) {
        if (!cJSON_IsString(id)) {
            continue;
        }
        std::string state;
        std::string state_error;
        cJSON* entry = nullptr;
        if (request("GET", std::string("/states/") + id->valuestring, "", state, state_error) == ESP_OK) {
            entry = cJSON_Parse(state.c_str());
        }
        if (!entry) {
            entry = cJSON_CreateObject();
            cJSON_AddStringToObject(entry, "entity_id", id->valuestring);
            cJSON_AddStringToObject(entry, "error", state_error.empty() ? "Invalid response" : state_error.c_str());
        }
        cJSON_AddItemToArray(states, entry);
    }

    result = printJson(states);
    cJSON_Delete(states);
    return ESP_OK;
}

esp_err_t HaTools::callService(const cJSON* args, std::string& result, std::string& error) {
    std::string domain;
    std::string service;
    if (!requireString(args, "domain", domain, error) || !requireString(args, "service", service, error)) {
        return ESP_ERR_INVALID_ARG;
    }

    const cJSON* data = cJSON_GetObjectItem(args, "data");
    std::string body = cJSON_IsObject(data) ? printJson(data) : "{}";

    ESP_LOGI(TAG, "Calling service %s.%s", domain.c_str(), service.c_str());
    return request("POST", "/services/" + domain + "/" + service, body, result, error);
}

esp_err_t HaTools::getWeather(const cJSON* args, std::string& result, std::string& error) {
    std::string entity_id;
    if (!requireString(args, "entity_id", entity_id, error)) {
        return ESP_ERR_INVALID_ARG;
    }
    return request("GET", "/states/" + entity_id, "", result, error);
}

esp_err_t HaTools::sendNotification(const cJSON* args, std::string& result, std::string& error) {
    std::string message;
    if (!requireString(args, "message", message, error)) {
        return ESP_ERR_INVALID_ARG;
    }

    cJSON* data = cJSON_CreateObject();
    cJSON_AddStringToObject(data, "message", message.c_str());
    const cJSON* title = cJSON_GetObjectItem(args, "title");
    if (cJSON_IsString(title) && title->valuestring[0] != '\0') {
        cJSON_AddStringToObject(data, "title", title->valuestring);
    }
    std::string body = printJson(data);
    cJSON_Delete(data);

    return request("POST", "/services/notify/persistent_notification", body, result, error);
}

esp_err_t HaTools::getCalendar(const cJSON* args, std::string& result, std::string& error) {
    std::string entity_id;
    if (!requireString(args, "entity_id", entity_id, error)) {
        return ESP_ERR_INVALID_ARG;
    }
    return request("GET", "/calendars/" + entity_id, "", result, error);
}

esp_err_t HaTools::controlMedia(const cJSON* args, std::string& result, std::string& error) {
    std::string entity_id;
    std::string action;
    if (!requireString(args, "entity_id", entity_id, error) || !requireString(args, "action", action, error)) {
        return ESP_ERR_INVALID_ARG;
    }

    bool known = false;
    for (const char* candidate : MEDIA_ACTIONS) {
        if (action == candidate) {
            known = true;
            break;
        }
    }
    if (!known) {
        error = "Unsupported media action: " + action;
        return ESP_ERR_INVALID_ARG;
    }

    cJSON* data = cJSON_CreateObject();
    cJSON_AddStringToObject(data, "entity_id", entity_id.c_str());
    std::string body = printJson(data);
    cJSON_Delete(data);

    return request("POST", "/services/media_player/" + action, body, result, error);
}
