#include <cstdlib>
#include <memory>
#include <string>
#include <vector>
#include "unity.h"
#include "cJSON.h"
#include "test_fakes.hpp"
#include "bus_adapter.hpp"
#include "entity_catalog.hpp"
#include "command_router.hpp"
#include "display_controller.hpp"
#include "perception_pipeline.hpp"
#include "gateway_config.hpp"

class RecordingSink : public DeviceCommandSink {
public:
    void sendToDevice(const std::string& message) override {
        messages.push_back(message);
    }

    int nextRequestId() override {
        return ++request_id;
    }

    void requestSceneAnalysis() override {
        analysis_requests++;
    }

    std::vector<std::string> messages;
    int request_id = 0;
    int analysis_requests = 0;
};

struct BusFixture {
    FakeBus bus;
    EntityCatalog catalog{"sensecap_watcher", "homeassistant"};
    BusAdapter adapter{bus, catalog};
    RecordingSink device;
    DisplayController display{device};
    GatewayConfig config;
    PerceptionPipeline perception{PerceptionPipeline::PerceptionConfig{}, nullptr, nullptr, nullptr, nullptr};
    CommandRouter router{adapter, display, perception, config, device};
};

static std::unique_ptr<BusFixture> fx;

extern "C" void setUp(void) {
    fx.reset(new BusFixture());
}

extern "C" void tearDown(void) {
    fx.reset();
}

static std::string stringField(const std::string& json, const char* key) {
    std::string value;
    cJSON* root = cJSON_Parse(json.c_str());
    cJSON* item = cJSON_GetObjectItem(root, key);
    if (cJSON_IsString(item)) {
        value = item->valuestring;
    }
    cJSON_Delete(root);
    return value;
}

static std::string stateOf(const char* component, const char* object_id) {
    return fx->bus.last(fx->catalog.stateTopic(component, object_id));
}

// Catalog and discovery

static void test_register_entities_publishes_retained_discovery(void) {
    TEST_ASSERT_EQUAL(ESP_OK, fx->adapter.registerEntities());
    TEST_ASSERT_EQUAL(EntityCatalog::ENTITY_COUNT + 2, fx->bus.published.size());
    for (const auto& publication : fx->bus.published) {
        TEST_ASSERT_TRUE(publication.retain);
        TEST_ASSERT_EQUAL(1, publication.qos);
    }

    std::string monitoring = fx->bus.last("homeassistant/switch/sensecap_watcher/monitoring/config");
    TEST_ASSERT_EQUAL_STRING("sensecap_watcher_monitoring", stringField(monitoring, "unique_id").c_str());
    TEST_ASSERT_EQUAL_STRING("sensecap_watcher/switch/monitoring/set", stringField(monitoring, "command_topic").c_str());
    TEST_ASSERT_EQUAL_STRING("sensecap_watcher/switch/monitoring/state", stringField(monitoring, "state_topic").c_str());

    cJSON* root = cJSON_Parse(monitoring.c_str());
    cJSON* identifiers = cJSON_GetObjectItem(cJSON_GetObjectItem(root, "device"), "identifiers");
    TEST_ASSERT_EQUAL_STRING("sensecap_watcher", cJSON_GetArrayItem(identifiers, 0)->valuestring);
    cJSON_Delete(root);

    std::string alert = fx->bus.last("homeassistant/event/sensecap_watcher_alert/config");
    TEST_ASSERT_EQUAL_STRING("sensecap_watcher/event/alert/state", stringField(alert, "state_topic").c_str());
}

static void test_registration_is_idempotent(void) {
    fx->adapter.registerEntities();
    std::string first = fx->bus.last("homeassistant/select/sensecap_watcher/display_mode/config");
    fx->adapter.registerEntities();
    TEST_ASSERT_EQUAL_STRING(first.c_str(),
                             fx->bus.last("homeassistant/select/sensecap_watcher/display_mode/config").c_str());
    TEST_ASSERT_EQUAL(2 * (EntityCatalog::ENTITY_COUNT + 2), fx->bus.published.size());
}

static void test_image_entity_has_image_topic_only(void) {
    const EntityDescriptor* snapshot = fx->catalog.find("image", "snapshot");
    TEST_ASSERT_NOT_NULL(snapshot);
    std::string payload = fx->catalog.discoveryPayload(*snapshot);
    TEST_ASSERT_EQUAL_STRING("sensecap_watcher/image/snapshot/image", stringField(payload, "image_topic").c_str());
    TEST_ASSERT_EQUAL_STRING("", stringField(payload, "state_topic").c_str());
    TEST_ASSERT_EQUAL_STRING("", stringField(payload, "command_topic").c_str());
}

static void test_initial_states_are_retained(void) {
    TEST_ASSERT_EQUAL(ESP_OK, fx->adapter.publishInitialStates());
    TEST_ASSERT_EQUAL_STRING("OFF", stateOf("switch", "monitoring").c_str());
    TEST_ASSERT_EQUAL_STRING("Clock", stateOf("select", "display_mode").c_str());
    TEST_ASSERT_EQUAL_STRING("ON", stateOf("switch", "display_power").c_str());
    TEST_ASSERT_EQUAL_STRING("OFF", stateOf("binary_sensor", "connected").c_str());
    TEST_ASSERT_EQUAL(0, fx->bus.countOn("sensecap_watcher/button/analyze_scene/state"));
}

static void test_initial_states_follow_running_configuration(void) {
    fx->config.monitoring_interval = 120;
    fx->config.confidence_threshold = 0.85f;
    fx->config.custom_prompt = "Any parcels?";
    fx->config.voice_assistant = true;
    fx->perception.setMonitoringEnabled(true);
    fx->display.setMode(DisplayController::DisplayMode::STATUS);
    fx->bus.published.clear();

    TEST_ASSERT_EQUAL(ESP_OK, fx->adapter.publishInitialStates(fx->router.currentStates()));
    TEST_ASSERT_EQUAL_STRING("120", stateOf("number", "monitoring_interval").c_str());
    TEST_ASSERT_EQUAL_STRING("85", stateOf("number", "confidence_threshold").c_str());
    TEST_ASSERT_EQUAL_STRING("Any parcels?", stateOf("text", "custom_prompt").c_str());
    TEST_ASSERT_EQUAL_STRING("ON", stateOf("switch", "voice_assistant").c_str());
    TEST_ASSERT_EQUAL_STRING("ON", stateOf("switch", "monitoring").c_str());
    TEST_ASSERT_EQUAL_STRING("Status", stateOf("select", "display_mode").c_str());
    TEST_ASSERT_EQUAL_STRING("OFF", stateOf("binary_sensor", "connected").c_str());
    TEST_ASSERT_TRUE(fx->bus.published.back().retain);
}

static void test_publish_failures_are_swallowed(void) {
    fx->bus.connected = false;
    fx->adapter.publishState("sensor/last_event", "hello");
    fx->adapter.fireEvent("alert", "{\"description\":\"x\"}");
    TEST_ASSERT_EQUAL(ESP_FAIL, fx->adapter.registerEntities());
    TEST_ASSERT_EQUAL(0, fx->bus.published.size());
}

static void test_command_topic_parsing(void) {
    std::string component;
    std::string object_id;
    TEST_ASSERT_TRUE(fx->catalog.parseCommandTopic("sensecap_watcher/switch/monitoring/set", component, object_id));
    TEST_ASSERT_EQUAL_STRING("switch", component.c_str());
    TEST_ASSERT_EQUAL_STRING("monitoring", object_id.c_str());

    TEST_ASSERT_FALSE(fx->catalog.parseCommandTopic("other_node/switch/monitoring/set", component, object_id));
    TEST_ASSERT_FALSE(fx->catalog.parseCommandTopic("sensecap_watcher/switch/monitoring/state", component, object_id));
    TEST_ASSERT_FALSE(fx->catalog.parseCommandTopic("sensecap_watcher/switch/set", component, object_id));
    TEST_ASSERT_FALSE(fx->catalog.parseCommandTopic("sensecap_watcher/a/b/c/set", component, object_id));
}

static void test_commands_are_delivered_from_wildcard(void) {
    std::vector<std::string> received;
    fx->adapter.subscribeCommands([&received](const std::string& component, const std::string& object_id,
                                              const std::string& payload) {
        received.push_back(component + "|" + object_id + "|" + payload);
    });

    TEST_ASSERT_EQUAL(1, fx->bus.subscriptions.size());
    TEST_ASSERT_EQUAL_STRING("sensecap_watcher/+/+/set", fx->bus.subscriptions[0].c_str());

    fx->bus.deliver("sensecap_watcher/text/custom_prompt/set", "Watch the cat");
    fx->bus.deliver("sensecap_watcher/text/custom_prompt/state", "ignored");
    TEST_ASSERT_EQUAL(1, received.size());
    TEST_ASSERT_EQUAL_STRING("text|custom_prompt|Watch the cat", received[0].c_str());
}

static void test_truncate_respects_utf8_boundaries(void) {
    std::string ascii(300, 'a');
    TEST_ASSERT_EQUAL(255, BusAdapter::truncate(ascii, 255).size());

    std::string accented;
    for (int i = 0; i < 300; ++i) {
        accented += "\xc3\xa9";
    }
    std::string cut = BusAdapter::truncate(accented, 255);
    TEST_ASSERT_EQUAL(510, cut.size());

    TEST_ASSERT_EQUAL_STRING("short", BusAdapter::truncate("short", 255).c_str());
}

static void test_fire_event_merges_data_after_event_type(void) {
    fx->adapter.fireEvent("alert", "{\"description\":\"Cat on sofa\",\"confidence\":0.9,\"event_type\":\"spoof\"}");
    std::string event = fx->bus.last("sensecap_watcher/event/alert/state");
    TEST_ASSERT_EQUAL_STRING("alert", stringField(event, "event_type").c_str());
    TEST_ASSERT_EQUAL_STRING("Cat on sofa", stringField(event, "description").c_str());
    TEST_ASSERT_FALSE(fx->bus.published.back().retain);
}

// Command routing

static void test_monitoring_switch_echoes_and_toggles_perception(void) {
    TEST_ASSERT_EQUAL(ESP_OK, fx->router.route("switch", "monitoring", "ON"));
    TEST_ASSERT_TRUE(fx->perception.isMonitoringEnabled());
    TEST_ASSERT_EQUAL_STRING("ON", stateOf("switch", "monitoring").c_str());

    TEST_ASSERT_EQUAL(ESP_OK, fx->router.route("switch", "monitoring", "off"));
    TEST_ASSERT_FALSE(fx->perception.isMonitoringEnabled());
    TEST_ASSERT_EQUAL(ESP_OK, fx->router.route("switch", "monitoring", "on"));
    TEST_ASSERT_TRUE(fx->perception.isMonitoringEnabled());
    TEST_ASSERT_EQUAL_STRING("ON", stateOf("switch", "monitoring").c_str());

    TEST_ASSERT_EQUAL(ESP_OK, fx->router.route("switch", "monitoring", "garbage"));
    TEST_ASSERT_FALSE(fx->perception.isMonitoringEnabled());
    TEST_ASSERT_EQUAL_STRING("OFF", stateOf("switch", "monitoring").c_str());
}

static void test_analyze_scene_shows_thinking_and_requests_frame(void) {
    TEST_ASSERT_EQUAL(ESP_OK, fx->router.route("button", "analyze_scene", "PRESS"));
    TEST_ASSERT_EQUAL(1, fx->device.analysis_requests);
    TEST_ASSERT_EQUAL(1, fx->device.messages.size());
    TEST_ASSERT_EQUAL_STRING("alert", stringField(fx->device.messages[0], "type").c_str());
    TEST_ASSERT_EQUAL_STRING("Analyzing", stringField(fx->device.messages[0], "status").c_str());
    TEST_ASSERT_EQUAL_STRING("thinking", stringField(fx->device.messages[0], "emotion").c_str());
    TEST_ASSERT_EQUAL(0, fx->bus.published.size());
}

static void test_custom_prompt_is_stored_and_echoed(void) {
    TEST_ASSERT_EQUAL(ESP_OK, fx->router.route("text", "custom_prompt", "Count the boxes"));
    TEST_ASSERT_EQUAL_STRING("Count the boxes", fx->config.custom_prompt.c_str());
    TEST_ASSERT_EQUAL_STRING("Count the boxes", stateOf("text", "custom_prompt").c_str());
}

static void test_monitoring_interval_requires_positive_integer(void) {
    TEST_ASSERT_EQUAL(ESP_OK, fx->router.route("number", "monitoring_interval", "45"));
    TEST_ASSERT_EQUAL_UINT32(45, fx->config.monitoring_interval);
    TEST_ASSERT_EQUAL_STRING("45", stateOf("number", "monitoring_interval").c_str());

    size_t published = fx->bus.published.size();
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, fx->router.route("number", "monitoring_interval", "abc"));
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, fx->router.route("number", "monitoring_interval", "0"));
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, fx->router.route("number", "monitoring_interval", "-5"));
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, fx->router.route("number", "monitoring_interval", "4.5"));
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, fx->router.route("number", "monitoring_interval", ""));
    TEST_ASSERT_EQUAL_UINT32(45, fx->config.monitoring_interval);
    TEST_ASSERT_EQUAL(published, fx->bus.published.size());
}

static void test_confidence_threshold_is_a_percentage(void) {
    TEST_ASSERT_EQUAL(ESP_OK, fx->router.route("number", "confidence_threshold", "80"));
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 0.8f, fx->config.confidence_threshold);
    TEST_ASSERT_EQUAL_STRING("80", stateOf("number", "confidence_threshold").c_str());

    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, fx->router.route("number", "confidence_threshold", "150"));
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, fx->router.route("number", "confidence_threshold", "high"));
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 0.8f, fx->config.confidence_threshold);
}

static void test_voice_assistant_switch(void) {
    TEST_ASSERT_EQUAL(ESP_OK, fx->router.route("switch", "voice_assistant", "ON"));
    TEST_ASSERT_TRUE(fx->config.voice_assistant);
    TEST_ASSERT_EQUAL_STRING("ON", stateOf("switch", "voice_assistant").c_str());

    TEST_ASSERT_EQUAL(ESP_OK, fx->router.route("switch", "voice_assistant", "OFF"));
    TEST_ASSERT_FALSE(fx->config.voice_assistant);
    TEST_ASSERT_EQUAL(ESP_OK, fx->router.route("switch", "voice_assistant", "On"));
    TEST_ASSERT_TRUE(fx->config.voice_assistant);
}

static void test_tts_speaks_without_echo(void) {
    TEST_ASSERT_EQUAL(ESP_OK, fx->router.route("notify", "tts", "Dinner is ready"));
    TEST_ASSERT_EQUAL(1, fx->device.messages.size());
    TEST_ASSERT_EQUAL_STRING("tts", stringField(fx->device.messages[0], "type").c_str());
    TEST_ASSERT_EQUAL_STRING("sentence_start", stringField(fx->device.messages[0], "state").c_str());
    TEST_ASSERT_EQUAL_STRING("Dinner is ready", stringField(fx->device.messages[0], "text").c_str());
    TEST_ASSERT_EQUAL(0, fx->bus.published.size());
}

static void test_siren_alarm_and_release(void) {
    TEST_ASSERT_EQUAL(ESP_OK, fx->router.route("siren", "alarm", "ON"));
    TEST_ASSERT_EQUAL_STRING("ALARM", stringField(fx->device.messages[0], "status").c_str());
    TEST_ASSERT_EQUAL_STRING("shocked", stringField(fx->device.messages[0], "emotion").c_str());
    TEST_ASSERT_EQUAL_STRING("ON", stateOf("siren", "alarm").c_str());

    TEST_ASSERT_EQUAL(ESP_OK, fx->router.route("siren", "alarm", "OFF"));
    TEST_ASSERT_EQUAL_STRING("llm", stringField(fx->device.messages[1], "type").c_str());
    TEST_ASSERT_EQUAL_STRING("neutral", stringField(fx->device.messages[1], "emotion").c_str());
    TEST_ASSERT_EQUAL_STRING("OFF", stateOf("siren", "alarm").c_str());

    TEST_ASSERT_EQUAL(ESP_OK, fx->router.route("siren", "alarm", "on"));
    TEST_ASSERT_EQUAL_STRING("ALARM", stringField(fx->device.messages[2], "status").c_str());
}

static void test_display_mode_select(void) {
    TEST_ASSERT_EQUAL(ESP_OK, fx->router.route("select", "display_mode", "Weather"));
    TEST_ASSERT_TRUE(fx->display.getMode() == DisplayController::DisplayMode::WEATHER);
    TEST_ASSERT_EQUAL_STRING("cool", stringField(fx->device.messages[0], "emotion").c_str());
    TEST_ASSERT_EQUAL_STRING("Weather", stateOf("select", "display_mode").c_str());

    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, fx->router.route("select", "display_mode", "Disco"));
    TEST_ASSERT_EQUAL(1, fx->device.messages.size());
    TEST_ASSERT_EQUAL_STRING("Weather", stateOf("select", "display_mode").c_str());
}

static void test_display_power(void) {
    TEST_ASSERT_EQUAL(ESP_OK, fx->router.route("switch", "display_power", "OFF"));
    TEST_ASSERT_FALSE(fx->display.isPowered());
    TEST_ASSERT_EQUAL(0, fx->device.messages.size());
    TEST_ASSERT_EQUAL_STRING("OFF", stateOf("switch", "display_power").c_str());

    TEST_ASSERT_EQUAL(ESP_OK, fx->router.route("switch", "display_power", "ON"));
    TEST_ASSERT_EQUAL(1, fx->device.messages.size());
    TEST_ASSERT_EQUAL_STRING("neutral", stringField(fx->device.messages[0], "emotion").c_str());

    TEST_ASSERT_EQUAL(ESP_OK, fx->router.route("switch", "display_power", "off"));
    TEST_ASSERT_FALSE(fx->display.isPowered());
    TEST_ASSERT_EQUAL(ESP_OK, fx->router.route("switch", "display_power", "on"));
    TEST_ASSERT_TRUE(fx->display.isPowered());
    TEST_ASSERT_EQUAL_STRING("ON", stateOf("switch", "display_power").c_str());
}

static void test_display_message_is_spoken_and_echoed(void) {
    TEST_ASSERT_EQUAL(ESP_OK, fx->router.route("text", "display_message", "Hello"));
    TEST_ASSERT_EQUAL_STRING("Hello", stringField(fx->device.messages[0], "text").c_str());
    TEST_ASSERT_EQUAL_STRING("Hello", stateOf("text", "display_message").c_str());
}

static void test_unknown_entity_is_not_found_and_silent(void) {
    TEST_ASSERT_EQUAL(ESP_ERR_NOT_FOUND, fx->router.route("light", "kitchen", "ON"));
    TEST_ASSERT_EQUAL(ESP_ERR_NOT_FOUND, fx->router.route("switch", "display_mode", "ON"));
    TEST_ASSERT_EQUAL(0, fx->bus.published.size());
    TEST_ASSERT_EQUAL(0, fx->device.messages.size());
}

static void test_raw_mcp_forwards_tool_calls(void) {
    TEST_ASSERT_EQUAL(ESP_OK, fx->router.route("raw", "mcp", "{\"name\":\"set_volume\",\"arguments\":{\"level\":5}}"));
    TEST_ASSERT_EQUAL(ESP_OK, fx->router.route("raw", "mcp", "take_photo"));
    TEST_ASSERT_EQUAL(2, fx->device.messages.size());

    cJSON* first = cJSON_Parse(fx->device.messages[0].c_str());
    cJSON* payload = cJSON_GetObjectItem(first, "payload");
    TEST_ASSERT_EQUAL_STRING("tools/call", cJSON_GetObjectItem(payload, "method")->valuestring);
    TEST_ASSERT_EQUAL(1, cJSON_GetObjectItem(payload, "id")->valueint);
    cJSON* params = cJSON_GetObjectItem(payload, "params");
    TEST_ASSERT_EQUAL_STRING("set_volume", cJSON_GetObjectItem(params, "name")->valuestring);
    TEST_ASSERT_EQUAL(5, cJSON_GetObjectItem(cJSON_GetObjectItem(params, "arguments"), "level")->valueint);
    cJSON_Delete(first);

    cJSON* second = cJSON_Parse(fx->device.messages[1].c_str());
    payload = cJSON_GetObjectItem(second, "payload");
    TEST_ASSERT_EQUAL(2, cJSON_GetObjectItem(payload, "id")->valueint);
    params = cJSON_GetObjectItem(payload, "params");
    TEST_ASSERT_EQUAL_STRING("take_photo", cJSON_GetObjectItem(params, "name")->valuestring);
    TEST_ASSERT_TRUE(cJSON_IsObject(cJSON_GetObjectItem(params, "arguments")));
    cJSON_Delete(second);

    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, fx->router.route("raw", "mcp", ""));
}

static void test_raw_mcp_object_without_name_uses_payload_as_name(void) {
    const char* payload = "{\"arguments\":{\"level\":3}}";
    TEST_ASSERT_EQUAL(ESP_OK, fx->router.route("raw", "mcp", payload));
    TEST_ASSERT_EQUAL(1, fx->device.messages.size());

    cJSON* root = cJSON_Parse(fx->device.messages[0].c_str());
    cJSON* params = cJSON_GetObjectItem(cJSON_GetObjectItem(root, "payload"), "params");
    TEST_ASSERT_EQUAL_STRING(payload, cJSON_GetObjectItem(params, "name")->valuestring);
    TEST_ASSERT_EQUAL(3, cJSON_GetObjectItem(cJSON_GetObjectItem(params, "arguments"), "level")->valueint);
    cJSON_Delete(root);
    TEST_ASSERT_EQUAL(2, fx->device.messages.size());
}

static void test_strict_number_parsing(void) {
    long int_value = 0;
    float float_value = 0;
    TEST_ASSERT_TRUE(CommandRouter::parseStrictInt("120", int_value));
    TEST_ASSERT_EQUAL(120, int_value);
    TEST_ASSERT_FALSE(CommandRouter::parseStrictInt("12a", int_value));
    TEST_ASSERT_FALSE(CommandRouter::parseStrictInt(" ", int_value));
    TEST_ASSERT_TRUE(CommandRouter::parseStrictFloat("62.5", float_value));
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 62.5f, float_value);
    TEST_ASSERT_FALSE(CommandRouter::parseStrictFloat("nan", float_value));
    TEST_ASSERT_FALSE(CommandRouter::parseStrictFloat("1e", float_value));
}

extern "C" void app_main(void)
{
    UNITY_BEGIN();
    RUN_TEST(test_register_entities_publishes_retained_discovery);
    RUN_TEST(test_registration_is_idempotent);
    RUN_TEST(test_image_entity_has_image_topic_only);
    RUN_TEST(test_initial_states_are_retained);
    RUN_TEST(test_initial_states_follow_running_configuration);
    RUN_TEST(test_publish_failures_are_swallowed);
    RUN_TEST(test_command_topic_parsing);
    RUN_TEST(test_commands_are_delivered_from_wildcard);
    RUN_TEST(test_truncate_respects_utf8_boundaries);
    RUN_TEST(test_fire_event_merges_data_after_event_type);
    RUN_TEST(test_monitoring_switch_echoes_and_toggles_perception);
    RUN_TEST(test_analyze_scene_shows_thinking_and_requests_frame);
    RUN_TEST(test_custom_prompt_is_stored_and_echoed);
    RUN_TEST(test_monitoring_interval_requires_positive_integer);
    RUN_TEST(test_confidence_threshold_is_a_percentage);
    RUN_TEST(test_voice_assistant_switch);
    RUN_TEST(test_tts_speaks_without_echo);
    RUN_TEST(test_siren_alarm_and_release);
    RUN_TEST(test_display_mode_select);
    RUN_TEST(test_display_power);
    RUN_TEST(test_display_message_is_spoken_and_echoed);
    RUN_TEST(test_unknown_entity_is_not_found_and_silent);
    RUN_TEST(test_raw_mcp_forwards_tool_calls);
    RUN_TEST(test_raw_mcp_object_without_name_uses_payload_as_name);
    RUN_TEST(test_strict_number_parsing);
    exit(UNITY_END());
}
