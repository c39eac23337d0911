#include <cstdlib>
#include <cstdio>
#include <string>
#include <unistd.h>
#include "unity.h"
#include "gateway_config.hpp"

static std::string temp_file;

extern "C" void setUp(void) {
    char pattern[] = "/tmp/watchergw_options_XXXXXX";
    int fd = mkstemp(pattern);
    TEST_ASSERT_TRUE(fd >= 0);
    close(fd);
    temp_file = pattern;
}

extern "C" void tearDown(void) {
    unlink(temp_file.c_str());
}

static void writeFile(const std::string& path, const std::string& content) {
    FILE* file = fopen(path.c_str(), "wb");
    TEST_ASSERT_NOT_NULL(file);
    fwrite(content.data(), 1, content.size(), file);
    fclose(file);
}

static void test_defaults(void) {
    GatewayConfig config;
    TEST_ASSERT_EQUAL_UINT16(8000, config.websocket_port);
    TEST_ASSERT_EQUAL_UINT16(8001, config.http_port);
    TEST_ASSERT_EQUAL_STRING("mqtt://core-mosquitto:1883", config.brokerUri().c_str());
    TEST_ASSERT_EQUAL_STRING("sensecap_watcher", config.node_id.c_str());
    TEST_ASSERT_EQUAL_STRING("homeassistant", config.discovery_prefix.c_str());
    TEST_ASSERT_EQUAL_UINT32(60, config.monitoring_interval);
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 0.7f, config.confidence_threshold);
    TEST_ASSERT_EQUAL_STRING("/data/snapshots", config.snapshot_dir.c_str());
}

static void test_options_are_applied(void) {
    GatewayConfig config;
    TEST_ASSERT_EQUAL(ESP_OK, config.applyOptionsJson(
        "{\"mqtt_host\":\"broker.lan\",\"mqtt_port\":8883,\"mqtt_user\":\"watcher\","
        "\"ota_port\":9001,\"websocket_port\":9000,\"node_id\":\"porch\","
        "\"monitoring_interval\":120,\"confidence_threshold\":0.85,\"voice_assistant\":true,"
        "\"vision_url\":\"http://ollama.lan:11434\",\"custom_prompt\":\"Any parcels?\","
        "\"unknown_key\":42}"));

    TEST_ASSERT_EQUAL_STRING("mqtt://broker.lan:8883", config.brokerUri().c_str());
    TEST_ASSERT_EQUAL_STRING("watcher", config.mqtt_user.c_str());
    TEST_ASSERT_EQUAL_UINT16(9001, config.http_port);
    TEST_ASSERT_EQUAL_UINT16(9000, config.websocket_port);
    TEST_ASSERT_EQUAL_STRING("porch", config.node_id.c_str());
    TEST_ASSERT_EQUAL_UINT32(120, config.monitoring_interval);
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 0.85f, config.confidence_threshold);
    TEST_ASSERT_TRUE(config.voice_assistant);
    TEST_ASSERT_EQUAL_STRING("http://ollama.lan:11434", config.vision_url.c_str());
    TEST_ASSERT_EQUAL_STRING("Any parcels?", config.scenePrompt().c_str());
}

static void test_mqtt_url_wins_over_host_and_port(void) {
    GatewayConfig config;
    config.applyOptionsJson("{\"mqtt_url\":\"mqtts://secure.lan:8883\",\"mqtt_host\":\"ignored\"}");
    TEST_ASSERT_EQUAL_STRING("mqtts://secure.lan:8883", config.brokerUri().c_str());
}

static void test_wrong_types_keep_current_values(void) {
    GatewayConfig config;
    TEST_ASSERT_EQUAL(ESP_OK, config.applyOptionsJson(
        "{\"mqtt_host\":12,\"mqtt_port\":\"1883\",\"websocket_port\":70000,\"http_port\":0,"
        "\"monitoring_interval\":0,\"voice_assistant\":\"yes\",\"motion_threshold\":\"high\"}"));
    TEST_ASSERT_EQUAL_STRING("core-mosquitto", config.mqtt_host.c_str());
    TEST_ASSERT_EQUAL_UINT16(1883, config.mqtt_port);
    TEST_ASSERT_EQUAL_UINT16(8000, config.websocket_port);
    TEST_ASSERT_EQUAL_UINT16(8001, config.http_port);
    TEST_ASSERT_EQUAL_UINT32(60, config.monitoring_interval);
    TEST_ASSERT_FALSE(config.voice_assistant);
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 0.05f, config.motion_threshold);
}

static void test_confidence_out_of_range_is_reset(void) {
    GatewayConfig config;
    config.applyOptionsJson("{\"confidence_threshold\":75}");
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 0.7f, config.confidence_threshold);
    config.applyOptionsJson("{\"confidence_threshold\":-0.1}");
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 0.7f, config.confidence_threshold);
    config.applyOptionsJson("{\"confidence_threshold\":1}");
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 1.0f, config.confidence_threshold);
}

static void test_non_object_options_are_rejected(void) {
    GatewayConfig config;
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, config.applyOptionsJson("[]"));
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, config.applyOptionsJson("{broken"));
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, config.applyOptionsJson(""));
    TEST_ASSERT_EQUAL_STRING("core-mosquitto", config.mqtt_host.c_str());
}

static void test_options_file(void) {
    GatewayConfig config;
    writeFile(temp_file, "{\"node_id\":\"garage\",\"log_level\":\"debug\"}");
    TEST_ASSERT_EQUAL(ESP_OK, config.loadOptionsFile(temp_file));
    TEST_ASSERT_EQUAL_STRING("garage", config.node_id.c_str());
    TEST_ASSERT_TRUE(config.logLevel() == ESP_LOG_DEBUG);

    writeFile(temp_file, "not json");
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, config.loadOptionsFile(temp_file));
    TEST_ASSERT_EQUAL(ESP_ERR_NOT_FOUND, config.loadOptionsFile(temp_file + ".missing"));
    TEST_ASSERT_EQUAL_STRING("garage", config.node_id.c_str());
}

static void test_log_levels(void) {
    GatewayConfig config;
    TEST_ASSERT_TRUE(config.logLevel() == ESP_LOG_INFO);
    config.log_level = "warning";
    TEST_ASSERT_TRUE(config.logLevel() == ESP_LOG_WARN);
    config.log_level = "error";
    TEST_ASSERT_TRUE(config.logLevel() == ESP_LOG_ERROR);
    config.log_level = "verbose";
    TEST_ASSERT_TRUE(config.logLevel() == ESP_LOG_VERBOSE);
    config.log_level = "chatty";
    TEST_ASSERT_TRUE(config.logLevel() == ESP_LOG_INFO);
}

static void test_secrets_are_masked(void) {
    TEST_ASSERT_EQUAL_STRING("<unset>", GatewayConfig::maskSecret("").c_str());
    TEST_ASSERT_EQUAL_STRING("****", GatewayConfig::maskSecret("abcd").c_str());
    TEST_ASSERT_EQUAL_STRING("ey****Zz", GatewayConfig::maskSecret("eyJhbGciOiJIUzI1NiZz").c_str());

    GatewayConfig config;
    config.mqtt_password = "hunter2secret";
    config.ha_token = "eyJhbGciOiJIUzI1NiZz";
    std::string summary = config.summary();
    TEST_ASSERT_TRUE(summary.find("hunter2secret") == std::string::npos);
    TEST_ASSERT_TRUE(summary.find("eyJhbGciOiJIUzI1NiZz") == std::string::npos);
    TEST_ASSERT_TRUE(summary.find("mqtt_password=hu****et") != std::string::npos);
}

static void test_vision_ingest_url(void) {
    GatewayConfig config;
    config.host_ip = "10.0.0.5";
    config.http_port = 8101;
    TEST_ASSERT_EQUAL_STRING("http://10.0.0.5:8101/vision-ingest", config.visionIngestUrl().c_str());
}

extern "C" void app_main(void)
{
    UNITY_BEGIN();
    RUN_TEST(test_defaults);
    RUN_TEST(test_options_are_applied);
    RUN_TEST(test_mqtt_url_wins_over_host_and_port);
    RUN_TEST(test_wrong_types_keep_current_values);
    RUN_TEST(test_confidence_out_of_range_is_reset);
    RUN_TEST(test_non_object_options_are_rejected);
    RUN_TEST(test_options_file);
    RUN_TEST(test_log_levels);
    RUN_TEST(test_secrets_are_masked);
    RUN_TEST(test_vision_ingest_url);
    exit(UNITY_END());
}
