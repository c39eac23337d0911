#include <cstdlib>
#include <string>
#include "unity.h"
#include "cJSON.h"
#include "handshake_logic.hpp"

static const char* CONTENT_TYPE = "multipart/form-data; boundary=----WatcherBoundary42";

extern "C" void setUp(void) {
}

extern "C" void tearDown(void) {
}

static std::string part(const std::string& headers, const std::string& content) {
    return "------WatcherBoundary42\r\n" + headers + "\r\n\r\n" + content + "\r\n";
}

static std::string closing() {
    return "------WatcherBoundary42--\r\n";
}

static void test_mac_is_normalized(void) {
    TEST_ASSERT_EQUAL_STRING("a1b2c3d4e5f6", HandshakeLogic::normalizeMac("A1:B2:C3:D4:E5:F6").c_str());
    TEST_ASSERT_EQUAL_STRING("a1b2c3d4e5f6", HandshakeLogic::normalizeMac("a1-b2-c3-d4-e5-f6").c_str());
    TEST_ASSERT_EQUAL_STRING("unknown", HandshakeLogic::normalizeMac("").c_str());
    TEST_ASSERT_EQUAL_STRING("unknown", HandshakeLogic::normalizeMac("unknown").c_str());
}

static void test_host_header_loses_port(void) {
    TEST_ASSERT_EQUAL_STRING("192.168.1.10", HandshakeLogic::hostFromHeader("192.168.1.10:8001").c_str());
    TEST_ASSERT_EQUAL_STRING("gateway.local", HandshakeLogic::hostFromHeader("gateway.local").c_str());
    TEST_ASSERT_EQUAL_STRING("[fe80::1]", HandshakeLogic::hostFromHeader("[fe80::1]:8001").c_str());
    TEST_ASSERT_EQUAL_STRING("", HandshakeLogic::hostFromHeader("").c_str());
}

static void test_checkin_response_points_at_websocket(void) {
    CheckinInfo info;
    std::string body = "{\"mac_address\":\"AA:BB:CC:00:11:22\",\"application\":{\"version\":\"1.4.2\"},"
                       "\"board\":{\"ip\":\"192.168.1.77\"}}";
    std::string response = HandshakeLogic::buildCheckinResponse(body, "192.168.1.20:8001", 8000,
                                                                1700000000123LL, info);

    TEST_ASSERT_EQUAL_STRING("aabbcc001122", info.mac.c_str());
    TEST_ASSERT_EQUAL_STRING("1.4.2", info.version.c_str());
    TEST_ASSERT_EQUAL_STRING("192.168.1.77", info.device_ip.c_str());

    cJSON* root = cJSON_Parse(response.c_str());
    TEST_ASSERT_NOT_NULL(root);
    cJSON* websocket = cJSON_GetObjectItem(root, "websocket");
    TEST_ASSERT_EQUAL_STRING("ws://192.168.1.20:8000/ws", cJSON_GetObjectItem(websocket, "url")->valuestring);
    cJSON* server_time = cJSON_GetObjectItem(root, "server_time");
    TEST_ASSERT_TRUE(cJSON_GetObjectItem(server_time, "timestamp")->valuedouble == 1700000000123.0);
    TEST_ASSERT_EQUAL(0, cJSON_GetObjectItem(server_time, "timezone_offset")->valueint);
    TEST_ASSERT_TRUE(cJSON_IsObject(cJSON_GetObjectItem(root, "firmware")));
    cJSON_Delete(root);
}

static void test_checkin_tolerates_bad_body_and_missing_host(void) {
    CheckinInfo info;
    std::string response = HandshakeLogic::buildCheckinResponse("{not json", "", 8000, 0, info);
    TEST_ASSERT_EQUAL_STRING("unknown", info.mac.c_str());
    TEST_ASSERT_EQUAL_STRING("unknown", info.version.c_str());
    TEST_ASSERT_TRUE(info.device_ip.empty());

    cJSON* root = cJSON_Parse(response.c_str());
    cJSON* websocket = cJSON_GetObjectItem(root, "websocket");
    TEST_ASSERT_EQUAL_STRING("ws://localhost:8000/ws", cJSON_GetObjectItem(websocket, "url")->valuestring);
    cJSON_Delete(root);
}

static void test_small_json_documents(void) {
    cJSON* version = cJSON_Parse(HandshakeLogic::versionJson().c_str());
    TEST_ASSERT_EQUAL_STRING("1.0.0", cJSON_GetObjectItem(version, "version")->valuestring);
    cJSON_Delete(version);

    cJSON* error = cJSON_Parse(HandshakeLogic::errorJson("No image provided").c_str());
    TEST_ASSERT_EQUAL_STRING("No image provided", cJSON_GetObjectItem(error, "error")->valuestring);
    cJSON_Delete(error);

    cJSON* ingest = cJSON_Parse(HandshakeLogic::ingestReplyJson(true, "A cat \"napping\"").c_str());
    TEST_ASSERT_TRUE(cJSON_IsTrue(cJSON_GetObjectItem(ingest, "success")));
    TEST_ASSERT_EQUAL_STRING("A cat \"napping\"", cJSON_GetObjectItem(ingest, "message")->valuestring);
    cJSON_Delete(ingest);
}

static void test_boundary_extraction(void) {
    std::string boundary;
    TEST_ASSERT_TRUE(HandshakeLogic::extractBoundary(CONTENT_TYPE, boundary));
    TEST_ASSERT_EQUAL_STRING("----WatcherBoundary42", boundary.c_str());

    TEST_ASSERT_TRUE(HandshakeLogic::extractBoundary("Multipart/Form-Data; charset=utf-8; boundary=\"abc def\"",
                                                     boundary));
    TEST_ASSERT_EQUAL_STRING("abc def", boundary.c_str());

    TEST_ASSERT_FALSE(HandshakeLogic::extractBoundary("application/json", boundary));
    TEST_ASSERT_FALSE(HandshakeLogic::extractBoundary("multipart/form-data", boundary));
}

static void test_multipart_with_image_and_question(void) {
    static const char raw[] = "\xFF\xD8\xFF\xE0\r\n--not-a-boundary\x00\x01\xFF\xD9";
    std::string jpeg(raw, sizeof(raw) - 1);
    std::string body = part("Content-Disposition: form-data; name=\"file\"; filename=\"frame.jpg\"\r\n"
                            "Content-Type: image/jpeg", jpeg)
                     + part("Content-Disposition: form-data; name=\"question\"", "Is the door open?")
                     + closing();

    MultipartForm form;
    TEST_ASSERT_TRUE(HandshakeLogic::parseMultipart(body, CONTENT_TYPE, form));
    TEST_ASSERT_EQUAL(jpeg.size(), form.image.size());
    TEST_ASSERT_EQUAL_MEMORY(jpeg.data(), form.image.data(), jpeg.size());
    TEST_ASSERT_EQUAL_STRING("Is the door open?", form.question.c_str());
}

static void test_multipart_image_by_filename_and_default_question(void) {
    std::string body = part("Content-Disposition: form-data; name=\"upload\"; filename=\"x.jpg\"", "JPEGDATA")
                     + closing();

    MultipartForm form;
    TEST_ASSERT_TRUE(HandshakeLogic::parseMultipart(body, CONTENT_TYPE, form));
    TEST_ASSERT_EQUAL(8, form.image.size());
    TEST_ASSERT_EQUAL_STRING("What do you see?", form.question.c_str());
}

static void test_multipart_without_image(void) {
    std::string body = part("Content-Disposition: form-data; name=\"question\"", "Anyone there?") + closing();

    MultipartForm form;
    TEST_ASSERT_TRUE(HandshakeLogic::parseMultipart(body, CONTENT_TYPE, form));
    TEST_ASSERT_TRUE(form.image.empty());
}

static void test_multipart_rejects_malformed_bodies(void) {
    MultipartForm form;
    TEST_ASSERT_FALSE(HandshakeLogic::parseMultipart("whatever", "application/octet-stream", form));
    TEST_ASSERT_FALSE(HandshakeLogic::parseMultipart("no delimiter here", CONTENT_TYPE, form));
    TEST_ASSERT_FALSE(HandshakeLogic::parseMultipart(closing(), CONTENT_TYPE, form));

    // Part that never terminates
    std::string truncated = "------WatcherBoundary42\r\nContent-Disposition: form-data; name=\"file\"\r\n\r\nJPEG";
    TEST_ASSERT_FALSE(HandshakeLogic::parseMultipart(truncated, CONTENT_TYPE, form));

    // Headers that never end
    std::string no_headers_end = "------WatcherBoundary42\r\nContent-Disposition: form-data; name=\"file\"";
    TEST_ASSERT_FALSE(HandshakeLogic::parseMultipart(no_headers_end, CONTENT_TYPE, form));
}

extern "C" void app_main(void)
{
    UNITY_BEGIN();
    RUN_TEST(test_mac_is_normalized);
    RUN_TEST(test_host_header_loses_port);
    RUN_TEST(test_checkin_response_points_at_websocket);
    RUN_TEST(test_checkin_tolerates_bad_body_and_missing_host);
    RUN_TEST(test_small_json_documents);
    RUN_TEST(test_boundary_extraction);
    RUN_TEST(test_multipart_with_image_and_question);
    RUN_TEST(test_multipart_image_by_filename_and_default_question);
    RUN_TEST(test_multipart_without_image);
    RUN_TEST(test_multipart_rejects_malformed_bodies);
    exit(UNITY_END());
}
