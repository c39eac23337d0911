#include <cstdlib>
#include <memory>
#include <string>
#include "unity.h"
#include "ws_reassembler.hpp"

static const size_t LIMIT = 64;

static std::unique_ptr<WsReassembler> reassembler;

extern "C" void setUp(void) {
    reassembler.reset(new WsReassembler(LIMIT));
}

extern "C" void tearDown(void) {
    reassembler.reset();
}

static WsReassembler::Result push(int fd, WsReassembler::FrameKind kind, bool final, const std::string& data,
                                  WsReassembler::Message& message) {
    return reassembler->push(fd, kind, final, (const uint8_t*)data.data(), data.size(), message);
}

static void test_single_frame_message(void) {
    WsReassembler::Message message;
    TEST_ASSERT_TRUE(push(3, WsReassembler::FrameKind::TEXT, true, "{\"type\":\"hello\"}", message) ==
                     WsReassembler::Result::COMPLETE);
    TEST_ASSERT_TRUE(message.text);
    TEST_ASSERT_EQUAL_STRING("{\"type\":\"hello\"}", message.data.c_str());
    TEST_ASSERT_EQUAL(0, reassembler->pendingSockets());
}

static void test_interleaved_sockets_keep_their_own_fragments(void) {
    WsReassembler::Message message;
    TEST_ASSERT_TRUE(push(3, WsReassembler::FrameKind::TEXT, false, "abc", message) ==
                     WsReassembler::Result::PARTIAL);
    TEST_ASSERT_TRUE(push(4, WsReassembler::FrameKind::BINARY, false, "0123", message) ==
                     WsReassembler::Result::PARTIAL);
    TEST_ASSERT_EQUAL(2, reassembler->pendingSockets());

    TEST_ASSERT_TRUE(push(3, WsReassembler::FrameKind::CONTINUATION, true, "def", message) ==
                     WsReassembler::Result::COMPLETE);
    TEST_ASSERT_TRUE(message.text);
    TEST_ASSERT_EQUAL_STRING("abcdef", message.data.c_str());

    TEST_ASSERT_TRUE(push(4, WsReassembler::FrameKind::CONTINUATION, false, "45", message) ==
                     WsReassembler::Result::PARTIAL);
    TEST_ASSERT_TRUE(push(4, WsReassembler::FrameKind::CONTINUATION, true, "67", message) ==
                     WsReassembler::Result::COMPLETE);
    TEST_ASSERT_FALSE(message.text);
    TEST_ASSERT_EQUAL_STRING("01234567", message.data.c_str());
    TEST_ASSERT_EQUAL(0, reassembler->pendingSockets());
}

static void test_new_message_replaces_unfinished_one(void) {
    WsReassembler::Message message;
    push(3, WsReassembler::FrameKind::TEXT, false, "stale", message);
    TEST_ASSERT_TRUE(push(3, WsReassembler::FrameKind::TEXT, true, "fresh", message) ==
                     WsReassembler::Result::COMPLETE);
    TEST_ASSERT_EQUAL_STRING("fresh", message.data.c_str());
}

static void test_continuation_without_start_is_rejected(void) {
    WsReassembler::Message message;
    TEST_ASSERT_TRUE(push(5, WsReassembler::FrameKind::CONTINUATION, true, "orphan", message) ==
                     WsReassembler::Result::UNEXPECTED);
    TEST_ASSERT_EQUAL(0, reassembler->pendingSockets());
}

static void test_oversized_message_is_dropped(void) {
    WsReassembler::Message message;
    std::string half(40, 'x');
    TEST_ASSERT_TRUE(reassembler->fits(3, half.size()));
    TEST_ASSERT_TRUE(push(3, WsReassembler::FrameKind::TEXT, false, half, message) ==
                     WsReassembler::Result::PARTIAL);
    TEST_ASSERT_FALSE(reassembler->fits(3, half.size()));
    // Another socket has its own budget
    TEST_ASSERT_TRUE(reassembler->fits(4, half.size()));

    TEST_ASSERT_TRUE(push(3, WsReassembler::FrameKind::CONTINUATION, true, half, message) ==
                     WsReassembler::Result::TOO_LARGE);
    TEST_ASSERT_EQUAL(0, reassembler->pendingSockets());
}

static void test_closed_socket_forgets_partial(void) {
    WsReassembler::Message message;
    push(3, WsReassembler::FrameKind::TEXT, false, "half", message);
    reassembler->reset(3);
    TEST_ASSERT_EQUAL(0, reassembler->pendingSockets());

    // A new connection on the same socket number starts clean
    TEST_ASSERT_TRUE(push(3, WsReassembler::FrameKind::CONTINUATION, true, "rest", message) ==
                     WsReassembler::Result::UNEXPECTED);
}

extern "C" void app_main(void)
{
    UNITY_BEGIN();
    RUN_TEST(test_single_frame_message);
    RUN_TEST(test_interleaved_sockets_keep_their_own_fragments);
    RUN_TEST(test_new_message_replaces_unfinished_one);
    RUN_TEST(test_continuation_without_start_is_rejected);
    RUN_TEST(test_oversized_message_is_dropped);
    RUN_TEST(test_closed_socket_forgets_partial);
    exit(UNITY_END());
}
