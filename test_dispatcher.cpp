#include <atomic>
#include <cstdlib>
#include <memory>
#include <vector>
#include "unity.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "dispatcher.hpp"
#include "task_manager.hpp"

struct DispatcherFixture {
    TaskManager tasks;
    Dispatcher dispatcher;
};

static std::unique_ptr<DispatcherFixture> fx;

static Dispatcher::DispatcherConfig testConfig(uint32_t queue_length) {
    Dispatcher::DispatcherConfig config;
    config.task_name = "test_main";
    config.queue_length = queue_length;
    config.stack_size = 32768;
    config.post_timeout_ms = 20;
    return config;
}

extern "C" void setUp(void) {
    fx.reset(new DispatcherFixture());
}

extern "C" void tearDown(void) {
    fx.reset();
}

static bool waitFor(const std::atomic<int>& counter, int expected, uint32_t timeout_ms) {
    for (uint32_t waited = 0; waited < timeout_ms; waited += 10) {
        if (counter.load() >= expected) {
            return true;
        }
        vTaskDelay(pdMS_TO_TICKS(10));
    }
    return counter.load() >= expected;
}

static void test_posted_jobs_run_in_order(void) {
    TEST_ASSERT_EQUAL(ESP_OK, fx->dispatcher.start(fx->tasks, testConfig(8)));
    TEST_ASSERT_TRUE(fx->dispatcher.isRunning());

    std::vector<int> order;
    std::atomic<int> done(0);
    for (int i = 0; i < 3; i++) {
        TEST_ASSERT_EQUAL(ESP_OK, fx->dispatcher.post([&order, &done, i]() {
            order.push_back(i);
            done++;
        }));
    }

    TEST_ASSERT_TRUE(waitFor(done, 3, 1000));
    TEST_ASSERT_EQUAL(3, order.size());
    TEST_ASSERT_EQUAL(0, order[0]);
    TEST_ASSERT_EQUAL(1, order[1]);
    TEST_ASSERT_EQUAL(2, order[2]);
}

static void test_delayed_job_runs_after_its_delay(void) {
    TEST_ASSERT_EQUAL(ESP_OK, fx->dispatcher.start(fx->tasks, testConfig(8)));

    std::atomic<int> done(0);
    TEST_ASSERT_EQUAL(ESP_OK, fx->dispatcher.postDelayed(100, [&done]() { done++; }));
    TEST_ASSERT_EQUAL(1, fx->dispatcher.pendingTimers());
    TEST_ASSERT_EQUAL(0, done.load());

    TEST_ASSERT_TRUE(waitFor(done, 1, 1000));
    TEST_ASSERT_EQUAL(0, fx->dispatcher.pendingTimers());
}

static void test_stop_cancels_pending_delayed_jobs(void) {
    TEST_ASSERT_EQUAL(ESP_OK, fx->dispatcher.start(fx->tasks, testConfig(8)));

    std::atomic<int> done(0);
    TEST_ASSERT_EQUAL(ESP_OK, fx->dispatcher.postDelayed(200, [&done]() { done++; }));
    TEST_ASSERT_EQUAL(ESP_OK, fx->dispatcher.postDelayed(250, [&done]() { done++; }));
    TEST_ASSERT_EQUAL(2, fx->dispatcher.pendingTimers());

    TEST_ASSERT_EQUAL(ESP_OK, fx->dispatcher.stop(1000));
    TEST_ASSERT_FALSE(fx->dispatcher.isRunning());
    TEST_ASSERT_EQUAL(0, fx->dispatcher.pendingTimers());

    // Well past both deadlines
    vTaskDelay(pdMS_TO_TICKS(500));
    TEST_ASSERT_EQUAL(0, done.load());
}

static void test_stop_runs_jobs_already_queued(void) {
    TEST_ASSERT_EQUAL(ESP_OK, fx->dispatcher.start(fx->tasks, testConfig(8)));

    std::atomic<int> done(0);
    TEST_ASSERT_EQUAL(ESP_OK, fx->dispatcher.post([&done]() {
        vTaskDelay(pdMS_TO_TICKS(50));
        done++;
    }));
    TEST_ASSERT_EQUAL(ESP_OK, fx->dispatcher.post([&done]() { done++; }));

    TEST_ASSERT_EQUAL(ESP_OK, fx->dispatcher.stop(1000));
    TEST_ASSERT_EQUAL(2, done.load());
}

static void test_posts_after_stop_are_refused(void) {
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_STATE, fx->dispatcher.post([]() {}));

    TEST_ASSERT_EQUAL(ESP_OK, fx->dispatcher.start(fx->tasks, testConfig(8)));
    TEST_ASSERT_EQUAL(ESP_OK, fx->dispatcher.stop(1000));

    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_STATE, fx->dispatcher.post([]() {}));
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_STATE, fx->dispatcher.postWait([]() {}));
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_STATE, fx->dispatcher.postDelayed(10, []() {}));
    TEST_ASSERT_EQUAL(0, fx->dispatcher.pendingTimers());
}

static void test_post_wait_outlasts_a_full_queue(void) {
    TEST_ASSERT_EQUAL(ESP_OK, fx->dispatcher.start(fx->tasks, testConfig(1)));

    std::atomic<int> release(0);
    std::atomic<int> done(0);

    // Holds the task so the single queue slot stays taken
    TEST_ASSERT_EQUAL(ESP_OK, fx->dispatcher.post([&release, &done]() {
        while (release.load() == 0) {
            vTaskDelay(pdMS_TO_TICKS(10));
        }
        done++;
    }));
    vTaskDelay(pdMS_TO_TICKS(50));
    TEST_ASSERT_EQUAL(ESP_OK, fx->dispatcher.post([&done]() { done++; }));

    TEST_ASSERT_EQUAL(ESP_ERR_TIMEOUT, fx->dispatcher.post([&done]() { done += 100; }));

    TEST_ASSERT_EQUAL(ESP_OK, fx->tasks.createTask("test_release", [&release]() {
        vTaskDelay(pdMS_TO_TICKS(200));
        release++;
    }, 16384, 5));

    TEST_ASSERT_EQUAL(ESP_OK, fx->dispatcher.postWait([&done]() { done++; }));
    TEST_ASSERT_TRUE(waitFor(done, 3, 1000));
    TEST_ASSERT_EQUAL(3, done.load());
}

extern "C" void app_main(void)
{
    UNITY_BEGIN();
    RUN_TEST(test_posted_jobs_run_in_order);
    RUN_TEST(test_delayed_job_runs_after_its_delay);
    RUN_TEST(test_stop_cancels_pending_delayed_jobs);
    RUN_TEST(test_stop_runs_jobs_already_queued);
    RUN_TEST(test_posts_after_stop_are_refused);
    RUN_TEST(test_post_wait_outlasts_a_full_queue);
    exit(UNITY_END());
}
