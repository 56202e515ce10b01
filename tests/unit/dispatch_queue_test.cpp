#include <tether/platform/dispatch_queue.h>

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace tether::platform;
using tether::core::ErrorCode;
using tether::core::FatalError;
using tether::core::Logger;
using tether::core::Severity;
using namespace std::chrono_literals;

// ---------------------------------------------------------------------------
// 1. Post task and run_pending executes it
// ---------------------------------------------------------------------------
TEST(DispatchQueueTest, PostTaskAndRunPendingExecutesIt) {
    Logger logger;
    DispatchQueue queue(logger);
    bool executed = false;

    ASSERT_TRUE(queue.post([&executed]() { executed = true; }).ok);
    EXPECT_EQ(queue.pending_count(), 1u);
    EXPECT_EQ(queue.run_pending(), 1u);

    EXPECT_TRUE(executed);
    EXPECT_EQ(queue.pending_count(), 0u);
}

// ---------------------------------------------------------------------------
// 2. Tasks execute in FIFO order
// ---------------------------------------------------------------------------
TEST(DispatchQueueTest, TasksExecuteInOrder) {
    Logger logger;
    DispatchQueue queue(logger);
    std::vector<int> order;

    for (int i = 0; i < 10; ++i) {
        queue.post([i, &order]() { order.push_back(i); });
    }
    queue.run_pending();

    ASSERT_EQ(order.size(), 10u);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(order[i], i);
    }
}

// ---------------------------------------------------------------------------
// 3. Tasks posted during run_pending wait for the next round
// ---------------------------------------------------------------------------
TEST(DispatchQueueTest, TasksPostedWhileDrainingRunNextRound) {
    Logger logger;
    DispatchQueue queue(logger);
    int count = 0;

    queue.post([&]() {
        ++count;
        queue.post([&count]() { ++count; });
    });

    EXPECT_EQ(queue.run_pending(), 1u);
    EXPECT_EQ(count, 1);
    EXPECT_EQ(queue.run_pending(), 1u);
    EXPECT_EQ(count, 2);
}

// ---------------------------------------------------------------------------
// 4. run() on a worker thread, quit() stops it
// ---------------------------------------------------------------------------
TEST(DispatchQueueTest, QuitStopsRun) {
    Logger logger;
    DispatchQueue queue(logger);
    std::atomic<int> executed{0};

    std::thread worker([&queue]() { queue.run(); });

    for (int i = 0; i < 5; ++i) {
        queue.post([&executed]() { ++executed; });
    }
    queue.post([&queue]() { queue.quit(); });

    worker.join();
    EXPECT_EQ(executed.load(), 5);
    EXPECT_TRUE(queue.is_closed());
    EXPECT_FALSE(queue.is_running());
}

// ---------------------------------------------------------------------------
// 5. Concurrent producers: every task runs exactly once, never concurrently
// ---------------------------------------------------------------------------
TEST(DispatchQueueTest, ConcurrentProducersSerializeOnWorker) {
    Logger logger;
    DispatchQueue queue(logger, 8);
    std::atomic<int> in_flight{0};
    std::atomic<bool> overlapped{false};
    int total = 0;

    std::thread worker([&queue]() { queue.run(); });

    std::vector<std::thread> producers;
    for (int p = 0; p < 4; ++p) {
        producers.emplace_back([&]() {
            for (int i = 0; i < 100; ++i) {
                queue.post([&]() {
                    if (in_flight.fetch_add(1) != 0) overlapped = true;
                    ++total;
                    in_flight.fetch_sub(1);
                });
            }
        });
    }
    for (auto& t : producers) {
        t.join();
    }

    queue.post([&queue]() { queue.quit(); });
    worker.join();

    EXPECT_EQ(total, 400);
    EXPECT_FALSE(overlapped.load());
}

// ---------------------------------------------------------------------------
// 6. Ordering across producers: an earlier task's mutation is visible later
// ---------------------------------------------------------------------------
TEST(DispatchQueueTest, EarlierTaskMutationVisibleToLaterTask) {
    Logger logger;
    DispatchQueue queue(logger);
    std::vector<std::string> state;
    std::vector<std::string> observed;

    std::thread h1([&]() { queue.post([&]() { state.push_back("h1"); }, "h1"); });
    h1.join();
    std::thread h2([&]() { queue.post([&]() { observed = state; }, "h2"); });
    h2.join();

    queue.run_pending();
    ASSERT_EQ(observed.size(), 1u);
    EXPECT_EQ(observed[0], "h1");
}

// ---------------------------------------------------------------------------
// 7. Bounded capacity: producers block while full
// ---------------------------------------------------------------------------
TEST(DispatchQueueTest, PostBlocksWhileFull) {
    Logger logger;
    DispatchQueue queue(logger, 2);
    queue.post([]() {});
    queue.post([]() {});

    std::atomic<bool> posted{false};
    std::thread producer([&]() {
        queue.post([]() {});
        posted = true;
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(posted.load());

    queue.run_pending();
    producer.join();
    EXPECT_TRUE(posted.load());
    EXPECT_EQ(queue.pending_count(), 1u);
}

TEST(DispatchQueueTest, WorkerMayPostPastCapacity) {
    Logger logger;
    DispatchQueue queue(logger, 1);
    int count = 0;

    queue.post([&]() {
        for (int i = 0; i < 3; ++i) {
            ASSERT_TRUE(queue.post([&count]() { ++count; }).ok);
        }
    });

    queue.run_pending();
    EXPECT_EQ(queue.pending_count(), 3u);
    queue.run_pending();
    EXPECT_EQ(count, 3);
}

TEST(DispatchQueueTest, ZeroCapacityMeansOne) {
    Logger logger;
    DispatchQueue queue(logger, 0);
    EXPECT_EQ(queue.capacity(), 1u);
}

// ---------------------------------------------------------------------------
// 8. Worker boundary: ordinary exceptions are isolated
// ---------------------------------------------------------------------------
TEST(DispatchQueueTest, ThrowingTaskDoesNotStopWorker) {
    Logger logger;
    DispatchQueue queue(logger);
    bool later_ran = false;

    queue.post([]() { throw std::runtime_error("handler bug"); }, "/window/move");
    queue.post([&later_ran]() { later_ran = true; });

    EXPECT_EQ(queue.run_pending(), 2u);
    EXPECT_TRUE(later_ran);
    EXPECT_FALSE(queue.is_closed());
    EXPECT_FALSE(queue.fatal_report().has_value());

    auto errors = logger.events_by_severity(Severity::Error);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].module, "dispatch");
    EXPECT_EQ(errors[0].stage, "/window/move");
}

TEST(DispatchQueueTest, NonStandardThrowDoesNotStopWorker) {
    Logger logger;
    DispatchQueue queue(logger);
    int ran = 0;

    queue.post([]() { throw 42; }, "/menu/click");
    queue.post([&ran]() { ++ran; });

    EXPECT_EQ(queue.run_pending(), 2u);
    EXPECT_EQ(ran, 1);
    EXPECT_FALSE(queue.is_closed());

    auto errors = logger.events_by_severity(Severity::Error);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].module, "dispatch");
    EXPECT_EQ(errors[0].stage, "/menu/click");
    EXPECT_EQ(errors[0].message, "task raised an unknown exception");
}

// ---------------------------------------------------------------------------
// 9. Worker boundary: FatalError shuts the queue down with a report
// ---------------------------------------------------------------------------
TEST(DispatchQueueTest, FatalErrorClosesQueueWithReport) {
    Logger logger;
    DispatchQueue queue(logger);
    bool later_ran = false;

    queue.post([]() { throw FatalError("menu bar construction failed"); }, "/driver/run");
    queue.post([&later_ran]() { later_ran = true; });

    std::thread worker([&queue]() { queue.run(); });
    worker.join();

    EXPECT_FALSE(later_ran);
    EXPECT_TRUE(queue.is_closed());

    auto report = queue.fatal_report();
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->module, "dispatch");
    EXPECT_EQ(report->stage, "/driver/run");
    EXPECT_EQ(report->error_message, "menu bar construction failed");
    ASSERT_EQ(report->snapshots.size(), 1u);
    EXPECT_EQ(report->snapshots[0].key, "pending");
    EXPECT_EQ(report->snapshots[0].value, "1");
}

// ---------------------------------------------------------------------------
// 10. Closed queue
// ---------------------------------------------------------------------------
TEST(DispatchQueueTest, PostAfterQuitFailsWithShutdown) {
    Logger logger;
    DispatchQueue queue(logger);
    queue.quit();

    auto status = queue.post([]() {});
    EXPECT_FALSE(status.ok);
    EXPECT_EQ(status.code, ErrorCode::Shutdown);
    EXPECT_EQ(queue.run_pending(), 0u);
}

TEST(DispatchQueueTest, QuitAbandonsQueuedTasks) {
    Logger logger;
    DispatchQueue queue(logger);
    auto token = std::make_shared<int>(1);
    std::weak_ptr<int> watch = token;

    queue.post([token]() {});
    token.reset();
    EXPECT_FALSE(watch.expired());

    queue.quit();
    EXPECT_TRUE(watch.expired());
    EXPECT_EQ(queue.pending_count(), 0u);
    EXPECT_EQ(logger.events_by_severity(Severity::Warning).size(), 1u);
}

TEST(DispatchQueueTest, QuitWakesBlockedProducer) {
    Logger logger;
    DispatchQueue queue(logger, 1);
    queue.post([]() {});

    tether::core::Status status;
    std::thread producer([&]() { status = queue.post([]() {}); });

    std::this_thread::sleep_for(20ms);
    queue.quit();
    producer.join();
    EXPECT_EQ(status.code, ErrorCode::Shutdown);
}

// ---------------------------------------------------------------------------
// 11. Worker identity
// ---------------------------------------------------------------------------
TEST(DispatchQueueTest, IsWorkerThreadOnlyInsideTasks) {
    Logger logger;
    DispatchQueue queue(logger);
    bool inside = false;

    EXPECT_FALSE(queue.is_worker_thread());
    queue.post([&]() { inside = queue.is_worker_thread(); });
    queue.run_pending();

    EXPECT_TRUE(inside);
    EXPECT_FALSE(queue.is_worker_thread());
}
