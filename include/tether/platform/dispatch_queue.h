#pragma once
#include <tether/core/config.h>
#include <tether/core/diagnostics.h>
#include <tether/core/status.h>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace tether::platform {

// Bounded single-consumer FIFO. The thread inside run() (or run_pending())
// is the only one executing tasks, so tasks never run concurrently.
class DispatchQueue {
public:
    using Task = std::function<void()>;

    explicit DispatchQueue(core::Logger& logger,
                           std::size_t capacity = core::config::kDefaultQueueCapacity);
    ~DispatchQueue();

    // Non-copyable, non-movable
    DispatchQueue(const DispatchQueue&) = delete;
    DispatchQueue& operator=(const DispatchQueue&) = delete;

    // Append a task. Safe from any thread; blocks while the queue is full
    // unless called from the worker. Fails with Shutdown once closed.
    core::Status post(Task task, std::string label = {});

    // Drain tasks on the calling thread until quit() or a fatal fault
    void run();

    // Run the tasks queued at the time of the call and return
    std::size_t run_pending();

    // Close the queue, abandon queued tasks and wake the worker
    void quit();

    bool is_running() const;
    bool is_closed() const;
    bool is_worker_thread() const;
    std::size_t pending_count() const;
    std::size_t capacity() const { return capacity_; }

    // Set when a task raised core::FatalError
    std::optional<core::FailureTrace> fatal_report() const;

private:
    struct Entry {
        std::string label;
        Task task;
    };

    // Returns false when the worker must stop.
    bool execute(Entry& entry);

    core::Logger& logger_;
    const std::size_t capacity_;
    std::deque<Entry> entries_;
    mutable std::mutex mutex_;
    std::condition_variable ready_cv_;
    std::condition_variable space_cv_;
    std::atomic<bool> running_{false};
    std::atomic<bool> closed_{false};
    std::atomic<std::thread::id> worker_id_{};
    std::optional<core::FailureTrace> fatal_report_;
};

} // namespace tether::platform
