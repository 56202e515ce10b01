#include <tether/platform/dispatch_queue.h>

#include <exception>
#include <utility>

namespace tether::platform {

namespace {

constexpr const char kModule[] = "dispatch";

} // anonymous namespace

DispatchQueue::DispatchQueue(core::Logger& logger, std::size_t capacity)
    : logger_(logger), capacity_(capacity == 0 ? 1 : capacity) {}

DispatchQueue::~DispatchQueue() {
    quit();
}

core::Status DispatchQueue::post(Task task, std::string label) {
    {
        std::unique_lock lock(mutex_);
        if (!is_worker_thread()) {
            space_cv_.wait(lock, [this]() {
                return closed_.load() || entries_.size() < capacity_;
            });
        }
        if (closed_.load()) {
            return core::Status::failure(core::ErrorCode::Shutdown,
                                         "dispatch queue is closed");
        }
        entries_.push_back(Entry{std::move(label), std::move(task)});
    }
    ready_cv_.notify_one();
    return core::Status::success();
}

void DispatchQueue::run() {
    running_.store(true);
    worker_id_.store(std::this_thread::get_id());

    while (true) {
        Entry entry;
        {
            std::unique_lock lock(mutex_);
            ready_cv_.wait(lock, [this]() {
                return !entries_.empty() || closed_.load();
            });
            if (closed_.load()) {
                break;
            }
            entry = std::move(entries_.front());
            entries_.pop_front();
        }
        space_cv_.notify_one();

        if (!execute(entry)) {
            break;
        }
    }

    worker_id_.store(std::thread::id{});
    running_.store(false);
}

std::size_t DispatchQueue::run_pending() {
    std::deque<Entry> batch;
    {
        std::lock_guard lock(mutex_);
        if (closed_.load()) {
            return 0;
        }
        batch.swap(entries_);
    }
    space_cv_.notify_all();

    auto previous = worker_id_.exchange(std::this_thread::get_id());
    std::size_t executed = 0;
    for (auto& entry : batch) {
        ++executed;
        if (!execute(entry)) {
            break;
        }
    }
    worker_id_.store(previous);
    return executed;
}

bool DispatchQueue::execute(Entry& entry) {
    try {
        entry.task();
        return true;
    } catch (const core::FatalError& e) {
        auto trace = core::capture_failure(logger_, kModule, entry.label, e.what());
        trace.add_snapshot("pending", std::to_string(pending_count()));
        logger_.emit(core::Severity::Error, kModule, entry.label,
                     std::string("fatal fault, shutting down: ") + e.what());
        {
            std::lock_guard lock(mutex_);
            fatal_report_ = std::move(trace);
        }
        quit();
        return false;
    } catch (const std::exception& e) {
        logger_.emit(core::Severity::Error, kModule, entry.label,
                     std::string("task raised: ") + e.what());
        return true;
    } catch (...) {
        logger_.emit(core::Severity::Error, kModule, entry.label,
                     "task raised an unknown exception");
        return true;
    }
}

void DispatchQueue::quit() {
    std::deque<Entry> abandoned;
    {
        std::lock_guard lock(mutex_);
        closed_.store(true);
        abandoned.swap(entries_);
    }
    ready_cv_.notify_all();
    space_cv_.notify_all();

    if (!abandoned.empty()) {
        logger_.emit(core::Severity::Warning, kModule, "quit",
                     "abandoned " + std::to_string(abandoned.size()) + " queued task(s)");
    }
    // abandoned entries are destroyed here, outside the lock, releasing any
    // synchronous caller waiting on them
}

bool DispatchQueue::is_running() const {
    return running_.load();
}

bool DispatchQueue::is_closed() const {
    return closed_.load();
}

bool DispatchQueue::is_worker_thread() const {
    return worker_id_.load() == std::this_thread::get_id();
}

std::size_t DispatchQueue::pending_count() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

std::optional<core::FailureTrace> DispatchQueue::fatal_report() const {
    std::lock_guard lock(mutex_);
    return fatal_report_;
}

} // namespace tether::platform
