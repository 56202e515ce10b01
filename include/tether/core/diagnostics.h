#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace tether::core {

enum class Severity {
    Debug,
    Info,
    Warning,
    Error,
};

struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string module;
    std::string stage;
    std::string message;
    std::uint64_t correlation_id = 0;
};

const char* severity_name(Severity severity);

std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Writes every event to standard error.
DiagnosticObserver stderr_observer();

// Thread-safe event sink shared by every module of a driver. Observers run
// on the emitting thread, outside the logger lock.
class Logger {
public:
    explicit Logger(std::size_t max_retained);
    Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void emit(Severity severity, const std::string& module,
              const std::string& stage, const std::string& message,
              std::uint64_t correlation_id = 0);

    void set_min_severity(Severity min);
    Severity min_severity() const;

    void add_observer(DiagnosticObserver observer);

    std::vector<DiagnosticEvent> events() const;
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_by_module(const std::string& module) const;

    void clear();
    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::deque<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    std::size_t max_retained_;
    Severity min_severity_ = Severity::Info;
};

struct FailureSnapshot {
    std::string key;
    std::string value;
};

// Structured report of a fault, with the events leading up to it.
struct FailureTrace {
    std::string module;
    std::string stage;
    std::string error_message;
    std::vector<DiagnosticEvent> context_events;
    std::vector<FailureSnapshot> snapshots;

    void add_snapshot(const std::string& key, const std::string& value);
    std::string format() const;
};

FailureTrace capture_failure(const Logger& logger,
                             const std::string& module,
                             const std::string& stage,
                             const std::string& error_message);

}  // namespace tether::core
