#include <tether/core/diagnostics.h>

#include <tether/core/config.h>

#include <iostream>
#include <sstream>

namespace tether::core {

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Debug:   return "debug";
        case Severity::Info:    return "info";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "unknown";
}

std::string format_diagnostic(const DiagnosticEvent& event) {
    std::ostringstream oss;
    oss << "[" << severity_name(event.severity) << "]";
    if (!event.module.empty()) {
        oss << " " << event.module;
    }
    if (!event.stage.empty()) {
        oss << "/" << event.stage;
    }
    if (event.correlation_id != 0) {
        oss << " (cid:" << event.correlation_id << ")";
    }
    oss << ": " << event.message;
    return oss.str();
}

DiagnosticObserver stderr_observer() {
    return [](const DiagnosticEvent& event) {
        static std::mutex cerr_mutex;
        std::lock_guard lock(cerr_mutex);
        std::cerr << format_diagnostic(event) << '\n';
    };
}

Logger::Logger(std::size_t max_retained)
    : max_retained_(max_retained) {}

Logger::Logger()
    : Logger(config::kMaxRetainedDiagnostics) {}

void Logger::emit(Severity severity, const std::string& module,
                  const std::string& stage, const std::string& message,
                  std::uint64_t correlation_id) {
    DiagnosticEvent event;
    event.timestamp = std::chrono::steady_clock::now();
    event.severity = severity;
    event.module = module;
    event.stage = stage;
    event.message = message;
    event.correlation_id = correlation_id;

    std::vector<DiagnosticObserver> observers;
    {
        std::lock_guard lock(mutex_);
        if (severity < min_severity_) {
            return;
        }
        events_.push_back(event);
        while (events_.size() > max_retained_) {
            events_.pop_front();
        }
        observers = observers_;
    }

    for (const auto& observer : observers) {
        observer(event);
    }
}

void Logger::set_min_severity(Severity min) {
    std::lock_guard lock(mutex_);
    min_severity_ = min;
}

Severity Logger::min_severity() const {
    std::lock_guard lock(mutex_);
    return min_severity_;
}

void Logger::add_observer(DiagnosticObserver observer) {
    std::lock_guard lock(mutex_);
    observers_.push_back(std::move(observer));
}

std::vector<DiagnosticEvent> Logger::events() const {
    std::lock_guard lock(mutex_);
    return {events_.begin(), events_.end()};
}

std::vector<DiagnosticEvent> Logger::events_by_severity(Severity severity) const {
    std::lock_guard lock(mutex_);
    std::vector<DiagnosticEvent> result;
    for (const auto& e : events_) {
        if (e.severity == severity) {
            result.push_back(e);
        }
    }
    return result;
}

std::vector<DiagnosticEvent> Logger::events_by_module(const std::string& module) const {
    std::lock_guard lock(mutex_);
    std::vector<DiagnosticEvent> result;
    for (const auto& e : events_) {
        if (e.module == module) {
            result.push_back(e);
        }
    }
    return result;
}

void Logger::clear() {
    std::lock_guard lock(mutex_);
    events_.clear();
}

std::size_t Logger::size() const {
    std::lock_guard lock(mutex_);
    return events_.size();
}

void FailureTrace::add_snapshot(const std::string& key, const std::string& value) {
    snapshots.push_back({key, value});
}

std::string FailureTrace::format() const {
    std::ostringstream oss;
    oss << "FailureTrace\n";
    oss << "  module: " << module << "\n";
    oss << "  stage: " << stage << "\n";
    oss << "  error: " << error_message << "\n";
    if (!snapshots.empty()) {
        oss << "  snapshots:\n";
        for (const auto& s : snapshots) {
            oss << "    " << s.key << "=" << s.value << "\n";
        }
    }
    if (!context_events.empty()) {
        oss << "  context_events: " << context_events.size() << "\n";
    }
    return oss.str();
}

FailureTrace capture_failure(const Logger& logger,
                             const std::string& module,
                             const std::string& stage,
                             const std::string& error_message) {
    FailureTrace trace;
    trace.module = module;
    trace.stage = stage;
    trace.error_message = error_message;
    trace.context_events = logger.events();
    return trace;
}

}  // namespace tether::core
