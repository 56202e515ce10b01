#pragma once
#include <tether/bridge/payload.h>
#include <tether/bridge/reply.h>
#include <tether/core/diagnostics.h>
#include <tether/core/status.h>
#include <tether/platform/dispatch_queue.h>
#include <tether/url/url.h>

#include <functional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace tether::bridge {

// Receives native requests and runs the handler registered for their path
// on the dispatch queue worker.
class AppBridge {
public:
    using Handler = std::function<Reply(const url::URL& origin, const Payload& payload)>;

    AppBridge(platform::DispatchQueue& queue, core::Logger& logger);

    AppBridge(const AppBridge&) = delete;
    AppBridge& operator=(const AppBridge&) = delete;

    // Register a handler for an exact, query-free path such as
    // "/window/move". A path can be registered once.
    core::Status handle(std::string path, Handler handler);

    // Native entry point. Returns an encoded reply envelope. The handler is
    // queued and an empty success reply returns at once, unless the path
    // carries reply=sync: the call then waits for the handler's reply.
    std::string dispatch(std::string_view raw_path, std::string_view raw_payload);

    bool has_handler(std::string_view path) const;
    std::size_t handler_count() const;

private:
    Reply dispatch_sync(const std::string& label, const Handler& handler,
                        const url::URL& origin, const Payload& payload);
    Reply invoke(const std::string& label, const Handler& handler,
                 const url::URL& origin, const Payload& payload);

    platform::DispatchQueue& queue_;
    core::Logger& logger_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Handler> handlers_;
};

} // namespace tether::bridge
