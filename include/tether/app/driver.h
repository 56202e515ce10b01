#pragma once
#include <tether/bridge/app_bridge.h>
#include <tether/bridge/payload.h>
#include <tether/bridge/platform_client.h>
#include <tether/bridge/reply.h>
#include <tether/core/config.h>
#include <tether/core/diagnostics.h>
#include <tether/core/status.h>
#include <tether/platform/dispatch_queue.h>
#include <tether/ui/component.h>
#include <tether/ui/element_directory.h>
#include <tether/ui/markup.h>
#include <tether/ui/page.h>
#include <tether/url/url.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace tether::app {

// Application callbacks for native lifecycle events. They run on the
// dispatch queue worker.
struct DriverHooks {
    std::function<void()> on_run;
    std::function<void()> on_focus;
    std::function<void()> on_blur;
    std::function<void(bool has_visible_pages)> on_reopen;
    std::function<void(const std::vector<std::string>& filenames)> on_files_open;
    std::function<void(const url::URL& u)> on_url_open;
    // Returning false vetoes the quit. Quitting is allowed when unset.
    std::function<bool()> on_quit;
    std::function<void()> on_exit;
};

using MarkupProvider = std::function<std::unique_ptr<ui::Markup>()>;

struct DriverConfig {
    std::size_t queue_capacity = core::config::kDefaultQueueCapacity;
    std::chrono::milliseconds request_timeout = core::config::kDefaultRequestTimeout;
    core::Severity min_severity = core::Severity::Info;
    bool log_to_stderr = false;
    // Page opened when the native side reports it is running
    std::string default_page_url;
    // Markup given to each new page; BasicMarkup when unset
    MarkupProvider markup_provider;
    DriverHooks hooks;
};

struct PageResult {
    std::shared_ptr<ui::Page> page;
    core::Status status;
};

// Context object tying the bridge together: one per process, passed to
// whatever needs the queue, the directory or the native side.
class Driver {
public:
    Driver(DriverConfig config, bridge::NativeTransport& transport);
    ~Driver();

    Driver(const Driver&) = delete;
    Driver& operator=(const Driver&) = delete;

    // Register components before run()
    ui::ComponentFactory& factory() { return factory_; }

    // Ask the native side to start, then work the dispatch queue on the
    // calling thread until /driver/exit or stop(). Returns the native run
    // status, or HandlerFailure after a fatal fault.
    core::Status run();
    void stop();

    // Native-facing entry points
    std::string dispatch(std::string_view path, std::string_view raw_payload);
    core::Status deliver(std::string_view request_id, std::string_view raw_reply);

    // The page is returned even when loading its default url failed.
    PageResult new_page(const ui::PageConfig& config);

    // Re-render component in whichever element hosts it
    core::Status render(const std::shared_ptr<ui::Component>& component);
    ui::ElementLookup element_by_component(const ui::Component& component) const;

    core::Status call_on_ui_thread(std::function<void()> task);

    core::Status app_name(std::string& name);

    // Ask the native side to quit the app
    core::Status close();

    std::vector<std::string> dropped_files() const;

    core::Logger& logger() { return logger_; }
    platform::DispatchQueue& queue() { return queue_; }
    bridge::AppBridge& bridge() { return bridge_; }
    bridge::PlatformClient& platform() { return platform_; }
    ui::ElementDirectory& elements() { return elements_; }

private:
    using PageAction = std::function<core::Status(ui::Page& page, const bridge::Payload& payload)>;

    void install_handlers();
    void install(std::string path, bridge::AppBridge::Handler handler);
    bridge::AppBridge::Handler page_handler(PageAction action);

    bridge::Reply on_run(const url::URL& origin, const bridge::Payload& payload);
    bridge::Reply on_reopen(const url::URL& origin, const bridge::Payload& payload);
    bridge::Reply on_files_open(const url::URL& origin, const bridge::Payload& payload);
    bridge::Reply on_url_open(const url::URL& origin, const bridge::Payload& payload);
    bridge::Reply on_file_drop(const url::URL& origin, const bridge::Payload& payload);
    bridge::Reply on_quit(const url::URL& origin, const bridge::Payload& payload);
    bridge::Reply on_exit(const url::URL& origin, const bridge::Payload& payload);

    DriverConfig config_;
    core::Logger logger_;
    platform::DispatchQueue queue_;
    bridge::AppBridge bridge_;
    bridge::PlatformClient platform_;
    ui::ComponentFactory factory_;
    ui::ElementDirectory elements_;
    std::atomic<bool> running_{false};

    mutable std::mutex files_mutex_;
    std::vector<std::string> dropped_files_;
};

} // namespace tether::app
