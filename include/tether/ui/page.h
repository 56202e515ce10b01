#pragma once
#include <tether/core/diagnostics.h>
#include <tether/core/identity.h>
#include <tether/core/status.h>
#include <tether/nav/history.h>
#include <tether/ui/component.h>
#include <tether/ui/element.h>
#include <tether/ui/markup.h>
#include <tether/url/url.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace tether::ui {

struct PageConfig {
    // Loaded when the page opens, if not empty
    std::string default_url;
};

// A navigable element: one History, one Markup and at most one mounted
// component. Navigation operations are serialized per page.
class Page : public Element {
public:
    using Clock = std::chrono::system_clock;

    Page(const ComponentFactory& factory, std::unique_ptr<Markup> markup,
         core::Logger& logger);

    Page(const Page&) = delete;
    Page& operator=(const Page&) = delete;

    const core::Identity& id() const override;
    bool contains(const Component& component) const override;
    core::Status render(const std::shared_ptr<Component>& component) override;

    std::shared_ptr<Component> component() const;

    // Record url in the history unless it is already current, then mount
    // the component it names. On failure the page has no mounted component.
    core::Status load(std::string_view raw_url);

    core::Status reload();

    // Step the history and load the resulting url. A failed step leaves the
    // page untouched.
    core::Status previous();
    core::Status next();

    bool can_previous() const;
    bool can_next() const;

    std::optional<url::URL> url() const;

    // URL of the entry before the current one; does not move the history.
    std::optional<url::URL> referer() const;

    Clock::time_point last_focus() const;
    void focus();

    // Called once, by the first close()
    void set_close_handler(std::function<void()> handler);
    void close();
    bool is_closed() const;

    const nav::History& history() const { return history_; }
    const Markup& markup() const { return *markup_; }

private:
    core::Status load_locked(const url::URL& u, std::shared_ptr<Component>& loaded);
    core::Status step(std::optional<std::string> (nav::History::*move)(), const char* what);

    const core::Identity id_;
    const ComponentFactory& factory_;
    const std::unique_ptr<Markup> markup_;
    core::Logger& logger_;
    nav::History history_;

    mutable std::mutex mutex_;
    std::shared_ptr<Component> component_;
    Clock::time_point last_focus_;
    std::function<void()> close_handler_;
    std::atomic<bool> closed_{false};
};

} // namespace tether::ui
