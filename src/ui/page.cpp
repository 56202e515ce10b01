#include <tether/ui/page.h>

#include <utility>

namespace tether::ui {

namespace {

constexpr const char kModule[] = "page";

} // anonymous namespace

Page::Page(const ComponentFactory& factory, std::unique_ptr<Markup> markup,
           core::Logger& logger)
    : id_(core::Identity::generate()),
      factory_(factory),
      markup_(markup ? std::move(markup) : std::make_unique<BasicMarkup>()),
      logger_(logger),
      last_focus_(Clock::now()) {}

const core::Identity& Page::id() const {
    return id_;
}

bool Page::contains(const Component& component) const {
    return markup_->contains(component);
}

core::Status Page::render(const std::shared_ptr<Component>& component) {
    return markup_->update(component);
}

std::shared_ptr<Component> Page::component() const {
    std::lock_guard lock(mutex_);
    return component_;
}

core::Status Page::load(std::string_view raw_url) {
    auto u = url::parse(raw_url);
    if (!u) {
        return core::Status::failure(core::ErrorCode::InvalidArgument,
                                     "cannot parse url " + std::string(raw_url));
    }

    std::shared_ptr<Component> loaded;
    core::Status status;
    {
        std::lock_guard lock(mutex_);
        auto target = u->serialize();
        if (history_.current() != target) {
            history_.new_entry(target);
        }
        status = load_locked(*u, loaded);
    }

    if (loaded) {
        loaded->on_navigate(*u);
    }
    return status;
}

core::Status Page::reload() {
    std::shared_ptr<Component> loaded;
    core::Status status;
    url::URL target;
    {
        std::lock_guard lock(mutex_);
        auto current = history_.current();
        if (!current) {
            return core::Status::failure(core::ErrorCode::NotFound,
                                         "page " + id_.to_string() + " has nothing to reload");
        }
        auto u = url::parse(*current);
        if (!u) {
            return core::Status::failure(core::ErrorCode::InvalidArgument,
                                         "cannot parse url " + *current);
        }
        target = std::move(*u);
        status = load_locked(target, loaded);
    }

    if (loaded) {
        loaded->on_navigate(target);
    }
    return status;
}

core::Status Page::previous() {
    return step(&nav::History::previous, "previous");
}

core::Status Page::next() {
    return step(&nav::History::next, "next");
}

core::Status Page::step(std::optional<std::string> (nav::History::*move)(), const char* what) {
    std::shared_ptr<Component> loaded;
    core::Status status;
    url::URL target;
    {
        std::lock_guard lock(mutex_);
        auto moved = (history_.*move)();
        if (!moved) {
            return core::Status::failure(core::ErrorCode::NotFound,
                                         std::string("page ") + id_.to_string() + " has no " + what + " entry");
        }
        auto u = url::parse(*moved);
        if (!u) {
            return core::Status::failure(core::ErrorCode::InvalidArgument,
                                         "cannot parse url " + *moved);
        }
        target = std::move(*u);
        status = load_locked(target, loaded);
    }

    if (loaded) {
        loaded->on_navigate(target);
    }
    return status;
}

core::Status Page::load_locked(const url::URL& u, std::shared_ptr<Component>& loaded) {
    const auto context = "loading " + u.serialize() + " in page " + id_.to_string() + " failed";

    if (component_) {
        if (auto status = markup_->dismount(component_); !status.ok) {
            logger_.emit(core::Severity::Warning, kModule, "dismount", status.format());
        }
        component_.reset();
    }

    auto made = factory_.make(component_name_from_url(u));
    if (!made.status.ok) {
        auto status = made.status.with_context(context);
        logger_.emit(core::Severity::Warning, kModule, "load", status.format());
        return status;
    }

    if (auto status = markup_->mount(made.component); !status.ok) {
        status = status.with_context(context);
        logger_.emit(core::Severity::Warning, kModule, "load", status.format());
        return status;
    }

    component_ = made.component;
    loaded = component_;
    logger_.emit(core::Severity::Debug, kModule, "load", u.serialize());
    return core::Status::success();
}

bool Page::can_previous() const {
    return history_.can_previous();
}

bool Page::can_next() const {
    return history_.can_next();
}

std::optional<url::URL> Page::url() const {
    auto current = history_.current();
    if (!current) {
        return std::nullopt;
    }
    return url::parse(*current);
}

std::optional<url::URL> Page::referer() const {
    auto previous = history_.peek_previous();
    if (!previous) {
        return std::nullopt;
    }
    return url::parse(*previous);
}

Page::Clock::time_point Page::last_focus() const {
    std::lock_guard lock(mutex_);
    return last_focus_;
}

void Page::focus() {
    std::lock_guard lock(mutex_);
    last_focus_ = Clock::now();
}

void Page::set_close_handler(std::function<void()> handler) {
    std::lock_guard lock(mutex_);
    close_handler_ = std::move(handler);
}

void Page::close() {
    if (closed_.exchange(true)) {
        return;
    }

    std::function<void()> handler;
    {
        std::lock_guard lock(mutex_);
        if (component_) {
            if (auto status = markup_->dismount(component_); !status.ok) {
                logger_.emit(core::Severity::Warning, kModule, "close", status.format());
            }
            component_.reset();
        }
        handler = std::move(close_handler_);
    }

    if (handler) {
        handler();
    }
}

bool Page::is_closed() const {
    return closed_.load();
}

} // namespace tether::ui
