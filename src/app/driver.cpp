#include <tether/app/driver.h>

#include <tether/core/identity.h>

#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

namespace tether::app {

namespace {

constexpr const char kModule[] = "driver";

bridge::Reply reply_from(const core::Status& status) {
    return status.ok ? bridge::Reply::success() : bridge::Reply::failure(status);
}

} // anonymous namespace

Driver::Driver(DriverConfig config, bridge::NativeTransport& transport)
    : config_(std::move(config)),
      logger_(),
      queue_(logger_, config_.queue_capacity),
      bridge_(queue_, logger_),
      platform_(transport, logger_, config_.request_timeout) {
    logger_.set_min_severity(config_.min_severity);
    if (config_.log_to_stderr) {
        logger_.add_observer(core::stderr_observer());
    }
    install_handlers();
}

Driver::~Driver() {
    queue_.quit();
    platform_.close(core::Status::failure(core::ErrorCode::Shutdown, "driver destroyed"));
}

void Driver::install(std::string path, bridge::AppBridge::Handler handler) {
    auto status = bridge_.handle(std::move(path), std::move(handler));
    if (!status.ok) {
        throw std::logic_error("installing driver handlers failed: " + status.format());
    }
}

void Driver::install_handlers() {
    using namespace std::placeholders;

    install("/driver/run", std::bind(&Driver::on_run, this, _1, _2));
    install("/driver/focus", [this](const url::URL&, const bridge::Payload&) {
        if (config_.hooks.on_focus) config_.hooks.on_focus();
        return bridge::Reply::success();
    });
    install("/driver/blur", [this](const url::URL&, const bridge::Payload&) {
        if (config_.hooks.on_blur) config_.hooks.on_blur();
        return bridge::Reply::success();
    });
    install("/driver/reopen", std::bind(&Driver::on_reopen, this, _1, _2));
    install("/driver/filesopen", std::bind(&Driver::on_files_open, this, _1, _2));
    install("/driver/urlopen", std::bind(&Driver::on_url_open, this, _1, _2));
    install("/driver/filedrop", std::bind(&Driver::on_file_drop, this, _1, _2));
    install("/driver/quit", std::bind(&Driver::on_quit, this, _1, _2));
    install("/driver/exit", std::bind(&Driver::on_exit, this, _1, _2));

    install("/page/navigate", page_handler([](ui::Page& page, const bridge::Payload& payload) {
        std::string target;
        if (auto status = payload.decode(target); !status.ok) {
            return status;
        }
        return page.load(target);
    }));
    install("/page/reload", page_handler([](ui::Page& page, const bridge::Payload&) {
        return page.reload();
    }));
    install("/page/previous", page_handler([](ui::Page& page, const bridge::Payload&) {
        return page.previous();
    }));
    install("/page/next", page_handler([](ui::Page& page, const bridge::Payload&) {
        return page.next();
    }));
    install("/page/focus", page_handler([](ui::Page& page, const bridge::Payload&) {
        page.focus();
        return core::Status::success();
    }));
    install("/page/close", page_handler([](ui::Page& page, const bridge::Payload&) {
        page.close();
        return core::Status::success();
    }));
}

bridge::AppBridge::Handler Driver::page_handler(PageAction action) {
    return [this, action = std::move(action)](const url::URL& origin,
                                              const bridge::Payload& payload) {
        auto raw_id = origin.query_param(core::config::kPageIdKey);
        if (!raw_id) {
            return bridge::Reply::failure(core::ErrorCode::InvalidArgument,
                                          origin.path + " needs a page-id");
        }
        auto id = core::Identity::parse(*raw_id);
        if (!id) {
            return bridge::Reply::failure(core::ErrorCode::InvalidArgument,
                                          "malformed page-id " + *raw_id);
        }

        auto lookup = elements_.element_by_id(*id);
        if (!lookup.status.ok) {
            return bridge::Reply::failure(lookup.status);
        }
        auto page = std::dynamic_pointer_cast<ui::Page>(lookup.element);
        if (!page) {
            return bridge::Reply::failure(core::ErrorCode::InvalidArgument,
                                          "element " + *raw_id + " is not a page");
        }
        return reply_from(action(*page, payload));
    };
}

core::Status Driver::run() {
    if (running_.exchange(true)) {
        return core::Status::failure(core::ErrorCode::InvalidArgument,
                                     "driver is already running");
    }
    if (queue_.is_closed()) {
        running_.store(false);
        return core::Status::failure(core::ErrorCode::Shutdown, "driver was stopped");
    }

    core::Status native_status;
    std::jthread native([this, &native_status]() {
        native_status = platform_.request("/driver/run").status;
        // No /driver/exit can arrive once the native side is gone.
        if (native_status.code == core::ErrorCode::TransportTerminal) {
            logger_.emit(core::Severity::Error, kModule, "run",
                         "native side is gone: " + native_status.message);
            queue_.quit();
        }
    });

    queue_.run();

    platform_.close(core::Status::failure(core::ErrorCode::Shutdown, "driver stopped"));
    native.join();
    running_.store(false);

    if (auto fatal = queue_.fatal_report()) {
        logger_.emit(core::Severity::Error, kModule, "run", fatal->format());
        return core::Status::failure(core::ErrorCode::HandlerFailure,
                                     "fatal fault in " + fatal->stage + ": " + fatal->error_message);
    }
    return native_status;
}

void Driver::stop() {
    queue_.quit();
}

std::string Driver::dispatch(std::string_view path, std::string_view raw_payload) {
    return bridge_.dispatch(path, raw_payload);
}

core::Status Driver::deliver(std::string_view request_id, std::string_view raw_reply) {
    return platform_.deliver(request_id, raw_reply);
}

PageResult Driver::new_page(const ui::PageConfig& config) {
    auto markup = config_.markup_provider ? config_.markup_provider()
                                          : std::make_unique<ui::BasicMarkup>();
    auto page = std::make_shared<ui::Page>(factory_, std::move(markup), logger_);

    const auto id = page->id();
    page->set_close_handler([this, id]() { elements_.remove(id); });
    elements_.add(page);

    PageResult result;
    result.page = page;
    if (!config.default_url.empty()) {
        result.status = page->load(config.default_url);
    }
    return result;
}

core::Status Driver::render(const std::shared_ptr<ui::Component>& component) {
    if (!component) {
        return core::Status::failure(core::ErrorCode::InvalidArgument, "rendering a null component");
    }
    auto lookup = elements_.element_by_component(*component);
    if (!lookup.status.ok) {
        return lookup.status;
    }
    return lookup.element->render(component);
}

ui::ElementLookup Driver::element_by_component(const ui::Component& component) const {
    return elements_.element_by_component(component);
}

core::Status Driver::call_on_ui_thread(std::function<void()> task) {
    return queue_.post(std::move(task), "ui-call");
}

core::Status Driver::app_name(std::string& name) {
    auto reply = platform_.request("/driver/appname");
    if (!reply.status.ok) {
        return reply.status;
    }

    std::string reported;
    if (!reply.payload.empty()) {
        if (auto status = reply.payload.decode(reported); !status.ok) {
            return status;
        }
    }
    if (!reported.empty() && reported != "(null)") {
        name = std::move(reported);
        return core::Status::success();
    }

    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (ec) {
        return core::Status::failure(core::ErrorCode::NotFound,
                                     "getting the working directory failed: " + ec.message());
    }
    name = cwd.filename().string();
    return core::Status::success();
}

core::Status Driver::close() {
    return platform_.request("/driver/quit").status;
}

std::vector<std::string> Driver::dropped_files() const {
    std::lock_guard lock(files_mutex_);
    return dropped_files_;
}

bridge::Reply Driver::on_run(const url::URL&, const bridge::Payload&) {
    if (!config_.default_page_url.empty()) {
        auto opened = new_page(ui::PageConfig{config_.default_page_url});
        if (!opened.status.ok) {
            throw core::FatalError("opening the default page failed: " + opened.status.format());
        }
    }

    if (config_.hooks.on_run) {
        config_.hooks.on_run();
    }
    return bridge::Reply::success();
}

bridge::Reply Driver::on_reopen(const url::URL&, const bridge::Payload& payload) {
    bool has_visible_pages = false;
    if (auto status = payload.decode(has_visible_pages); !status.ok) {
        return bridge::Reply::failure(status);
    }
    if (config_.hooks.on_reopen) {
        config_.hooks.on_reopen(has_visible_pages);
    }
    return bridge::Reply::success();
}

bridge::Reply Driver::on_files_open(const url::URL&, const bridge::Payload& payload) {
    std::vector<std::string> filenames;
    if (auto status = payload.decode(filenames); !status.ok) {
        return bridge::Reply::failure(status);
    }
    if (config_.hooks.on_files_open) {
        config_.hooks.on_files_open(filenames);
    }
    return bridge::Reply::success();
}

bridge::Reply Driver::on_url_open(const url::URL&, const bridge::Payload& payload) {
    std::string raw;
    if (auto status = payload.decode(raw); !status.ok) {
        return bridge::Reply::failure(status);
    }
    auto u = url::parse(raw);
    if (!u) {
        return bridge::Reply::failure(core::ErrorCode::InvalidArgument,
                                      "cannot parse opened url " + raw);
    }
    if (config_.hooks.on_url_open) {
        config_.hooks.on_url_open(*u);
    }
    return bridge::Reply::success();
}

bridge::Reply Driver::on_file_drop(const url::URL&, const bridge::Payload& payload) {
    std::vector<std::string> filenames;
    if (auto status = payload.decode(filenames); !status.ok) {
        return bridge::Reply::failure(status);
    }
    std::lock_guard lock(files_mutex_);
    dropped_files_ = std::move(filenames);
    return bridge::Reply::success();
}

bridge::Reply Driver::on_quit(const url::URL&, const bridge::Payload&) {
    bool quit = true;
    if (config_.hooks.on_quit) {
        quit = config_.hooks.on_quit();
    }
    return bridge::Reply::success(bridge::Payload::from(quit));
}

bridge::Reply Driver::on_exit(const url::URL&, const bridge::Payload&) {
    if (config_.hooks.on_exit) {
        config_.hooks.on_exit();
    }
    logger_.emit(core::Severity::Info, kModule, "exit", "stopping the dispatch queue");
    queue_.quit();
    return bridge::Reply::success();
}

} // namespace tether::app
