#include <tether/bridge/app_bridge.h>

#include <tether/core/config.h>

#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <utility>

namespace tether::bridge {

namespace {

constexpr const char kModule[] = "bridge";

} // anonymous namespace

AppBridge::AppBridge(platform::DispatchQueue& queue, core::Logger& logger)
    : queue_(queue), logger_(logger) {}

core::Status AppBridge::handle(std::string path, Handler handler) {
    auto parsed = url::parse(path);
    if (!parsed || !parsed->scheme.empty() || !parsed->host.empty() ||
        parsed->path.empty() || parsed->path.front() != '/' ||
        !parsed->query.empty() || !parsed->fragment.empty()) {
        return core::Status::failure(core::ErrorCode::InvalidArgument,
                                     "handler path must look like /<namespace>/<action>: " + path);
    }
    if (!handler) {
        return core::Status::failure(core::ErrorCode::InvalidArgument,
                                     "empty handler for " + path);
    }

    std::unique_lock lock(mutex_);
    auto [it, inserted] = handlers_.try_emplace(std::move(path), std::move(handler));
    if (!inserted) {
        return core::Status::failure(core::ErrorCode::AlreadyRegistered,
                                     "a handler is already registered for " + it->first);
    }
    return core::Status::success();
}

std::string AppBridge::dispatch(std::string_view raw_path, std::string_view raw_payload) {
    auto origin = url::parse(raw_path);
    if (!origin || !origin->scheme.empty() || origin->path.empty() ||
        origin->path.front() != '/') {
        logger_.emit(core::Severity::Warning, kModule, "dispatch",
                     "malformed request path: " + std::string(raw_path));
        return encode_reply(Reply::failure(core::ErrorCode::InvalidArgument,
                                           "malformed request path: " + std::string(raw_path)));
    }

    Handler handler;
    {
        std::shared_lock lock(mutex_);
        auto it = handlers_.find(origin->path);
        if (it != handlers_.end()) {
            handler = it->second;
        }
    }
    if (!handler) {
        logger_.emit(core::Severity::Warning, kModule, origin->path, "no handler registered");
        return encode_reply(Reply::failure(core::ErrorCode::NotFound,
                                           "no handler for " + origin->path));
    }

    Payload payload;
    if (auto status = Payload::parse(raw_payload, payload); !status.ok) {
        logger_.emit(core::Severity::Warning, kModule, origin->path, status.format());
        return encode_reply(Reply::failure(status));
    }

    const std::string label = origin->path;
    auto reply_mode = origin->query_param(core::config::kReplyKey);
    if (reply_mode && *reply_mode == core::config::kSyncReplyValue) {
        return encode_reply(dispatch_sync(label, handler, *origin, payload));
    }

    auto status = queue_.post(
        [this, label, handler = std::move(handler), origin = *origin,
         payload = std::move(payload)]() {
            invoke(label, handler, origin, payload);
        },
        label);
    if (!status.ok) {
        return encode_reply(Reply::failure(status));
    }
    return encode_reply(Reply::success());
}

Reply AppBridge::dispatch_sync(const std::string& label, const Handler& handler,
                               const url::URL& origin, const Payload& payload) {
    if (queue_.is_worker_thread()) {
        // Waiting on the queue from its own worker would never return.
        return invoke(label, handler, origin, payload);
    }

    auto promise = std::make_shared<std::promise<Reply>>();
    auto future = promise->get_future();

    auto status = queue_.post(
        [this, label, handler, origin, payload, promise]() {
            try {
                promise->set_value(invoke(label, handler, origin, payload));
            } catch (const core::FatalError& e) {
                promise->set_value(Reply::failure(core::ErrorCode::HandlerFailure, e.what()));
                throw;
            }
        },
        label);
    if (!status.ok) {
        return Reply::failure(status);
    }

    try {
        return future.get();
    } catch (const std::future_error&) {
        return Reply::failure(core::ErrorCode::Shutdown,
                              "dispatch queue abandoned " + label);
    }
}

Reply AppBridge::invoke(const std::string& label, const Handler& handler,
                        const url::URL& origin, const Payload& payload) {
    try {
        Reply reply = handler(origin, payload);
        if (!reply.status.ok) {
            logger_.emit(core::Severity::Warning, kModule, label,
                         "handler failed: " + reply.status.format());
        } else {
            logger_.emit(core::Severity::Debug, kModule, label, "handled");
        }
        return reply;
    } catch (const core::FatalError&) {
        throw;
    } catch (const std::exception& e) {
        logger_.emit(core::Severity::Error, kModule, label,
                     std::string("handler raised: ") + e.what());
        return Reply::failure(core::ErrorCode::HandlerFailure, e.what());
    } catch (...) {
        logger_.emit(core::Severity::Error, kModule, label, "handler raised an unknown exception");
        return Reply::failure(core::ErrorCode::HandlerFailure, "unknown exception");
    }
}

bool AppBridge::has_handler(std::string_view path) const {
    std::shared_lock lock(mutex_);
    return handlers_.find(std::string(path)) != handlers_.end();
}

std::size_t AppBridge::handler_count() const {
    std::shared_lock lock(mutex_);
    return handlers_.size();
}

} // namespace tether::bridge
