#include <tether/bridge/platform_client.h>

#include <tether/url/url.h>

#include <utility>
#include <vector>

namespace tether::bridge {

namespace {

constexpr const char kModule[] = "platform";

} // anonymous namespace

PlatformClient::PlatformClient(NativeTransport& transport, core::Logger& logger,
                               std::chrono::milliseconds timeout)
    : transport_(transport), logger_(logger), timeout_(timeout) {}

PlatformClient::~PlatformClient() {
    close(core::Status::failure(core::ErrorCode::Shutdown, "platform client destroyed"));
}

Reply PlatformClient::request(std::string_view path, const Payload& payload) {
    {
        std::lock_guard lock(mutex_);
        if (closed_) {
            return Reply::failure(*closed_);
        }
    }
    return send(std::string(path), payload);
}

Reply PlatformClient::request_with_async_response(std::string_view path, const Payload& payload) {
    std::string id;
    std::future<Reply> future;
    {
        std::lock_guard lock(mutex_);
        if (closed_) {
            return Reply::failure(*closed_);
        }
        do {
            id = std::to_string(next_id_++);
        } while (pending_.count(id) != 0);

        auto promise = std::make_shared<std::promise<Reply>>();
        future = promise->get_future();
        pending_.emplace(id, std::move(promise));
    }

    // Registered before sending: the native side may answer before call()
    // returns, from another thread.
    Reply ack = send(url::append_query(path, core::config::kReturnIdKey, id), payload);
    if (!ack.status.ok) {
        erase_pending(id);
        return ack;
    }

    if (timeout_.count() > 0 &&
        future.wait_for(timeout_) == std::future_status::timeout) {
        if (erase_pending(id)) {
            logger_.emit(core::Severity::Warning, kModule, std::string(path),
                         "no reply within " + std::to_string(timeout_.count()) + "ms");
            return Reply::failure(core::ErrorCode::Timeout,
                                  "no reply to " + std::string(path) + " within " +
                                      std::to_string(timeout_.count()) + "ms");
        }
        // deliver() won the race and is setting the value
    }
    return future.get();
}

core::Status PlatformClient::deliver(std::string_view request_id, std::string_view raw_reply) {
    Pending pending;
    {
        std::lock_guard lock(mutex_);
        auto it = pending_.find(std::string(request_id));
        if (it != pending_.end()) {
            pending = std::move(it->second);
            pending_.erase(it);
        }
    }

    if (!pending) {
        logger_.emit(core::Severity::Warning, kModule, "deliver",
                     "reply for unknown request id " + std::string(request_id) + " discarded");
        return core::Status::failure(core::ErrorCode::ProtocolAnomaly,
                                     "unknown request id " + std::string(request_id));
    }

    pending->set_value(decode_reply(raw_reply));
    return core::Status::success();
}

void PlatformClient::close(core::Status reason) {
    std::unordered_map<std::string, Pending> failed;
    {
        std::lock_guard lock(mutex_);
        if (!closed_) {
            closed_ = reason;
        }
        failed.swap(pending_);
    }

    if (!failed.empty()) {
        logger_.emit(core::Severity::Warning, kModule, "close",
                     "failing " + std::to_string(failed.size()) +
                         " pending request(s): " + reason.format());
    }
    for (auto& [id, pending] : failed) {
        pending->set_value(Reply::failure(reason));
    }
}

bool PlatformClient::is_closed() const {
    std::lock_guard lock(mutex_);
    return closed_.has_value();
}

std::size_t PlatformClient::pending_count() const {
    std::lock_guard lock(mutex_);
    return pending_.size();
}

Reply PlatformClient::send(const std::string& path, const Payload& payload) {
    TransportReply sent = transport_.call(path, payload.encode());
    if (!sent.status.ok) {
        if (sent.status.code == core::ErrorCode::TransportTerminal) {
            close(sent.status);
        }
        logger_.emit(core::Severity::Error, kModule, path, sent.status.format());
        return Reply::failure(sent.status);
    }
    if (sent.body.empty()) {
        return Reply::success();
    }
    return decode_reply(sent.body);
}

bool PlatformClient::erase_pending(const std::string& id) {
    std::lock_guard lock(mutex_);
    return pending_.erase(id) != 0;
}

} // namespace tether::bridge
