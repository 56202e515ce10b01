#pragma once
#include <tether/bridge/payload.h>
#include <tether/bridge/reply.h>
#include <tether/core/config.h>
#include <tether/core/diagnostics.h>
#include <tether/core/status.h>

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace tether::bridge {

struct TransportReply {
    core::Status status;
    std::string body;
};

// Carries a request across to the native runtime. body is the native
// side's reply envelope; an empty body is an empty success reply. A
// TransportTerminal status means the native side is gone for good.
class NativeTransport {
public:
    virtual ~NativeTransport() = default;
    virtual TransportReply call(const std::string& path, const std::string& raw_payload) = 0;
};

// Issues requests from the application to the native runtime.
class PlatformClient {
public:
    PlatformClient(NativeTransport& transport, core::Logger& logger,
                   std::chrono::milliseconds timeout = core::config::kDefaultRequestTimeout);
    ~PlatformClient();

    PlatformClient(const PlatformClient&) = delete;
    PlatformClient& operator=(const PlatformClient&) = delete;

    // Blocks until the native call returns its reply.
    Reply request(std::string_view path, const Payload& payload = {});

    // Sends path?return-id=<id> and blocks until deliver() is called with
    // that id, the timeout elapses or the client is closed. A zero timeout
    // waits indefinitely.
    Reply request_with_async_response(std::string_view path, const Payload& payload = {});

    // Resolve a pending asynchronous request. An unknown id is a protocol
    // anomaly: logged and discarded.
    core::Status deliver(std::string_view request_id, std::string_view raw_reply);

    // Fail every pending request with reason and refuse new ones.
    void close(core::Status reason);

    bool is_closed() const;
    std::size_t pending_count() const;

private:
    using Pending = std::shared_ptr<std::promise<Reply>>;

    Reply send(const std::string& path, const Payload& payload);
    bool erase_pending(const std::string& id);

    NativeTransport& transport_;
    core::Logger& logger_;
    const std::chrono::milliseconds timeout_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Pending> pending_;
    std::uint64_t next_id_ = 1;
    std::optional<core::Status> closed_;
};

} // namespace tether::bridge
