#include <tether/bridge/reply.h>

#include <nlohmann/json.hpp>

#include <utility>

namespace tether::bridge {

Reply Reply::success(Payload payload) {
    Reply reply;
    reply.payload = std::move(payload);
    return reply;
}

Reply Reply::failure(core::ErrorCode code, std::string message) {
    return failure(core::Status::failure(code, std::move(message)));
}

Reply Reply::failure(core::Status status) {
    Reply reply;
    reply.status = std::move(status);
    return reply;
}

std::string encode_reply(const Reply& reply) {
    nlohmann::json envelope;
    envelope["ok"] = reply.status.ok;
    if (reply.status.ok) {
        envelope["payload"] = reply.payload.json();
    } else {
        envelope["error"] = core::error_code_name(reply.status.code);
        envelope["message"] = reply.status.message;
    }
    return envelope.dump();
}

Reply decode_reply(std::string_view text) {
    auto envelope = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
    if (envelope.is_discarded() || !envelope.is_object()) {
        return Reply::failure(core::ErrorCode::DecodeError, "reply is not a JSON object");
    }

    auto ok = envelope.find("ok");
    if (ok == envelope.end() || !ok->is_boolean()) {
        return Reply::failure(core::ErrorCode::DecodeError, "reply has no ok flag");
    }

    if (ok->get<bool>()) {
        auto payload = envelope.find("payload");
        if (payload == envelope.end()) {
            return Reply::success();
        }
        return Reply::success(Payload::from(*payload));
    }

    auto code = core::ErrorCode::HandlerFailure;
    if (auto error = envelope.find("error"); error != envelope.end() && error->is_string()) {
        code = core::error_code_from_name(error->get<std::string>());
        if (code == core::ErrorCode::None) {
            code = core::ErrorCode::HandlerFailure;
        }
    }
    std::string message;
    if (auto msg = envelope.find("message"); msg != envelope.end() && msg->is_string()) {
        message = msg->get<std::string>();
    }
    return Reply::failure(code, std::move(message));
}

} // namespace tether::bridge
