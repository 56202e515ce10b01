#include <tether/bridge/payload.h>

namespace tether::bridge {

core::Status Payload::parse(std::string_view text, Payload& out) {
    if (text.empty()) {
        out = Payload{};
        return core::Status::success();
    }

    auto value = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
    if (value.is_discarded()) {
        return core::Status::failure(core::ErrorCode::DecodeError,
                                     "payload is not valid JSON");
    }

    out.value_ = std::move(value);
    return core::Status::success();
}

std::string Payload::encode() const {
    if (empty()) {
        return {};
    }
    return value_.dump();
}

} // namespace tether::bridge
