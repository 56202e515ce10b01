#pragma once
#include <tether/core/status.h>

#include <nlohmann/json.hpp>

#include <cmath>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace tether::bridge {

// Zero or one JSON value attached to a bridge request or reply. A null
// value is the empty payload.
class Payload {
public:
    Payload() = default;

    template <typename T>
    static Payload from(const T& value) {
        Payload payload;
        payload.value_ = nlohmann::json(value);
        return payload;
    }

    // Empty text and "null" parse to the empty payload.
    static core::Status parse(std::string_view text, Payload& out);

    // The empty payload encodes as empty text.
    std::string encode() const;

    bool empty() const { return value_.is_null(); }
    const nlohmann::json& json() const { return value_; }

    // Decode into out. Fails with DecodeError, leaving out untouched, when
    // the value does not convert losslessly to T.
    template <typename T>
    core::Status decode(T& out) const;

private:
    nlohmann::json value_;
};

template <typename T>
core::Status Payload::decode(T& out) const {
    if (empty()) {
        return core::Status::failure(core::ErrorCode::DecodeError, "payload is empty");
    }
    if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) {
        // Converting an out-of-range float to an integer is undefined, so
        // it has to be rejected before get<T>().
        if (value_.is_number_float()) {
            double number = value_.get<double>();
            bool representable = std::trunc(number) == number &&
                                 number >= static_cast<double>(std::numeric_limits<T>::min()) &&
                                 number < static_cast<double>(std::numeric_limits<T>::max()) + 1.0;
            if (!representable) {
                return core::Status::failure(
                    core::ErrorCode::DecodeError,
                    "payload " + value_.dump() + " does not fit the destination type");
            }
        }
    }
    try {
        T decoded = value_.get<T>();
        if constexpr (!std::is_floating_point_v<T>) {
            // get<T>() narrows numbers and coerces booleans; re-encoding
            // exposes anything that did not survive the conversion.
            if (nlohmann::json(decoded) != value_) {
                return core::Status::failure(
                    core::ErrorCode::DecodeError,
                    "payload " + value_.dump() + " does not fit the destination type");
            }
        }
        out = std::move(decoded);
        return core::Status::success();
    } catch (const nlohmann::json::exception& e) {
        return core::Status::failure(core::ErrorCode::DecodeError, e.what());
    }
}

} // namespace tether::bridge
