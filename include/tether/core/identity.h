#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace tether::core {

// Opaque random (version 4) UUID identifying a live element.
class Identity {
public:
    Identity() = default;

    // Throws std::runtime_error if the system random source fails.
    static Identity generate();
    static std::optional<Identity> parse(std::string_view text);

    std::string to_string() const;
    bool is_nil() const;

    const std::array<uint8_t, 16>& bytes() const { return bytes_; }

    bool operator==(const Identity& other) const = default;

private:
    std::array<uint8_t, 16> bytes_{};
};

} // namespace tether::core

template <>
struct std::hash<tether::core::Identity> {
    std::size_t operator()(const tether::core::Identity& id) const noexcept {
        std::size_t h = 1469598103934665603ull;
        for (auto b : id.bytes()) {
            h ^= b;
            h *= 1099511628211ull;
        }
        return h;
    }
};
