#include <tether/core/identity.h>

#include <openssl/err.h>
#include <openssl/rand.h>

#include <stdexcept>

namespace tether::core {

namespace {

constexpr char hex_digits[] = "0123456789abcdef";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

bool is_dash_position(size_t i) {
    return i == 8 || i == 13 || i == 18 || i == 23;
}

} // anonymous namespace

Identity Identity::generate() {
    Identity id;
    if (RAND_bytes(id.bytes_.data(), static_cast<int>(id.bytes_.size())) != 1) {
        char buf[256];
        ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
        throw std::runtime_error(std::string("RAND_bytes failed: ") + buf);
    }
    // RFC 4122 version 4, variant 10xx
    id.bytes_[6] = static_cast<uint8_t>((id.bytes_[6] & 0x0F) | 0x40);
    id.bytes_[8] = static_cast<uint8_t>((id.bytes_[8] & 0x3F) | 0x80);
    return id;
}

std::optional<Identity> Identity::parse(std::string_view text) {
    if (text.size() != 36) return std::nullopt;

    Identity id;
    size_t byte = 0;
    for (size_t i = 0; i < text.size();) {
        if (is_dash_position(i)) {
            if (text[i] != '-') return std::nullopt;
            ++i;
            continue;
        }
        int hi = hex_value(text[i]);
        int lo = hex_value(text[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        id.bytes_[byte++] = static_cast<uint8_t>((hi << 4) | lo);
        i += 2;
    }
    return id;
}

std::string Identity::to_string() const {
    std::string result;
    result.reserve(36);
    for (size_t i = 0; i < bytes_.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            result += '-';
        }
        result += hex_digits[(bytes_[i] >> 4) & 0xF];
        result += hex_digits[bytes_[i] & 0xF];
    }
    return result;
}

bool Identity::is_nil() const {
    for (auto b : bytes_) {
        if (b != 0) return false;
    }
    return true;
}

} // namespace tether::core
