#include <tether/url/percent_encoding.h>

namespace tether::url {

namespace {

constexpr char hex_digits[] = "0123456789ABCDEF";

bool is_unreserved(char c) {
    return (c >= 'A' && c <= 'Z') ||
           (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') ||
           c == '-' || c == '.' || c == '_' || c == '~';
}

bool is_reserved(char c) {
    return c == '/' || c == ':' || c == '@' ||
           c == '!' || c == '$' || c == '&' || c == '\'' ||
           c == '(' || c == ')' || c == '*' || c == '+' ||
           c == ',' || c == ';' || c == '=';
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

} // anonymous namespace

std::string percent_encode(std::string_view input, bool encode_reserved) {
    std::string result;
    result.reserve(input.size());

    for (unsigned char c : input) {
        if (is_unreserved(static_cast<char>(c)) ||
            (!encode_reserved && is_reserved(static_cast<char>(c)))) {
            result += static_cast<char>(c);
        } else {
            result += '%';
            result += hex_digits[(c >> 4) & 0xF];
            result += hex_digits[c & 0xF];
        }
    }

    return result;
}

std::string percent_decode(std::string_view input, bool plus_as_space) {
    std::string result;
    result.reserve(input.size());

    for (size_t i = 0; i < input.size(); ++i) {
        if (plus_as_space && input[i] == '+') {
            result += ' ';
            continue;
        }
        if (input[i] == '%' && i + 2 < input.size()) {
            int hi = hex_value(input[i + 1]);
            int lo = hex_value(input[i + 2]);
            if (hi >= 0 && lo >= 0) {
                result += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        result += input[i];
    }

    return result;
}

} // namespace tether::url
