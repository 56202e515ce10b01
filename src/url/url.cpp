#include <tether/url/url.h>
#include <tether/url/percent_encoding.h>

#include <algorithm>
#include <cctype>

namespace tether::url {

namespace {

bool is_scheme_char(char c, bool first) {
    if (std::isalpha(static_cast<unsigned char>(c))) return true;
    if (first) return false;
    return std::isdigit(static_cast<unsigned char>(c)) ||
           c == '+' || c == '-' || c == '.';
}

bool has_forbidden_char(std::string_view input) {
    return std::any_of(input.begin(), input.end(), [](char c) {
        auto uc = static_cast<unsigned char>(c);
        return uc <= 0x20 || uc == 0x7F;
    });
}

std::string to_lower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string decode_query_component(std::string_view s) {
    return percent_decode(s, true);
}

} // anonymous namespace

std::string URL::serialize() const {
    std::string result;
    if (!scheme.empty()) {
        result += scheme;
        result += ':';
    }
    if (!host.empty()) {
        result += "//";
        result += host;
    }
    result += path;
    if (!query.empty()) {
        result += '?';
        result += query;
    }
    if (!fragment.empty()) {
        result += '#';
        result += fragment;
    }
    return result;
}

std::optional<std::string> URL::query_param(std::string_view key) const {
    for (auto& [k, v] : query_params()) {
        if (k == key) return v;
    }
    return std::nullopt;
}

std::vector<std::pair<std::string, std::string>> URL::query_params() const {
    std::vector<std::pair<std::string, std::string>> params;
    std::string_view rest = query;
    while (!rest.empty()) {
        auto amp = rest.find('&');
        std::string_view item = rest.substr(0, amp);
        rest = amp == std::string_view::npos ? std::string_view{} : rest.substr(amp + 1);
        if (item.empty()) continue;

        auto eq = item.find('=');
        if (eq == std::string_view::npos) {
            params.emplace_back(decode_query_component(item), std::string{});
        } else {
            params.emplace_back(decode_query_component(item.substr(0, eq)),
                                decode_query_component(item.substr(eq + 1)));
        }
    }
    return params;
}

std::optional<URL> parse(std::string_view input) {
    if (input.empty() || has_forbidden_char(input)) {
        return std::nullopt;
    }

    URL result;
    std::string_view rest = input;

    auto delim = rest.find_first_of(":/?#");
    if (delim != std::string_view::npos && rest[delim] == ':') {
        std::string_view scheme = rest.substr(0, delim);
        if (scheme.empty()) return std::nullopt;
        for (size_t i = 0; i < scheme.size(); ++i) {
            if (!is_scheme_char(scheme[i], i == 0)) return std::nullopt;
        }
        result.scheme = to_lower(scheme);
        rest = rest.substr(delim + 1);
    }

    if (rest.substr(0, 2) == "//") {
        rest = rest.substr(2);
        auto end = rest.find_first_of("/?#");
        result.host = to_lower(rest.substr(0, end));
        rest = end == std::string_view::npos ? std::string_view{} : rest.substr(end);
        if (result.host.empty()) return std::nullopt;
    }

    auto hash = rest.find('#');
    if (hash != std::string_view::npos) {
        result.fragment = std::string(rest.substr(hash + 1));
        rest = rest.substr(0, hash);
    }

    auto question = rest.find('?');
    if (question != std::string_view::npos) {
        result.query = std::string(rest.substr(question + 1));
        rest = rest.substr(0, question);
    }

    result.path = std::string(rest);
    return result;
}

std::string append_query(std::string_view raw, std::string_view key,
                         std::string_view value) {
    auto hash = raw.find('#');
    std::string_view head = raw.substr(0, hash);
    std::string_view tail = hash == std::string_view::npos ? std::string_view{} : raw.substr(hash);

    std::string result(head);
    if (head.find('?') == std::string_view::npos) {
        result += '?';
    } else if (!head.empty() && head.back() != '?' && head.back() != '&') {
        result += '&';
    }
    result += percent_encode(key, true);
    result += '=';
    result += percent_encode(value, true);
    result += tail;
    return result;
}

} // namespace tether::url
