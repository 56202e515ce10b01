#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tether::url {

// Parsed location. Serves both page URLs (app://home?tab=2) and bridge
// request paths (/window/move?page-id=...), which carry no scheme or host.
struct URL {
    std::string scheme;
    std::string host;
    std::string path;
    std::string query;
    std::string fragment;

    std::string serialize() const;

    // Percent-decoded value of the first parameter named key
    std::optional<std::string> query_param(std::string_view key) const;

    // Percent-decoded key/value pairs in order of appearance
    std::vector<std::pair<std::string, std::string>> query_params() const;
};

std::optional<URL> parse(std::string_view input);

// Append key=value to the query of a raw URL or path, before any fragment.
std::string append_query(std::string_view raw, std::string_view key,
                         std::string_view value);

} // namespace tether::url
