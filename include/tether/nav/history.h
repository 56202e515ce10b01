#pragma once
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tether::nav {

// Back/forward navigation stack of a page. Every operation is atomic with
// respect to the others; nullopt means there is no such entry.
class History {
public:
    History() = default;

    History(const History&) = delete;
    History& operator=(const History&) = delete;

    std::optional<std::string> current() const;

    // Drop every entry after the cursor, append url and move onto it
    void new_entry(std::string url);

    // Step back/forward and return the new current entry
    std::optional<std::string> previous();
    std::optional<std::string> next();

    bool can_previous() const;
    bool can_next() const;

    // Entry just before the cursor, without moving it
    std::optional<std::string> peek_previous() const;

    std::size_t size() const;
    std::size_t cursor() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::string> entries_;
    std::size_t cursor_ = 0;
};

} // namespace tether::nav
