#include <tether/nav/history.h>

#include <utility>

namespace tether::nav {

std::optional<std::string> History::current() const {
    std::lock_guard lock(mutex_);
    if (entries_.empty()) {
        return std::nullopt;
    }
    return entries_[cursor_];
}

void History::new_entry(std::string url) {
    std::lock_guard lock(mutex_);
    if (!entries_.empty()) {
        entries_.resize(cursor_ + 1);
    }
    entries_.push_back(std::move(url));
    cursor_ = entries_.size() - 1;
}

std::optional<std::string> History::previous() {
    std::lock_guard lock(mutex_);
    if (entries_.empty() || cursor_ == 0) {
        return std::nullopt;
    }
    --cursor_;
    return entries_[cursor_];
}

std::optional<std::string> History::next() {
    std::lock_guard lock(mutex_);
    if (entries_.empty() || cursor_ + 1 >= entries_.size()) {
        return std::nullopt;
    }
    ++cursor_;
    return entries_[cursor_];
}

bool History::can_previous() const {
    std::lock_guard lock(mutex_);
    return !entries_.empty() && cursor_ > 0;
}

bool History::can_next() const {
    std::lock_guard lock(mutex_);
    return !entries_.empty() && cursor_ + 1 < entries_.size();
}

std::optional<std::string> History::peek_previous() const {
    std::lock_guard lock(mutex_);
    if (entries_.empty() || cursor_ == 0) {
        return std::nullopt;
    }
    return entries_[cursor_ - 1];
}

std::size_t History::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

std::size_t History::cursor() const {
    std::lock_guard lock(mutex_);
    return cursor_;
}

} // namespace tether::nav
