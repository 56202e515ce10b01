#include <tether/ui/element_directory.h>

#include <mutex>
#include <utility>

namespace tether::ui {

void ElementDirectory::add(std::shared_ptr<Element> element) {
    if (!element) {
        return;
    }

    std::unique_lock lock(mutex_);
    auto id = element->id();
    elements_[id] = std::move(element);
}

bool ElementDirectory::remove(const core::Identity& id) {
    std::unique_lock lock(mutex_);
    return elements_.erase(id) != 0;
}

ElementLookup ElementDirectory::element_by_id(const core::Identity& id) const {
    ElementLookup result;
    std::shared_lock lock(mutex_);
    auto it = elements_.find(id);
    if (it == elements_.end()) {
        result.status = core::Status::failure(core::ErrorCode::NotFound,
                                              "no element with id " + id.to_string());
        return result;
    }
    result.element = it->second;
    return result;
}

ElementLookup ElementDirectory::element_by_component(const Component& component) const {
    ElementLookup result;
    std::shared_lock lock(mutex_);
    for (const auto& [id, element] : elements_) {
        if (element->contains(component)) {
            result.element = element;
            return result;
        }
    }
    result.status = core::Status::failure(core::ErrorCode::NotFound,
                                          "no element hosts the component");
    return result;
}

std::size_t ElementDirectory::size() const {
    std::shared_lock lock(mutex_);
    return elements_.size();
}

} // namespace tether::ui
