#include <tether/ui/markup.h>

namespace tether::ui {

core::Status BasicMarkup::mount(const std::shared_ptr<Component>& component) {
    if (!component) {
        return core::Status::failure(core::ErrorCode::InvalidArgument, "mounting a null component");
    }

    std::lock_guard lock(mutex_);
    if (mounted_.count(component.get()) != 0) {
        return core::Status::failure(core::ErrorCode::InvalidArgument,
                                     "component is already mounted");
    }
    mounted_.emplace(component.get(), Mounted{component, component->render()});
    component->on_mount();
    return core::Status::success();
}

core::Status BasicMarkup::dismount(const std::shared_ptr<Component>& component) {
    if (!component) {
        return core::Status::failure(core::ErrorCode::InvalidArgument, "dismounting a null component");
    }

    std::lock_guard lock(mutex_);
    auto it = mounted_.find(component.get());
    if (it == mounted_.end()) {
        return core::Status::failure(core::ErrorCode::NotFound, "component is not mounted");
    }
    component->on_dismount();
    mounted_.erase(it);
    return core::Status::success();
}

core::Status BasicMarkup::update(const std::shared_ptr<Component>& component) {
    if (!component) {
        return core::Status::failure(core::ErrorCode::InvalidArgument, "updating a null component");
    }

    std::lock_guard lock(mutex_);
    auto it = mounted_.find(component.get());
    if (it == mounted_.end()) {
        return core::Status::failure(core::ErrorCode::NotFound, "component is not mounted");
    }
    it->second.rendered = component->render();
    return core::Status::success();
}

bool BasicMarkup::contains(const Component& component) const {
    std::lock_guard lock(mutex_);
    return mounted_.count(&component) != 0;
}

std::optional<std::string> BasicMarkup::rendered(const Component& component) const {
    std::lock_guard lock(mutex_);
    auto it = mounted_.find(&component);
    if (it == mounted_.end()) {
        return std::nullopt;
    }
    return it->second.rendered;
}

std::size_t BasicMarkup::mounted_count() const {
    std::lock_guard lock(mutex_);
    return mounted_.size();
}

} // namespace tether::ui
