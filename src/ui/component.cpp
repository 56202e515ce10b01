#include <tether/ui/component.h>

#include <algorithm>
#include <cctype>
#include <mutex>

namespace tether::ui {

namespace {

std::string normalize_name(std::string_view name) {
    std::string result(name);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // anonymous namespace

core::Status ComponentFactory::register_component(std::string name, Constructor constructor) {
    auto key = normalize_name(name);
    if (key.empty() || !constructor) {
        return core::Status::failure(core::ErrorCode::InvalidArgument,
                                     "component registration needs a name and a constructor");
    }

    std::unique_lock lock(mutex_);
    auto [it, inserted] = constructors_.try_emplace(std::move(key), std::move(constructor));
    if (!inserted) {
        return core::Status::failure(core::ErrorCode::AlreadyRegistered,
                                     "component " + it->first + " is already registered");
    }
    return core::Status::success();
}

bool ComponentFactory::is_registered(std::string_view name) const {
    std::shared_lock lock(mutex_);
    return constructors_.count(normalize_name(name)) != 0;
}

ComponentResult ComponentFactory::make(std::string_view name) const {
    ComponentResult result;
    auto key = normalize_name(name);
    if (key.empty()) {
        result.status = core::Status::failure(core::ErrorCode::NotFound,
                                              "no component name");
        return result;
    }

    Constructor constructor;
    {
        std::shared_lock lock(mutex_);
        auto it = constructors_.find(key);
        if (it != constructors_.end()) {
            constructor = it->second;
        }
    }
    if (!constructor) {
        result.status = core::Status::failure(core::ErrorCode::NotFound,
                                              "component " + key + " is not registered");
        return result;
    }

    result.component = constructor();
    if (!result.component) {
        result.status = core::Status::failure(core::ErrorCode::InvalidArgument,
                                              "constructor for " + key + " returned no component");
    }
    return result;
}

std::vector<std::string> ComponentFactory::names() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> result;
    result.reserve(constructors_.size());
    for (const auto& [name, constructor] : constructors_) {
        result.push_back(name);
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::string component_name_from_url(const url::URL& u) {
    if (!u.host.empty()) {
        return normalize_name(u.host);
    }

    std::string_view path = u.path;
    while (!path.empty() && path.front() == '/') {
        path.remove_prefix(1);
    }
    return normalize_name(path.substr(0, path.find('/')));
}

} // namespace tether::ui
