#pragma once
#include <tether/core/status.h>
#include <tether/url/url.h>

#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tether::ui {

// Application-defined unit of UI logic, mounted into a page by a Markup.
class Component {
public:
    virtual ~Component() = default;

    virtual std::string render() const = 0;

    virtual void on_mount() {}
    virtual void on_dismount() {}

    // Called after the component was loaded for url
    virtual void on_navigate(const url::URL& /*url*/) {}
};

struct ComponentResult {
    std::shared_ptr<Component> component;
    core::Status status;
};

// Creates components by name. Names are case-insensitive.
class ComponentFactory {
public:
    using Constructor = std::function<std::shared_ptr<Component>()>;

    ComponentFactory() = default;

    ComponentFactory(const ComponentFactory&) = delete;
    ComponentFactory& operator=(const ComponentFactory&) = delete;

    core::Status register_component(std::string name, Constructor constructor);

    template <typename T>
    core::Status register_component(std::string name) {
        return register_component(std::move(name), []() { return std::make_shared<T>(); });
    }

    bool is_registered(std::string_view name) const;

    // NotFound when no component is registered under name
    ComponentResult make(std::string_view name) const;

    std::vector<std::string> names() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Constructor> constructors_;
};

// "app://home" -> "home", "/settings/advanced" -> "settings",
// "mac.menubar?x=1" -> "mac.menubar". Empty when the URL names nothing.
std::string component_name_from_url(const url::URL& u);

} // namespace tether::ui
