#pragma once
#include <tether/core/status.h>
#include <tether/ui/component.h>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace tether::ui {

// Mounts components and keeps their rendered form. Implementations
// synchronize internally.
class Markup {
public:
    virtual ~Markup() = default;

    virtual core::Status mount(const std::shared_ptr<Component>& component) = 0;
    virtual core::Status dismount(const std::shared_ptr<Component>& component) = 0;

    // Re-render a mounted component
    virtual core::Status update(const std::shared_ptr<Component>& component) = 0;

    virtual bool contains(const Component& component) const = 0;
    virtual std::optional<std::string> rendered(const Component& component) const = 0;
};

// In-memory markup: records each mounted component's latest render() output.
class BasicMarkup : public Markup {
public:
    core::Status mount(const std::shared_ptr<Component>& component) override;
    core::Status dismount(const std::shared_ptr<Component>& component) override;
    core::Status update(const std::shared_ptr<Component>& component) override;
    bool contains(const Component& component) const override;
    std::optional<std::string> rendered(const Component& component) const override;

    std::size_t mounted_count() const;

private:
    struct Mounted {
        std::shared_ptr<Component> component;
        std::string rendered;
    };

    mutable std::mutex mutex_;
    std::unordered_map<const Component*, Mounted> mounted_;
};

} // namespace tether::ui
