#pragma once
#include <tether/core/identity.h>
#include <tether/core/status.h>
#include <tether/ui/component.h>

#include <memory>

namespace tether::ui {

// A live UI element (page, window, menu...) hosting components.
class Element {
public:
    virtual ~Element() = default;

    virtual const core::Identity& id() const = 0;
    virtual bool contains(const Component& component) const = 0;
    virtual core::Status render(const std::shared_ptr<Component>& component) = 0;
};

} // namespace tether::ui
