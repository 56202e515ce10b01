#pragma once
#include <tether/core/identity.h>
#include <tether/core/status.h>
#include <tether/ui/component.h>
#include <tether/ui/element.h>

#include <memory>
#include <shared_mutex>
#include <unordered_map>

namespace tether::ui {

struct ElementLookup {
    std::shared_ptr<Element> element;
    core::Status status;
};

// Registry of live elements. The component lookup is derived from the
// elements themselves, so removing an element drops both routes at once.
class ElementDirectory {
public:
    ElementDirectory() = default;

    ElementDirectory(const ElementDirectory&) = delete;
    ElementDirectory& operator=(const ElementDirectory&) = delete;

    // Replaces any element registered under the same id
    void add(std::shared_ptr<Element> element);

    // Returns false when no element had that id
    bool remove(const core::Identity& id);

    ElementLookup element_by_id(const core::Identity& id) const;

    // Element currently hosting component, NotFound if none
    ElementLookup element_by_component(const Component& component) const;

    std::size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<core::Identity, std::shared_ptr<Element>> elements_;
};

} // namespace tether::ui
