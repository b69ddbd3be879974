#pragma once

#include "menukit/utils/types.hpp"
#include "menukit/utils/error.hpp"
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>

namespace openflow::menukit::host {

/**
 * @brief Focus and containment queries a menu controller needs from its host
 *
 * Hosts with their own widget tree implement this directly; ElementTree is
 * the retained implementation used by the SDL demo and the tests.
 */
class FocusHost {
public:
    virtual ~FocusHost() = default;

    virtual ElementId active_element() const = 0;
    virtual bool is_connected(ElementId id) const = 0;

    // Returns false when the element cannot take focus (unknown or removed).
    virtual bool focus(ElementId id) = 0;

    // Inclusive: an element contains itself.
    virtual bool contains(ElementId ancestor, ElementId node) const = 0;
};

/**
 * @brief Retained element hierarchy with focus tracking and hit testing
 */
class ElementTree : public FocusHost {
public:
    ElementTree() = default;
    ~ElementTree() override = default;

    // parent == INVALID_ELEMENT creates a root
    Result<ElementId> create_element(ElementId parent, const std::string& name = "");

    // Removes the subtree rooted at id. Ids are never reused.
    Result<void> remove_element(ElementId id);

    Result<void> set_bounds(ElementId id, const Rect& bounds);
    std::optional<Rect> bounds(ElementId id) const;

    // Deepest element under the point; later siblings sit on top.
    ElementId hit_test(double x, double y) const;

    ElementId parent(ElementId id) const;
    std::vector<ElementId> children(ElementId id) const;
    std::string name(ElementId id) const;
    size_t size() const { return nodes_.size(); }

    void blur() { focused_ = INVALID_ELEMENT; }

    // FocusHost
    ElementId active_element() const override { return focused_; }
    bool is_connected(ElementId id) const override;
    bool focus(ElementId id) override;
    bool contains(ElementId ancestor, ElementId node) const override;

private:
    struct Node {
        ElementId parent = INVALID_ELEMENT;
        std::string name;
        std::optional<Rect> bounds;
        std::vector<ElementId> children;
    };

    ElementId hit_test_subtree(ElementId id, double x, double y) const;
    void collect_subtree(ElementId id, std::vector<ElementId>& out) const;

    std::unordered_map<ElementId, Node> nodes_;
    std::vector<ElementId> roots_;
    ElementId next_id_ = 1;
    ElementId focused_ = INVALID_ELEMENT;
};

}  // namespace openflow::menukit::host
