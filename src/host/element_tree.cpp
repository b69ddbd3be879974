#include "menukit/host/element_tree.hpp"
#include "menukit/utils/logging.hpp"
#include <algorithm>
#include <cmath>

namespace openflow::menukit::host {

Result<ElementId> ElementTree::create_element(ElementId parent, const std::string& name) {
    if (parent != INVALID_ELEMENT && nodes_.find(parent) == nodes_.end()) {
        return unexpected(MAKE_ERROR(ELEMENT_NOT_FOUND,
            "Parent element " + std::to_string(parent) + " does not exist"));
    }

    ElementId id = next_id_++;
    Node node;
    node.parent = parent;
    node.name = name;
    nodes_.emplace(id, std::move(node));

    if (parent == INVALID_ELEMENT) {
        roots_.push_back(id);
    } else {
        nodes_[parent].children.push_back(id);
    }

    return id;
}

Result<void> ElementTree::remove_element(ElementId id) {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        return unexpected(MAKE_ERROR(ELEMENT_NOT_FOUND,
            "Element " + std::to_string(id) + " does not exist"));
    }

    ElementId parent_id = it->second.parent;
    if (parent_id == INVALID_ELEMENT) {
        roots_.erase(std::remove(roots_.begin(), roots_.end(), id), roots_.end());
    } else {
        auto& siblings = nodes_[parent_id].children;
        siblings.erase(std::remove(siblings.begin(), siblings.end(), id), siblings.end());
    }

    std::vector<ElementId> doomed;
    collect_subtree(id, doomed);
    for (ElementId victim : doomed) {
        if (victim == focused_) {
            focused_ = INVALID_ELEMENT;
        }
        nodes_.erase(victim);
    }

    LOG_TRACE("Removed element {} ({} nodes)", id, doomed.size());
    return {};
}

Result<void> ElementTree::set_bounds(ElementId id, const Rect& bounds) {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        return unexpected(MAKE_ERROR(ELEMENT_NOT_FOUND,
            "Element " + std::to_string(id) + " does not exist"));
    }
    if (!std::isfinite(bounds.x) || !std::isfinite(bounds.y) ||
        !std::isfinite(bounds.width) || !std::isfinite(bounds.height) ||
        bounds.width < 0.0 || bounds.height < 0.0) {
        return unexpected(MAKE_ERROR(ELEMENT_INVALID_BOUNDS,
            "Bounds must be finite with non-negative size"));
    }
    it->second.bounds = bounds;
    return {};
}

std::optional<Rect> ElementTree::bounds(ElementId id) const {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        return std::nullopt;
    }
    return it->second.bounds;
}

ElementId ElementTree::hit_test(double x, double y) const {
    for (auto it = roots_.rbegin(); it != roots_.rend(); ++it) {
        ElementId hit = hit_test_subtree(*it, x, y);
        if (hit != INVALID_ELEMENT) {
            return hit;
        }
    }
    return INVALID_ELEMENT;
}

ElementId ElementTree::hit_test_subtree(ElementId id, double x, double y) const {
    const Node& node = nodes_.at(id);
    for (auto it = node.children.rbegin(); it != node.children.rend(); ++it) {
        ElementId hit = hit_test_subtree(*it, x, y);
        if (hit != INVALID_ELEMENT) {
            return hit;
        }
    }
    if (node.bounds && node.bounds->contains(x, y)) {
        return id;
    }
    return INVALID_ELEMENT;
}

ElementId ElementTree::parent(ElementId id) const {
    auto it = nodes_.find(id);
    return it == nodes_.end() ? INVALID_ELEMENT : it->second.parent;
}

std::vector<ElementId> ElementTree::children(ElementId id) const {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        return {};
    }
    return it->second.children;
}

std::string ElementTree::name(ElementId id) const {
    auto it = nodes_.find(id);
    return it == nodes_.end() ? std::string() : it->second.name;
}

bool ElementTree::is_connected(ElementId id) const {
    return id != INVALID_ELEMENT && nodes_.find(id) != nodes_.end();
}

bool ElementTree::focus(ElementId id) {
    if (!is_connected(id)) {
        return false;
    }
    focused_ = id;
    return true;
}

bool ElementTree::contains(ElementId ancestor, ElementId node) const {
    if (!is_connected(ancestor)) {
        return false;
    }
    for (ElementId cursor = node; cursor != INVALID_ELEMENT; ) {
        if (cursor == ancestor) {
            return true;
        }
        auto it = nodes_.find(cursor);
        if (it == nodes_.end()) {
            return false;
        }
        cursor = it->second.parent;
    }
    return false;
}

void ElementTree::collect_subtree(ElementId id, std::vector<ElementId>& out) const {
    out.push_back(id);
    for (ElementId child : nodes_.at(id).children) {
        collect_subtree(child, out);
    }
}

}  // namespace openflow::menukit::host
