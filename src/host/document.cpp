#include "menukit/host/document.hpp"
#include "menukit/utils/logging.hpp"
#include <algorithm>
#include <array>
#include <utility>

namespace openflow::menukit::host {

namespace {

constexpr std::array<std::pair<Key, std::string_view>, 8> kKeyNames = {{
    {Key::ArrowDown, "ArrowDown"},
    {Key::ArrowUp, "ArrowUp"},
    {Key::Home, "Home"},
    {Key::End, "End"},
    {Key::Enter, "Enter"},
    {Key::Space, " "},
    {Key::Escape, "Escape"},
    {Key::Tab, "Tab"},
}};

template<typename Entries>
bool erase_listener(Entries& entries, ListenerId id) {
    auto it = std::find_if(entries.begin(), entries.end(),
                           [id](const auto& entry) { return entry.id == id; });
    if (it == entries.end()) {
        return false;
    }
    entries.erase(it);
    return true;
}

}  // namespace

const char* key_name(Key key) noexcept {
    for (const auto& [k, name] : kKeyNames) {
        if (k == key) {
            return name.data();
        }
    }
    return "Unidentified";
}

Key key_from_name(std::string_view name) noexcept {
    if (name == "Space" || name == "Spacebar") {
        return Key::Space;
    }
    for (const auto& [k, key_str] : kKeyNames) {
        if (key_str == name) {
            return k;
        }
    }
    return Key::Other;
}

ListenerId Document::add_pointer_down_listener(PointerListener listener) {
    ListenerId id = next_id_++;
    pointer_listeners_.push_back({id, std::move(listener)});
    LOG_TRACE("Registered pointer-down listener {}", id);
    return id;
}

ListenerId Document::add_key_down_listener(KeyListener listener) {
    ListenerId id = next_id_++;
    key_listeners_.push_back({id, std::move(listener)});
    LOG_TRACE("Registered key-down listener {}", id);
    return id;
}

Result<void> Document::remove_listener(ListenerId id) {
    if (erase_listener(pointer_listeners_, id) || erase_listener(key_listeners_, id)) {
        LOG_TRACE("Removed listener {}", id);
        return {};
    }
    return unexpected(MAKE_ERROR(LISTENER_NOT_FOUND,
        "Listener " + std::to_string(id) + " is not registered"));
}

bool Document::has_listener(ListenerId id) const {
    auto matches = [id](const auto& entry) { return entry.id == id; };
    return std::any_of(pointer_listeners_.begin(), pointer_listeners_.end(), matches) ||
           std::any_of(key_listeners_.begin(), key_listeners_.end(), matches);
}

void Document::dispatch_pointer_down(PointerEvent& event) {
    dispatch(pointer_listeners_, event);
}

void Document::dispatch_key_down(KeyEvent& event) {
    dispatch(key_listeners_, event);
}

template<typename Listener, typename Event>
void Document::dispatch(const std::vector<Entry<Listener>>& listeners, Event& event) {
    std::vector<ListenerId> snapshot;
    snapshot.reserve(listeners.size());
    for (const auto& entry : listeners) {
        snapshot.push_back(entry.id);
    }

    for (ListenerId id : snapshot) {
        auto it = std::find_if(listeners.begin(), listeners.end(),
                               [id](const auto& entry) { return entry.id == id; });
        if (it == listeners.end()) {
            continue;  // removed by an earlier listener
        }
        // The callback may mutate the registry, so run a copy.
        Listener listener = it->listener;
        listener(event);
    }
}

}  // namespace openflow::menukit::host
