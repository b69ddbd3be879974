#pragma once

#include "menukit/utils/types.hpp"
#include "menukit/utils/error.hpp"
#include <functional>
#include <string_view>
#include <vector>

namespace openflow::menukit::host {

enum class Key : u8 {
    ArrowDown,
    ArrowUp,
    Home,
    End,
    Enter,
    Space,
    Escape,
    Tab,
    Other
};

const char* key_name(Key key) noexcept;
Key key_from_name(std::string_view name) noexcept;

enum class PointerButton : u8 {
    Primary,
    Secondary,
    Middle
};

struct KeyEvent {
    Key key = Key::Other;
    ElementId target = INVALID_ELEMENT;
    bool default_prevented = false;

    void prevent_default() { default_prevented = true; }
};

struct PointerEvent {
    double x = 0.0;
    double y = 0.0;
    PointerButton button = PointerButton::Primary;
    ElementId target = INVALID_ELEMENT;
};

/**
 * @brief Document-level listener registry
 *
 * Every open menu session registers its own listeners here and removes them
 * when the session ends. Dispatch runs listeners in registration order and
 * tolerates listeners being added or removed from inside a callback:
 * removed listeners are skipped, added ones wait for the next event.
 */
class Document {
public:
    using PointerListener = std::function<void(PointerEvent&)>;
    using KeyListener = std::function<void(KeyEvent&)>;

    Document() = default;
    Document(const Document&) = delete;
    Document& operator=(const Document&) = delete;

    ListenerId add_pointer_down_listener(PointerListener listener);
    ListenerId add_key_down_listener(KeyListener listener);
    Result<void> remove_listener(ListenerId id);

    bool has_listener(ListenerId id) const;
    size_t pointer_listener_count() const { return pointer_listeners_.size(); }
    size_t key_listener_count() const { return key_listeners_.size(); }

    void dispatch_pointer_down(PointerEvent& event);
    void dispatch_key_down(KeyEvent& event);

private:
    template<typename Listener>
    struct Entry {
        ListenerId id;
        Listener listener;
    };

    template<typename Listener, typename Event>
    static void dispatch(const std::vector<Entry<Listener>>& listeners, Event& event);

    std::vector<Entry<PointerListener>> pointer_listeners_;
    std::vector<Entry<KeyListener>> key_listeners_;
    ListenerId next_id_ = 1;
};

}  // namespace openflow::menukit::host
