#pragma once

#ifndef NO_GRAPHICS

#include "menukit/gui/menu_controller.hpp"
#include "menukit/host/document.hpp"
#include "menukit/host/element_tree.hpp"
#include "menukit/host/task_scheduler.hpp"
#include "menukit/utils/error.hpp"
#include "menukit/utils/types.hpp"
#include <SDL2/SDL.h>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace openflow::menukit::gui {

host::Key translate_key(SDL_Keycode key);
host::PointerButton translate_button(Uint8 button);

/**
 * @brief TaskScheduler backed by SDL timers and user events
 *
 * Timers fire on SDL's timer thread; they only push an event. The task
 * itself runs when the UI thread passes that event to dispatch().
 */
class SdlTaskScheduler : public host::TaskScheduler {
public:
    static Result<std::unique_ptr<SdlTaskScheduler>> create();
    ~SdlTaskScheduler() override;

    TaskId post(Task task, Duration delay = Duration::zero()) override;
    bool cancel(TaskId id) override;

    // Returns true when the event was one of ours.
    bool dispatch(const SDL_Event& event);

    Uint32 event_type() const { return event_type_; }

private:
    explicit SdlTaskScheduler(Uint32 event_type);

    // Handed to SDL as the timer parameter; each scheduler tags its own events.
    struct TimerTicket {
        Uint32 event_type;
        TaskId id;
    };

    struct Pending {
        Task task;
        SDL_TimerID timer = 0;
        TimerTicket* ticket = nullptr;
    };

    static Uint32 on_timer(Uint32 interval, void* param);
    static bool push_task_event(Uint32 event_type, TaskId id);
    static void stop_timer(Pending& pending);

    // Which user event type this scheduler registered.

    Uint32 event_type_;
    std::mutex mutex_;
    std::unordered_map<TaskId, Pending> tasks_;
    TaskId next_id_ = 1;
};

/**
 * @brief Lays out and draws one popup menu with SDL rectangles
 *
 * Item rows become child elements of the popup root so that hit testing
 * and outside-click containment work on the element tree.
 */
class SdlMenuView {
public:
    SdlMenuView(SDL_Renderer* renderer, host::ElementTree& tree, ElementId popup_root);

    // Rebuild item rows for the controller's current session.
    Result<void> layout(const MenuController& controller, double viewport_width, double viewport_height);
    void hide();
    void render(const MenuController& controller) const;

    // Raw item index under an element, if it is one of our rows.
    std::optional<size_t> item_at(ElementId element) const;

    static constexpr double MENU_WIDTH = 200.0;
    static constexpr double ITEM_HEIGHT = 28.0;
    static constexpr double SEPARATOR_HEIGHT = 9.0;
    static constexpr double MENU_PADDING = 4.0;

private:
    void fill(const Rect& rect, u32 color) const;

    SDL_Renderer* renderer_;
    host::ElementTree& tree_;
    ElementId popup_root_;
    std::vector<ElementId> rows_;

    u32 background_color_ = 0x1f1f24;
    u32 border_color_ = 0x3a3a44;
    u32 text_color_ = 0xd8d8e0;
    u32 highlight_color_ = 0x0066cc;
    u32 destructive_color_ = 0xc0392b;
    u32 disabled_color_ = 0x55555e;
};

}  // namespace openflow::menukit::gui

#endif  // NO_GRAPHICS
