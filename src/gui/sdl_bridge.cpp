#ifndef NO_GRAPHICS

#include "menukit/gui/sdl_bridge.hpp"
#include "menukit/utils/logging.hpp"
#include <algorithm>
#include <cstdint>

namespace openflow::menukit::gui {

namespace {

void* encode_task_id(TaskId id) {
    return reinterpret_cast<void*>(static_cast<std::uintptr_t>(id));
}

TaskId decode_task_id(void* data) {
    return static_cast<TaskId>(reinterpret_cast<std::uintptr_t>(data));
}

}  // namespace

host::Key translate_key(SDL_Keycode key) {
    switch (key) {
        case SDLK_DOWN: return host::Key::ArrowDown;
        case SDLK_UP: return host::Key::ArrowUp;
        case SDLK_HOME: return host::Key::Home;
        case SDLK_END: return host::Key::End;
        case SDLK_RETURN:
        case SDLK_KP_ENTER: return host::Key::Enter;
        case SDLK_SPACE: return host::Key::Space;
        case SDLK_ESCAPE: return host::Key::Escape;
        case SDLK_TAB: return host::Key::Tab;
        default: return host::Key::Other;
    }
}

host::PointerButton translate_button(Uint8 button) {
    switch (button) {
        case SDL_BUTTON_RIGHT: return host::PointerButton::Secondary;
        case SDL_BUTTON_MIDDLE: return host::PointerButton::Middle;
        default: return host::PointerButton::Primary;
    }
}

Result<std::unique_ptr<SdlTaskScheduler>> SdlTaskScheduler::create() {
    if ((SDL_WasInit(SDL_INIT_TIMER | SDL_INIT_EVENTS) & (SDL_INIT_TIMER | SDL_INIT_EVENTS)) !=
        (SDL_INIT_TIMER | SDL_INIT_EVENTS)) {
        return unexpected(MAKE_ERROR(SYSTEM_NOT_INITIALIZED,
            "SDL timer and event subsystems must be initialized first"));
    }

    Uint32 event_type = SDL_RegisterEvents(1);
    if (event_type == static_cast<Uint32>(-1)) {
        return unexpected(MAKE_ERROR(GRAPHICS_INIT_FAILED,
            "Failed to register SDL user event: " + std::string(SDL_GetError())));
    }

    return std::unique_ptr<SdlTaskScheduler>(new SdlTaskScheduler(event_type));
}

SdlTaskScheduler::SdlTaskScheduler(Uint32 event_type) : event_type_(event_type) {}

SdlTaskScheduler::~SdlTaskScheduler() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : tasks_) {
        stop_timer(entry.second);
    }
    tasks_.clear();
}

TaskId SdlTaskScheduler::post(Task task, Duration delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    TaskId id = next_id_++;
    Pending& pending = tasks_[id];
    pending.task = std::move(task);

    if (delay <= Duration::zero()) {
        if (!push_task_event(event_type_, id)) {
            LOG_WARN("Could not queue task {}: {}", id, SDL_GetError());
            tasks_.erase(id);
            return INVALID_TASK;
        }
        return id;
    }

    pending.ticket = new TimerTicket{event_type_, id};
    pending.timer = SDL_AddTimer(static_cast<Uint32>(delay.count()), &SdlTaskScheduler::on_timer,
                                 pending.ticket);
    if (pending.timer == 0) {
        LOG_WARN("Could not start timer for task {}: {}", id, SDL_GetError());
        delete pending.ticket;
        tasks_.erase(id);
        return INVALID_TASK;
    }
    return id;
}

bool SdlTaskScheduler::cancel(TaskId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return false;
    }
    stop_timer(it->second);
    // An event already in the queue finds nothing to run.
    tasks_.erase(it);
    return true;
}

bool SdlTaskScheduler::dispatch(const SDL_Event& event) {
    if (event.type != event_type_) {
        return false;
    }

    TaskId id = decode_task_id(event.user.data1);
    Task task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(id);
        if (it == tasks_.end()) {
            return true;
        }
        task = std::move(it->second.task);
        tasks_.erase(it);
    }

    if (task) {
        task();
    }
    return true;
}

void SdlTaskScheduler::stop_timer(Pending& pending) {
    if (pending.timer == 0) {
        return;
    }
    // A timer that already fired owns its ticket and frees it in on_timer().
    if (SDL_RemoveTimer(pending.timer)) {
        delete pending.ticket;
    }
    pending.timer = 0;
    pending.ticket = nullptr;
}

Uint32 SdlTaskScheduler::on_timer(Uint32 /*interval*/, void* param) {
    std::unique_ptr<TimerTicket> ticket(static_cast<TimerTicket*>(param));
    if (!push_task_event(ticket->event_type, ticket->id)) {
        LOG_WARN("Could not queue timed task {}: {}", ticket->id, SDL_GetError());
    }
    return 0;  // one-shot
}

bool SdlTaskScheduler::push_task_event(Uint32 event_type, TaskId id) {
    SDL_Event event;
    SDL_zero(event);
    event.type = event_type;
    event.user.data1 = encode_task_id(id);
    return SDL_PushEvent(&event) > 0;
}

SdlMenuView::SdlMenuView(SDL_Renderer* renderer, host::ElementTree& tree, ElementId popup_root)
    : renderer_(renderer), tree_(tree), popup_root_(popup_root) {}

Result<void> SdlMenuView::layout(const MenuController& controller,
                                 double viewport_width, double viewport_height) {
    hide();

    const auto& items = controller.items();
    double height = MENU_PADDING * 2;
    for (const auto& item : items) {
        height += item.is_divider() ? SEPARATOR_HEIGHT : ITEM_HEIGHT;
    }

    Rect popup = place_popup(controller.position(), MENU_WIDTH, height,
                             viewport_width, viewport_height);
    RETURN_IF_ERROR(tree_.set_bounds(popup_root_, popup));

    double y = popup.y + MENU_PADDING;
    for (const auto& item : items) {
        auto row = tree_.create_element(popup_root_, item.id);
        if (!row) {
            return unexpected(row.error());
        }
        double row_height = item.is_divider() ? SEPARATOR_HEIGHT : ITEM_HEIGHT;
        RETURN_IF_ERROR(tree_.set_bounds(row.value(), Rect{popup.x, y, MENU_WIDTH, row_height}));
        rows_.push_back(row.value());
        y += row_height;
    }
    return {};
}

void SdlMenuView::hide() {
    for (ElementId row : rows_) {
        if (!tree_.remove_element(row)) {
            LOG_DEBUG("Menu row {} was already removed", row);
        }
    }
    rows_.clear();
    if (!tree_.set_bounds(popup_root_, Rect{})) {
        LOG_DEBUG("Popup element {} is gone", popup_root_);
    }
}

std::optional<size_t> SdlMenuView::item_at(ElementId element) const {
    for (size_t i = 0; i < rows_.size(); ++i) {
        if (rows_[i] == element) {
            return i;
        }
    }
    return std::nullopt;
}

void SdlMenuView::render(const MenuController& controller) const {
    if (!controller.is_open()) {
        return;
    }

    auto popup = tree_.bounds(popup_root_);
    if (!popup) {
        return;
    }
    fill(Rect{popup->x - 1, popup->y - 1, popup->width + 2, popup->height + 2}, border_color_);
    fill(*popup, background_color_);

    const MenuItem* highlighted = controller.highlighted_item();
    const auto& items = controller.items();
    for (size_t i = 0; i < rows_.size() && i < items.size(); ++i) {
        auto bounds = tree_.bounds(rows_[i]);
        if (!bounds) {
            continue;
        }
        const MenuItem& item = items[i];
        if (item.is_divider()) {
            fill(Rect{bounds->x + 6, bounds->y + bounds->height / 2, bounds->width - 12, 1}, border_color_);
            continue;
        }

        if (&item == highlighted) {
            fill(*bounds, item.destructive ? destructive_color_ : highlight_color_);
        }

        // Label placeholder bar; text rendering is left to the embedding app
        u32 label_color = item.is_disabled() ? disabled_color_
                        : (item.destructive && &item != highlighted) ? destructive_color_
                        : text_color_;
        double bar_width = 12.0 + 7.0 * static_cast<double>(std::min<size_t>(item.label.size(), 22));
        fill(Rect{bounds->x + 12, bounds->y + bounds->height / 2 - 3, bar_width, 6}, label_color);
    }
}

void SdlMenuView::fill(const Rect& rect, u32 color) const {
    SDL_SetRenderDrawColor(renderer_,
                           static_cast<u8>((color >> 16) & 0xFF),
                           static_cast<u8>((color >> 8) & 0xFF),
                           static_cast<u8>(color & 0xFF),
                           255);
    SDL_Rect sdl_rect{static_cast<int>(rect.x), static_cast<int>(rect.y),
                      static_cast<int>(rect.width), static_cast<int>(rect.height)};
    SDL_RenderFillRect(renderer_, &sdl_rect);
}

}  // namespace openflow::menukit::gui

#endif  // NO_GRAPHICS
