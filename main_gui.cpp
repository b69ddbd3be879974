#include <iostream>
#include <string>
#include <csignal>
#include <atomic>
#include <memory>
#include <optional>
#include <vector>

#include "menukit/config/configuration.hpp"
#include "menukit/gui/entity_context_menu.hpp"
#include "menukit/gui/menu_controller.hpp"
#include "menukit/gui/sdl_bridge.hpp"
#include "menukit/host/document.hpp"
#include "menukit/host/element_tree.hpp"
#include "menukit/utils/error.hpp"
#include "menukit/utils/logging.hpp"

#include <SDL2/SDL.h>

using namespace openflow::menukit;

namespace {

constexpr int WINDOW_WIDTH = 800;
constexpr int WINDOW_HEIGHT = 600;
constexpr Rect INVOKER_BOUNDS{40.0, 40.0, 160.0, 36.0};

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        shutdown_requested = true;
    }
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]\n"
              << "Options:\n"
              << "  -c, --config <file>      Configuration file path\n"
              << "  -l, --log-level <level>  Set log level (trace, debug, info, warn, error)\n"
              << "  -f, --log-file <file>    Log file path\n"
              << "  -h, --help               Show this help message\n"
              << "\n"
              << "Right-click anywhere to open a context menu; click the button or\n"
              << "press Enter while it has focus to open a dropdown below it.\n";
}

std::vector<MenuItem> build_demo_items() {
    std::vector<MenuItem> items;
    items.push_back(MenuItem::action("view", "View Task", [] { LOG_INFO("Action: view"); }));
    items.push_back(MenuItem::action("edit", "Edit Task", [] { LOG_INFO("Action: edit"); })
                        .with_shortcut("F2"));
    items.push_back(MenuItem::action("duplicate", "Duplicate Task", [] { LOG_INFO("Action: duplicate"); }));
    items.push_back(MenuItem::disabled("open-in-ide", "Open in IDE"));
    items.push_back(MenuItem::divider("divider-1"));
    items.push_back(MenuItem::action("archive", "Archive Task", [] { LOG_INFO("Action: archive"); }));
    items.push_back(MenuItem::action("delete", "Delete Task", [] { LOG_INFO("Action: delete"); })
                        .as_destructive());
    return items;
}

struct DemoState {
    host::ElementTree tree;
    host::Document document;
    std::unique_ptr<gui::SdlTaskScheduler> scheduler;
    std::unique_ptr<gui::EntityContextMenu> context_menu;
    gui::MenuController* menu = nullptr;
    std::unique_ptr<gui::SdlMenuView> view;
    ElementId root = INVALID_ELEMENT;
    ElementId invoker = INVALID_ELEMENT;
    ElementId popup = INVALID_ELEMENT;
    std::optional<size_t> hovered_row;
};

void open_menu(DemoState& state, const AnchorPosition& anchor) {
    if (!state.context_menu->open(anchor, build_demo_items())) {
        return;
    }
    auto layout = state.view->layout(*state.menu, WINDOW_WIDTH, WINDOW_HEIGHT);
    if (!layout) {
        LOG_ERROR("Menu layout failed: {}", layout.error().to_string());
        state.menu->close();
    }
}

void handle_mouse_down(DemoState& state, const SDL_MouseButtonEvent& event) {
    host::PointerEvent pointer;
    pointer.x = event.x;
    pointer.y = event.y;
    pointer.button = gui::translate_button(event.button);
    pointer.target = state.tree.hit_test(event.x, event.y);

    // Document listeners first: an outside press closes the open menu.
    state.document.dispatch_pointer_down(pointer);

    if (state.menu->is_open()) {
        if (auto row = state.view->item_at(pointer.target)) {
            state.menu->handle_item_click(state.menu->items()[*row].id);
        }
        return;
    }

    if (pointer.button == host::PointerButton::Secondary) {
        open_menu(state, AnchorPosition::at(event.x, event.y));
    } else if (pointer.target == state.invoker) {
        state.tree.focus(state.invoker);
        open_menu(state, AnchorPosition::at(INVOKER_BOUNDS.x, INVOKER_BOUNDS.y + INVOKER_BOUNDS.height));
    }
}

void handle_mouse_motion(DemoState& state, const SDL_MouseMotionEvent& event) {
    if (!state.menu->is_open()) {
        state.hovered_row.reset();
        return;
    }

    auto row = state.view->item_at(state.tree.hit_test(event.x, event.y));
    if (row == state.hovered_row) {
        return;
    }
    if (state.hovered_row) {
        state.menu->handle_pointer_leave_item();
    }
    state.hovered_row = row;
    if (row) {
        i32 eligible_index = state.menu->eligible().eligible_index_of_raw(*row);
        if (eligible_index != NO_HIGHLIGHT) {
            state.menu->handle_pointer_enter_item(eligible_index);
        }
    }
}

void handle_key_down(DemoState& state, const SDL_KeyboardEvent& event) {
    host::KeyEvent key;
    key.key = gui::translate_key(event.keysym.sym);
    key.target = state.tree.active_element();

    state.document.dispatch_key_down(key);
    if (key.default_prevented || state.menu->is_open()) {
        return;
    }

    if (key.target == state.invoker && (key.key == host::Key::Enter || key.key == host::Key::Space)) {
        open_menu(state, AnchorPosition::at(INVOKER_BOUNDS.x, INVOKER_BOUNDS.y + INVOKER_BOUNDS.height));
    } else if (key.key == host::Key::Tab) {
        state.tree.focus(state.invoker);
    }
}

Result<void> build_scene(DemoState& state, const MenuConfig& menu_config, SDL_Renderer* renderer) {
    auto root = state.tree.create_element(INVALID_ELEMENT, "document");
    if (!root) return unexpected(root.error());
    state.root = root.value();
    RETURN_IF_ERROR(state.tree.set_bounds(state.root, Rect{0, 0, WINDOW_WIDTH, WINDOW_HEIGHT}));

    auto invoker = state.tree.create_element(state.root, "invoker");
    if (!invoker) return unexpected(invoker.error());
    state.invoker = invoker.value();
    RETURN_IF_ERROR(state.tree.set_bounds(state.invoker, INVOKER_BOUNDS));

    auto popup = state.tree.create_element(state.root, "popup");
    if (!popup) return unexpected(popup.error());
    state.popup = popup.value();

    auto scheduler = gui::SdlTaskScheduler::create();
    if (!scheduler) return unexpected(scheduler.error());
    state.scheduler = std::move(scheduler.value());

    gui::MenuHost host{&state.document, state.scheduler.get(), &state.tree};
    auto menu = gui::EntityContextMenu::create(host, state.popup, gui::EntityKind::Task, menu_config);
    if (!menu) return unexpected(menu.error());
    state.context_menu = std::move(menu.value());
    state.menu = &state.context_menu->controller();

    state.view = std::make_unique<gui::SdlMenuView>(renderer, state.tree, state.popup);
    state.menu->set_close_handler([&state](gui::DismissReason reason) {
        LOG_INFO("Menu closed: {}", gui::dismiss_reason_to_string(reason));
        state.view->hide();
        state.hovered_row.reset();
    });
    state.menu->live_region().set_observer([](const std::string& text) {
        if (!text.empty()) {
            LOG_INFO("[status] {}", text);
        }
    });

    state.tree.focus(state.invoker);
    return {};
}

void render_scene(const DemoState& state, SDL_Renderer* renderer) {
    SDL_SetRenderDrawColor(renderer, 0x12, 0x12, 0x16, 255);
    SDL_RenderClear(renderer);

    bool invoker_focused = state.tree.active_element() == state.invoker;
    SDL_SetRenderDrawColor(renderer, 0x2a, invoker_focused ? 0x6a : 0x2a, invoker_focused ? 0xc0 : 0x33, 255);
    SDL_Rect button{static_cast<int>(INVOKER_BOUNDS.x), static_cast<int>(INVOKER_BOUNDS.y),
                    static_cast<int>(INVOKER_BOUNDS.width), static_cast<int>(INVOKER_BOUNDS.height)};
    SDL_RenderFillRect(renderer, &button);

    state.view->render(*state.menu);
    SDL_RenderPresent(renderer);
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string config_file;
    std::optional<std::string> log_level;
    std::optional<std::string> log_file;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_file = argv[++i];
        } else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
            log_level = argv[++i];
        } else if ((arg == "-f" || arg == "--log-file") && i + 1 < argc) {
            log_file = argv[++i];
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    Configuration config;
    if (!config_file.empty()) {
        auto loaded = config.loadFromFile(config_file);
        if (!loaded) {
            std::cerr << "Failed to load configuration: " << loaded.error().to_string() << "\n";
            return 1;
        }
    }

    LoggingConfig logging = config.getLoggingConfig();
    if (log_level) logging.level = *log_level;
    if (log_file) logging.file = *log_file;

    auto logger_result = Logger::initialize(Logger::from_string(logging.level), logging.file, logging.console);
    if (!logger_result) {
        std::cerr << "Failed to initialize logger: " << logger_result.error().to_string() << "\n";
        return 1;
    }

    auto menu_config = config.getMenuConfig();
    if (!menu_config) {
        LOG_ERROR("Invalid menu configuration: {}", menu_config.error().to_string());
        Logger::shutdown();
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER | SDL_INIT_EVENTS) < 0) {
        LOG_ERROR("Failed to initialize SDL: {}", SDL_GetError());
        Logger::shutdown();
        return 1;
    }

    SDL_Window* window = SDL_CreateWindow("menukit demo", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                                          WINDOW_WIDTH, WINDOW_HEIGHT, SDL_WINDOW_SHOWN);
    SDL_Renderer* renderer = window ? SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC)
                                    : nullptr;
    if (!window || !renderer) {
        LOG_ERROR("Failed to create window: {}", SDL_GetError());
        if (window) SDL_DestroyWindow(window);
        SDL_Quit();
        Logger::shutdown();
        return 1;
    }

    int exit_code = 0;
    {
        DemoState state;
        auto scene = build_scene(state, menu_config.value(), renderer);
        if (!scene) {
            LOG_ERROR("Failed to build demo scene: {}", scene.error().to_string());
            exit_code = 1;
        } else {
            LOG_INFO("menukit demo running; right-click to open a menu");
            while (!shutdown_requested) {
                SDL_Event event;
                while (SDL_PollEvent(&event)) {
                    if (state.scheduler->dispatch(event)) {
                        continue;
                    }
                    switch (event.type) {
                        case SDL_QUIT:
                            shutdown_requested = true;
                            break;
                        case SDL_MOUSEBUTTONDOWN:
                            handle_mouse_down(state, event.button);
                            break;
                        case SDL_MOUSEMOTION:
                            handle_mouse_motion(state, event.motion);
                            break;
                        case SDL_KEYDOWN:
                            handle_key_down(state, event.key);
                            break;
                        default:
                            break;
                    }
                }
                render_scene(state, renderer);
            }
        }
        // Controller and view go before the scheduler and tree they borrow
        state.menu = nullptr;
        state.context_menu.reset();
        state.view.reset();
    }

    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    SDL_Quit();
    Logger::shutdown();
    return exit_code;
}
