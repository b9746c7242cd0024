#include "window_impl.hpp"
#include <layerfx/app.hpp>

#include <algorithm>
#include <string>
#include <vector>

namespace layerfx {

class AppImpl {
public:
    std::vector<Window*> windows; // non-owning, for routing
    bool pumped = false;          // set by pumpEvents(), cleared by resetPump()

    template <typename Fn>
    void forWindow(SDL_WindowID id, Fn&& fn) {
        for (auto* w : windows) {
            if (w->windowId() == id) fn(*w);
        }
    }
};

Result<App> App::create() {
    if (!SDL_Init(SDL_INIT_VIDEO)) {
        Error e{"initialize SDL", 0, std::string("SDL_Init failed: ") + SDL_GetError()};
        e.kind = ErrorKind::Startup;
        return e;
    }
    App app;
    app.impl_ = std::make_unique<AppImpl>();
    return app;
}

App::~App() {
    if (impl_) {
        impl_.reset();
        SDL_Quit();
    }
}

App::App(App&&) noexcept = default;
App& App::operator=(App&&) noexcept = default;

Result<Window> App::createWindow(std::string_view title, std::uint32_t width,
                                 std::uint32_t height) {
    std::string titleStr(title);

    SDL_Window* sdlWin = SDL_CreateWindow(
        titleStr.c_str(), static_cast<int>(width), static_cast<int>(height),
        SDL_WINDOW_VULKAN | SDL_WINDOW_RESIZABLE | SDL_WINDOW_HIGH_PIXEL_DENSITY);
    if (!sdlWin) {
        Error e{"create window", 0, std::string("SDL_CreateWindow failed: ") + SDL_GetError()};
        e.kind = ErrorKind::Startup;
        return e;
    }

    auto impl = std::make_unique<WindowImpl>();
    impl->sdlWindow = sdlWin;
    impl->windowId  = SDL_GetWindowID(sdlWin);

    return Window(std::move(impl), this);
}

void App::pumpEvents() {
    if (impl_->pumped) return;
    impl_->pumped = true;

    SDL_Event ev;
    while (SDL_PollEvent(&ev)) {
        Event e{};
        switch (ev.type) {
        case SDL_EVENT_QUIT:
            e.type = EventType::Quit;
            for (auto* w : impl_->windows) w->impl_->events.push(e);
            break;

        case SDL_EVENT_WINDOW_CLOSE_REQUESTED:
            e.type = EventType::CloseRequested;
            impl_->forWindow(ev.window.windowID, [&](Window& w) { w.impl_->events.push(e); });
            break;

        case SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED:
            if (ev.window.data1 <= 0 || ev.window.data2 <= 0) break;
            e.type        = EventType::Resized;
            e.size.width  = static_cast<std::uint32_t>(ev.window.data1);
            e.size.height = static_cast<std::uint32_t>(ev.window.data2);
            impl_->forWindow(ev.window.windowID, [&](Window& w) {
                w.impl_->events.push(e);
                w.impl_->resized = true;
            });
            break;

        case SDL_EVENT_KEY_DOWN:
            e.type    = EventType::KeyDown;
            e.keyCode = keyFromScancode(static_cast<int>(ev.key.scancode));
            impl_->forWindow(ev.key.windowID, [&](Window& w) { w.impl_->events.push(e); });
            break;

        case SDL_EVENT_MOUSE_MOTION:
            e.type     = EventType::PointerMoved;
            e.pointerX = ev.motion.x;
            e.pointerY = ev.motion.y;
            impl_->forWindow(ev.motion.windowID, [&](Window& w) { w.impl_->events.push(e); });
            break;

        default:
            break;
        }
    }
}

void App::registerWindow(Window* w) {
    impl_->windows.push_back(w);
}

void App::unregisterWindow(Window* w) {
    auto& v = impl_->windows;
    v.erase(std::remove(v.begin(), v.end(), w), v.end());
}

void App::resetPump() {
    impl_->pumped = false;
}

std::filesystem::path exeDir() {
    const char* base = SDL_GetBasePath();
    return base ? std::filesystem::path(base) : std::filesystem::current_path();
}

} // namespace layerfx
