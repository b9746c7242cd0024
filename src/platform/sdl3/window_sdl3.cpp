#include "window_impl.hpp"
#include <layerfx/app.hpp>

#include <string>

namespace layerfx {

Key keyFromScancode(int scancode) {
    switch (static_cast<SDL_Scancode>(scancode)) {
    case SDL_SCANCODE_ESCAPE: return Key::Escape;
    default:                  return Key::Unknown;
    }
}

Window::Window(std::unique_ptr<WindowImpl> impl, App* app)
    : impl_(std::move(impl)), app_(app) {
    if (app_) app_->registerWindow(this);
}

Window::~Window() {
    if (app_) app_->unregisterWindow(this);
    if (impl_ && impl_->sdlWindow) {
        SDL_DestroyWindow(impl_->sdlWindow);
    }
}

Window::Window(Window&& o) noexcept
    : impl_(std::move(o.impl_)), app_(o.app_) {
    o.app_ = nullptr;
    if (app_) {
        app_->unregisterWindow(&o);
        app_->registerWindow(this);
    }
}

Window& Window::operator=(Window&& o) noexcept {
    if (this != &o) {
        if (app_) app_->unregisterWindow(this);
        if (impl_ && impl_->sdlWindow) {
            SDL_DestroyWindow(impl_->sdlWindow);
        }

        impl_  = std::move(o.impl_);
        app_   = o.app_;
        o.app_ = nullptr;

        if (app_) {
            app_->unregisterWindow(&o);
            app_->registerWindow(this);
        }
    }
    return *this;
}

bool Window::pollEvent(Event& event) {
    event = Event{};
    if (!impl_) return false;

    if (impl_->events.empty() && app_) {
        app_->pumpEvents();
    }

    if (impl_->events.empty()) {
        // Drained: the next poll belongs to the next frame and pumps again.
        if (app_) app_->resetPump();
        return false;
    }

    event = impl_->events.front();
    impl_->events.pop();
    return true;
}

Size Window::pixelSize() const {
    int w = 0, h = 0;
    SDL_GetWindowSizeInPixels(impl_->sdlWindow, &w, &h);
    if (SDL_GetWindowFlags(impl_->sdlWindow) & SDL_WINDOW_MINIMIZED) return Size{};
    return Size{static_cast<std::uint32_t>(w), static_cast<std::uint32_t>(h)};
}

Size Window::size() const {
    int w = 0, h = 0;
    SDL_GetWindowSize(impl_->sdlWindow, &w, &h);
    return Size{static_cast<std::uint32_t>(w), static_cast<std::uint32_t>(h)};
}

float Window::displayDensity() const {
    float density = SDL_GetWindowPixelDensity(impl_->sdlWindow);
    return density > 0.0f ? density : 1.0f;
}

bool Window::consumeResize() {
    bool r = impl_->resized;
    impl_->resized = false;
    return r;
}

Result<void> Window::setTitle(std::string_view title) {
    std::string text(title);
    if (!SDL_SetWindowTitle(impl_->sdlWindow, text.c_str())) {
        return Error{"set window title", 0, SDL_GetError()};
    }
    return {};
}

SDL_Window* Window::sdlWindow() const {
    return impl_->sdlWindow;
}

std::uint32_t Window::windowId() const {
    return impl_->windowId;
}

} // namespace layerfx
