#pragma once

#include <layerfx/error.hpp>
#include <layerfx/result.hpp>

#include <cstdint>
#include <memory>
#include <string_view>

struct SDL_Window; // forward-declare -- no SDL.h in user code

namespace layerfx {

struct Size {
    std::uint32_t width  = 0;
    std::uint32_t height = 0;

    [[nodiscard]] bool empty() const { return width == 0 || height == 0; }
    bool operator==(const Size&) const = default;
};

enum class Key {
    Unknown,
    Escape,
};

[[nodiscard]] Key keyFromScancode(int scancode);

enum class EventType {
    None,
    Quit,
    CloseRequested,
    Resized,
    KeyDown,
    PointerMoved,
};

struct Event {
    EventType type     = EventType::None;
    Size      size     = {};           // Resized: new pixel size
    Key       keyCode  = Key::Unknown; // KeyDown
    float     pointerX = 0.0f;         // PointerMoved: window coordinates, origin top-left
    float     pointerY = 0.0f;
};

class App;
class WindowImpl;

class Window {
public:
    ~Window();
    Window(Window&&) noexcept;
    Window& operator=(Window&&) noexcept;
    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

    // Drain one event from this window's queue. Pumps SDL once per drain.
    bool pollEvent(Event& event);

    // Drawable size in pixels (HiDPI aware). Zero while minimized.
    [[nodiscard]] Size pixelSize() const;

    // Size in window coordinates, the space pointer events are reported in.
    [[nodiscard]] Size size() const;

    // Pixels per window coordinate.
    [[nodiscard]] float displayDensity() const;

    // True once per resize since the last call.
    [[nodiscard]] bool consumeResize();

    [[nodiscard]] Result<void> setTitle(std::string_view title);

    [[nodiscard]] SDL_Window*   sdlWindow() const;
    [[nodiscard]] std::uint32_t windowId()  const;

private:
    friend class App;
    explicit Window(std::unique_ptr<WindowImpl> impl, App* app);

    std::unique_ptr<WindowImpl> impl_;
    App* app_ = nullptr;
};

} // namespace layerfx
