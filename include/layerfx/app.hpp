#pragma once

#include <layerfx/error.hpp>
#include <layerfx/result.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string_view>

namespace layerfx {

class Window;
class AppImpl;

// Owns SDL video initialization. Create one App before any window; it
// routes the global SDL event queue to each window's queue.
class App {
public:
    [[nodiscard]] static Result<App> create();

    ~App();
    App(App&&) noexcept;
    App& operator=(App&&) noexcept;
    App(const App&) = delete;
    App& operator=(const App&) = delete;

    [[nodiscard]] Result<Window> createWindow(std::string_view title,
                                               std::uint32_t width,
                                               std::uint32_t height);

    void pumpEvents();

private:
    friend class Window;
    App() = default;
    void registerWindow(Window* w);
    void unregisterWindow(Window* w);
    void resetPump();

    std::unique_ptr<AppImpl> impl_;
};

// Directory of the running executable.
[[nodiscard]] std::filesystem::path exeDir();

} // namespace layerfx
