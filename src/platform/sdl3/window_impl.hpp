#pragma once

// Shared by app_sdl3.cpp and window_sdl3.cpp only.

#include <layerfx/window.hpp>

#include <SDL3/SDL.h>

#include <queue>

namespace layerfx {

class WindowImpl {
public:
    SDL_Window*       sdlWindow = nullptr;
    SDL_WindowID      windowId  = 0;
    bool              resized   = false;
    std::queue<Event> events;
};

} // namespace layerfx
