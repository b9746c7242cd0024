#include <layerfx/surface.hpp>
#include <layerfx/vulkan_wsi.hpp>

#include <SDL3/SDL_vulkan.h>

#include <string>

namespace layerfx {

namespace wsi {

std::vector<const char*> requiredInstanceExtensions() {
    Uint32 count = 0;
    const char* const* names = SDL_Vulkan_GetInstanceExtensions(&count);
    if (!names || count == 0) {
        return {VK_KHR_SURFACE_EXTENSION_NAME};
    }
    return std::vector<const char*>(names, names + count);
}

} // namespace wsi

Surface::~Surface() {
    destroy();
}

void Surface::destroy() {
    if (surface_ != VK_NULL_HANDLE) {
        SDL_Vulkan_DestroySurface(instance_, surface_, nullptr);
        surface_ = VK_NULL_HANDLE;
    }
}

Surface::Surface(Surface&& o) noexcept : instance_(o.instance_), surface_(o.surface_) {
    o.instance_ = VK_NULL_HANDLE;
    o.surface_  = VK_NULL_HANDLE;
}

Surface& Surface::operator=(Surface&& o) noexcept {
    if (this != &o) {
        destroy();
        instance_   = o.instance_;
        surface_    = o.surface_;
        o.instance_ = VK_NULL_HANDLE;
        o.surface_  = VK_NULL_HANDLE;
    }
    return *this;
}

Result<Surface> Surface::create(const Instance& instance, const Window& window) {
    Surface s;
    s.instance_ = instance.vkInstance();
    if (!SDL_Vulkan_CreateSurface(window.sdlWindow(), s.instance_, nullptr, &s.surface_)) {
        Error e{"create surface", 0,
                std::string("SDL_Vulkan_CreateSurface failed: ") + SDL_GetError()};
        e.kind = ErrorKind::Startup;
        return e;
    }
    return s;
}

} // namespace layerfx
