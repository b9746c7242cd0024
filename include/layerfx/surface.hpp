#pragma once

#include <layerfx/error.hpp>
#include <layerfx/instance.hpp>
#include <layerfx/result.hpp>
#include <layerfx/window.hpp>

#include <vulkan/vulkan.h>

namespace layerfx {

// VkSurfaceKHR for a window. Must die before the Instance it came from.
//
// Thread safety: immutable after construction.
class Surface {
public:
    ~Surface();
    Surface(Surface&&) noexcept;
    Surface& operator=(Surface&&) noexcept;
    Surface(const Surface&) = delete;
    Surface& operator=(const Surface&) = delete;

    [[nodiscard]] static Result<Surface> create(const Instance& instance,
                                                const Window& window);

    [[nodiscard]] VkSurfaceKHR native()     const { return surface_; }
    [[nodiscard]] VkSurfaceKHR vkSurface()  const { return native(); }
    [[nodiscard]] VkInstance   vkInstance() const { return instance_; }

private:
    Surface() = default;
    void destroy();

    VkInstance   instance_ = VK_NULL_HANDLE;
    VkSurfaceKHR surface_  = VK_NULL_HANDLE;
};

} // namespace layerfx
