#pragma once

#include <layerfx/device.hpp>
#include <layerfx/error.hpp>
#include <layerfx/result.hpp>
#include <layerfx/surface.hpp>
#include <layerfx/window.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <vector>

namespace layerfx {

struct SwapchainImage {
    std::uint32_t index      = 0;
    VkImage       image      = VK_NULL_HANDLE;
    VkImageView   view       = VK_NULL_HANDLE;
    VkSemaphore   imageReady = VK_NULL_HANDLE; // signaled when the image is acquired
};

enum class PresentMode {
    Fifo,          // vsync
    Immediate,     // no vsync, falls back to Fifo
    MailboxOrFifo, // default
};

// Swapchain plus image views and one acquire semaphore per image.
// Prefers an 8-bit UNORM format: layer output is written to the display
// without an sRGB encode.
//
// Thread safety: thread-confined (render thread).
class Swapchain {
public:
    ~Swapchain();
    Swapchain(Swapchain&&) noexcept;
    Swapchain& operator=(Swapchain&&) noexcept;
    Swapchain(const Swapchain&) = delete;
    Swapchain& operator=(const Swapchain&) = delete;

    [[nodiscard]] VkSwapchainKHR native()      const { return swapchain_; }
    [[nodiscard]] VkSwapchainKHR vkSwapchain() const { return native(); }
    [[nodiscard]] VkFormat       format()      const { return format_; }
    [[nodiscard]] VkExtent2D     extent()      const { return extent_; }
    [[nodiscard]] std::uint32_t  imageCount()  const { return static_cast<std::uint32_t>(images_.size()); }

    // Fails with VK_ERROR_OUT_OF_DATE_KHR in Error::vkResult when the
    // surface changed; recreate and try again next frame.
    [[nodiscard]] Result<SwapchainImage> nextImage();

    [[nodiscard]] VkResult present(VkQueue presentQueue, std::uint32_t imageIndex,
                                   VkSemaphore renderFinished);

    // Call with the device idle. A zero size is a no-op (minimized window).
    [[nodiscard]] Result<void> recreate(Size pixelSize);

private:
    friend class SwapchainBuilder;
    Swapchain() = default;

    Result<void> create(Size pixelSize);
    void destroyPerImage();
    void destroy();

    VkDevice         device_      = VK_NULL_HANDLE;
    VkPhysicalDevice gpu_         = VK_NULL_HANDLE;
    VkSurfaceKHR     surface_     = VK_NULL_HANDLE;
    VkSwapchainKHR   swapchain_   = VK_NULL_HANDLE;
    VkFormat         format_      = VK_FORMAT_UNDEFINED;
    VkColorSpaceKHR  colorSpace_  = VK_COLOR_SPACE_SRGB_NONLINEAR_KHR;
    VkExtent2D       extent_      = {0, 0};
    VkPresentModeKHR presentMode_ = VK_PRESENT_MODE_FIFO_KHR;
    QueueFamilies    families_;
    std::vector<VkImage>     images_;
    std::vector<VkImageView> views_;
    std::vector<VkSemaphore> imageReady_;
    std::uint32_t            nextSemaphore_ = 0;
};

class SwapchainBuilder {
public:
    SwapchainBuilder(const Device& device, const Surface& surface);

    SwapchainBuilder& size(Size pixelSize);
    SwapchainBuilder& forWindow(const Window& window);
    SwapchainBuilder& presentMode(PresentMode mode);

    [[nodiscard]] Result<Swapchain> build();

private:
    VkDevice         device_      = VK_NULL_HANDLE;
    VkPhysicalDevice gpu_         = VK_NULL_HANDLE;
    VkSurfaceKHR     surface_     = VK_NULL_HANDLE;
    QueueFamilies    families_;
    Size             size_        = {0, 0};
    PresentMode      presentMode_ = PresentMode::MailboxOrFifo;
};

} // namespace layerfx
