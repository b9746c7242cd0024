#include <layerfx/swapchain.hpp>

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

namespace layerfx {

namespace {

Error gpuError(std::string op, VkResult vr, std::string message) {
    return Error{std::move(op), static_cast<std::int32_t>(vr), std::move(message)};
}

VkSurfaceFormatKHR chooseFormat(const std::vector<VkSurfaceFormatKHR>& formats) {
    for (VkFormat want : {VK_FORMAT_B8G8R8A8_UNORM, VK_FORMAT_R8G8B8A8_UNORM}) {
        for (const auto& f : formats) {
            if (f.format == want && f.colorSpace == VK_COLOR_SPACE_SRGB_NONLINEAR_KHR) {
                return f;
            }
        }
    }
    return formats.front();
}

VkPresentModeKHR chooseMode(const std::vector<VkPresentModeKHR>& modes, PresentMode pref) {
    auto has = [&](VkPresentModeKHR m) {
        return std::find(modes.begin(), modes.end(), m) != modes.end();
    };
    switch (pref) {
    case PresentMode::Fifo:
        break;
    case PresentMode::Immediate:
        if (has(VK_PRESENT_MODE_IMMEDIATE_KHR)) return VK_PRESENT_MODE_IMMEDIATE_KHR;
        break;
    case PresentMode::MailboxOrFifo:
        if (has(VK_PRESENT_MODE_MAILBOX_KHR)) return VK_PRESENT_MODE_MAILBOX_KHR;
        break;
    }
    return VK_PRESENT_MODE_FIFO_KHR;
}

} // anonymous namespace

Swapchain::~Swapchain() {
    destroy();
}

void Swapchain::destroyPerImage() {
    for (auto s : imageReady_) vkDestroySemaphore(device_, s, nullptr);
    for (auto v : views_) vkDestroyImageView(device_, v, nullptr);
    imageReady_.clear();
    views_.clear();
    images_.clear();
    nextSemaphore_ = 0;
}

void Swapchain::destroy() {
    if (device_ == VK_NULL_HANDLE) return;
    destroyPerImage();
    if (swapchain_ != VK_NULL_HANDLE) {
        vkDestroySwapchainKHR(device_, swapchain_, nullptr);
        swapchain_ = VK_NULL_HANDLE;
    }
}

Swapchain::Swapchain(Swapchain&& o) noexcept
    : device_(o.device_), gpu_(o.gpu_), surface_(o.surface_),
      swapchain_(o.swapchain_), format_(o.format_), colorSpace_(o.colorSpace_),
      extent_(o.extent_), presentMode_(o.presentMode_), families_(o.families_),
      images_(std::move(o.images_)), views_(std::move(o.views_)),
      imageReady_(std::move(o.imageReady_)), nextSemaphore_(o.nextSemaphore_) {
    o.device_    = VK_NULL_HANDLE;
    o.swapchain_ = VK_NULL_HANDLE;
}

Swapchain& Swapchain::operator=(Swapchain&& o) noexcept {
    if (this != &o) {
        destroy();
        device_        = o.device_;
        gpu_           = o.gpu_;
        surface_       = o.surface_;
        swapchain_     = o.swapchain_;
        format_        = o.format_;
        colorSpace_    = o.colorSpace_;
        extent_        = o.extent_;
        presentMode_   = o.presentMode_;
        families_      = o.families_;
        images_        = std::move(o.images_);
        views_         = std::move(o.views_);
        imageReady_    = std::move(o.imageReady_);
        nextSemaphore_ = o.nextSemaphore_;
        o.device_    = VK_NULL_HANDLE;
        o.swapchain_ = VK_NULL_HANDLE;
    }
    return *this;
}

Result<void> Swapchain::create(Size pixelSize) {
    VkSurfaceCapabilitiesKHR caps;
    vkGetPhysicalDeviceSurfaceCapabilitiesKHR(gpu_, surface_, &caps);

    if (caps.currentExtent.width != UINT32_MAX) {
        extent_ = caps.currentExtent;
    } else {
        extent_.width  = std::clamp(pixelSize.width,  caps.minImageExtent.width,
                                    caps.maxImageExtent.width);
        extent_.height = std::clamp(pixelSize.height, caps.minImageExtent.height,
                                    caps.maxImageExtent.height);
    }
    if (extent_.width == 0 || extent_.height == 0) return {};

    std::uint32_t minImages = caps.minImageCount + 1;
    if (caps.maxImageCount > 0) minImages = std::min(minImages, caps.maxImageCount);

    VkSwapchainKHR old = swapchain_;

    VkSwapchainCreateInfoKHR ci{};
    ci.sType            = VK_STRUCTURE_TYPE_SWAPCHAIN_CREATE_INFO_KHR;
    ci.surface          = surface_;
    ci.minImageCount    = minImages;
    ci.imageFormat      = format_;
    ci.imageColorSpace  = colorSpace_;
    ci.imageExtent      = extent_;
    ci.imageArrayLayers = 1;
    ci.imageUsage       = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT | VK_IMAGE_USAGE_TRANSFER_DST_BIT;
    ci.preTransform     = caps.currentTransform;
    ci.compositeAlpha   = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
    ci.presentMode      = presentMode_;
    ci.clipped          = VK_TRUE;
    ci.oldSwapchain     = old;

    std::uint32_t familyIndices[] = {families_.graphics, families_.present};
    if (families_.shared()) {
        ci.imageSharingMode = VK_SHARING_MODE_EXCLUSIVE;
    } else {
        ci.imageSharingMode      = VK_SHARING_MODE_CONCURRENT;
        ci.queueFamilyIndexCount = 2;
        ci.pQueueFamilyIndices   = familyIndices;
    }

    VkSwapchainKHR created = VK_NULL_HANDLE;
    VkResult vr = vkCreateSwapchainKHR(device_, &ci, nullptr, &created);
    if (vr != VK_SUCCESS) {
        return gpuError("create swapchain", vr, "vkCreateSwapchainKHR failed");
    }

    destroyPerImage();
    if (old != VK_NULL_HANDLE) vkDestroySwapchainKHR(device_, old, nullptr);
    swapchain_ = created;

    std::uint32_t count = 0;
    vkGetSwapchainImagesKHR(device_, swapchain_, &count, nullptr);
    images_.resize(count);
    vkGetSwapchainImagesKHR(device_, swapchain_, &count, images_.data());

    views_.assign(count, VK_NULL_HANDLE);
    imageReady_.assign(count, VK_NULL_HANDLE);

    for (std::uint32_t i = 0; i < count; ++i) {
        VkImageViewCreateInfo vci{};
        vci.sType                       = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
        vci.image                       = images_[i];
        vci.viewType                    = VK_IMAGE_VIEW_TYPE_2D;
        vci.format                      = format_;
        vci.subresourceRange.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
        vci.subresourceRange.levelCount = 1;
        vci.subresourceRange.layerCount = 1;

        vr = vkCreateImageView(device_, &vci, nullptr, &views_[i]);
        if (vr != VK_SUCCESS) {
            return gpuError("create swapchain image view", vr,
                            "vkCreateImageView failed for image " + std::to_string(i));
        }

        VkSemaphoreCreateInfo sci{};
        sci.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;
        vr = vkCreateSemaphore(device_, &sci, nullptr, &imageReady_[i]);
        if (vr != VK_SUCCESS) {
            return gpuError("create swapchain semaphore", vr,
                            "vkCreateSemaphore failed for image " + std::to_string(i));
        }
    }

    return {};
}

Result<SwapchainImage> Swapchain::nextImage() {
    if (swapchain_ == VK_NULL_HANDLE || imageReady_.empty()) {
        return gpuError("acquire image", VK_ERROR_OUT_OF_DATE_KHR, "no swapchain images");
    }

    VkSemaphore sem = imageReady_[nextSemaphore_];
    nextSemaphore_ = (nextSemaphore_ + 1) % static_cast<std::uint32_t>(imageReady_.size());

    std::uint32_t index = 0;
    VkResult vr = vkAcquireNextImageKHR(device_, swapchain_, UINT64_MAX, sem,
                                        VK_NULL_HANDLE, &index);
    if (vr == VK_ERROR_OUT_OF_DATE_KHR) {
        return gpuError("acquire image", vr, "swapchain out of date");
    }
    if (vr != VK_SUCCESS && vr != VK_SUBOPTIMAL_KHR) {
        return gpuError("acquire image", vr, "vkAcquireNextImageKHR failed");
    }

    return SwapchainImage{index, images_[index], views_[index], sem};
}

VkResult Swapchain::present(VkQueue presentQueue, std::uint32_t imageIndex,
                            VkSemaphore renderFinished) {
    VkPresentInfoKHR pi{};
    pi.sType              = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR;
    pi.waitSemaphoreCount = 1;
    pi.pWaitSemaphores    = &renderFinished;
    pi.swapchainCount     = 1;
    pi.pSwapchains        = &swapchain_;
    pi.pImageIndices      = &imageIndex;
    return vkQueuePresentKHR(presentQueue, &pi);
}

Result<void> Swapchain::recreate(Size pixelSize) {
    if (pixelSize.empty()) return {};
    return create(pixelSize);
}

SwapchainBuilder::SwapchainBuilder(const Device& device, const Surface& surface)
    : device_(device.vkDevice()),
      gpu_(device.vkPhysicalDevice()),
      surface_(surface.vkSurface()),
      families_(device.queueFamilies()) {}

SwapchainBuilder& SwapchainBuilder::size(Size pixelSize) {
    size_ = pixelSize;
    return *this;
}

SwapchainBuilder& SwapchainBuilder::forWindow(const Window& window) {
    return size(window.pixelSize());
}

SwapchainBuilder& SwapchainBuilder::presentMode(PresentMode mode) {
    presentMode_ = mode;
    return *this;
}

Result<Swapchain> SwapchainBuilder::build() {
    std::uint32_t formatCount = 0;
    vkGetPhysicalDeviceSurfaceFormatsKHR(gpu_, surface_, &formatCount, nullptr);
    if (formatCount == 0) {
        Error e{"create swapchain", 0, "surface reports no formats"};
        e.kind = ErrorKind::Startup;
        return e;
    }
    std::vector<VkSurfaceFormatKHR> formats(formatCount);
    vkGetPhysicalDeviceSurfaceFormatsKHR(gpu_, surface_, &formatCount, formats.data());

    std::uint32_t modeCount = 0;
    vkGetPhysicalDeviceSurfacePresentModesKHR(gpu_, surface_, &modeCount, nullptr);
    std::vector<VkPresentModeKHR> modes(modeCount);
    vkGetPhysicalDeviceSurfacePresentModesKHR(gpu_, surface_, &modeCount, modes.data());

    VkSurfaceFormatKHR chosen = chooseFormat(formats);

    Swapchain sc;
    sc.device_      = device_;
    sc.gpu_         = gpu_;
    sc.surface_     = surface_;
    sc.format_      = chosen.format;
    sc.colorSpace_  = chosen.colorSpace;
    sc.presentMode_ = chooseMode(modes, presentMode_);
    sc.families_    = families_;

    auto created = sc.create(size_);
    if (!created.ok()) return created.error();
    if (sc.swapchain_ == VK_NULL_HANDLE) {
        return Error{"create swapchain", 0, "surface has zero size"};
    }
    return sc;
}

} // namespace layerfx
