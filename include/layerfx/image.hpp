#pragma once

#include <layerfx/error.hpp>
#include <layerfx/result.hpp>
#include <layerfx/vma_fwd.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>

namespace layerfx {

class Allocator;

// Single-mip 2D color image with its view.
//
// Thread safety: immutable after construction.
class Image {
public:
    ~Image();
    Image(Image&&) noexcept;
    Image& operator=(Image&&) noexcept;
    Image(const Image&) = delete;
    Image& operator=(const Image&) = delete;

    [[nodiscard]] VkImage     native()      const { return image_; }
    [[nodiscard]] VkImage     vkImage()     const { return native(); }
    [[nodiscard]] VkImageView vkImageView() const { return view_; }
    [[nodiscard]] VkFormat    format()      const { return format_; }
    [[nodiscard]] VkExtent2D  extent()      const { return extent_; }

private:
    friend class ImageBuilder;
    Image() = default;
    void destroy();

    VmaAllocator  allocator_  = nullptr;
    VkDevice      device_     = VK_NULL_HANDLE;
    VkImage       image_      = VK_NULL_HANDLE;
    VkImageView   view_       = VK_NULL_HANDLE;
    VmaAllocation allocation_ = nullptr;
    VkFormat      format_     = VK_FORMAT_UNDEFINED;
    VkExtent2D    extent_     = {0, 0};
};

class ImageBuilder {
public:
    explicit ImageBuilder(const Allocator& allocator);

    ImageBuilder& size(std::uint32_t width, std::uint32_t height);
    ImageBuilder& size(VkExtent2D extent);
    ImageBuilder& format(VkFormat fmt);

    ImageBuilder& renderTarget(); // COLOR_ATTACHMENT | SAMPLED | TRANSFER_SRC | TRANSFER_DST
    ImageBuilder& sampled();      // SAMPLED | TRANSFER_DST

    ImageBuilder& usage(VkImageUsageFlags flags);

    [[nodiscard]] Result<Image> build();

private:
    VmaAllocator      allocator_ = nullptr;
    VkDevice          device_    = VK_NULL_HANDLE;
    std::uint32_t     width_     = 0;
    std::uint32_t     height_    = 0;
    VkFormat          format_    = VK_FORMAT_UNDEFINED;
    VkImageUsageFlags usage_     = 0;
};

} // namespace layerfx
