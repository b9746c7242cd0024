#include <layerfx/image.hpp>
#include <layerfx/allocator.hpp>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmissing-field-initializers"
#pragma GCC diagnostic ignored "-Wunused-parameter"
#pragma GCC diagnostic ignored "-Wunused-variable"
#include <vk_mem_alloc.h>
#pragma GCC diagnostic pop

#include <string>

namespace layerfx {

void Image::destroy() {
    if (view_ != VK_NULL_HANDLE) {
        vkDestroyImageView(device_, view_, nullptr);
        view_ = VK_NULL_HANDLE;
    }
    if (image_ != VK_NULL_HANDLE) {
        vmaDestroyImage(allocator_, image_, allocation_);
        image_      = VK_NULL_HANDLE;
        allocation_ = nullptr;
    }
}

Image::~Image() { destroy(); }

Image::Image(Image&& o) noexcept
    : allocator_(o.allocator_), device_(o.device_), image_(o.image_),
      view_(o.view_), allocation_(o.allocation_),
      format_(o.format_), extent_(o.extent_) {
    o.allocator_  = nullptr;
    o.device_     = VK_NULL_HANDLE;
    o.image_      = VK_NULL_HANDLE;
    o.view_       = VK_NULL_HANDLE;
    o.allocation_ = nullptr;
}

Image& Image::operator=(Image&& o) noexcept {
    if (this != &o) {
        destroy();
        allocator_  = o.allocator_;
        device_     = o.device_;
        image_      = o.image_;
        view_       = o.view_;
        allocation_ = o.allocation_;
        format_     = o.format_;
        extent_     = o.extent_;
        o.allocator_  = nullptr;
        o.device_     = VK_NULL_HANDLE;
        o.image_      = VK_NULL_HANDLE;
        o.view_       = VK_NULL_HANDLE;
        o.allocation_ = nullptr;
    }
    return *this;
}

ImageBuilder::ImageBuilder(const Allocator& allocator)
    : allocator_(allocator.vmaAllocator()), device_(allocator.vkDevice()) {}

ImageBuilder& ImageBuilder::size(std::uint32_t width, std::uint32_t height) {
    width_  = width;
    height_ = height;
    return *this;
}

ImageBuilder& ImageBuilder::size(VkExtent2D extent) {
    return size(extent.width, extent.height);
}

ImageBuilder& ImageBuilder::format(VkFormat fmt) {
    format_ = fmt;
    return *this;
}

ImageBuilder& ImageBuilder::renderTarget() {
    usage_ = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT |
             VK_IMAGE_USAGE_SAMPLED_BIT |
             VK_IMAGE_USAGE_TRANSFER_SRC_BIT |
             VK_IMAGE_USAGE_TRANSFER_DST_BIT;
    return *this;
}

ImageBuilder& ImageBuilder::sampled() {
    usage_ = VK_IMAGE_USAGE_SAMPLED_BIT | VK_IMAGE_USAGE_TRANSFER_DST_BIT;
    return *this;
}

ImageBuilder& ImageBuilder::usage(VkImageUsageFlags flags) {
    usage_ = flags;
    return *this;
}

Result<Image> ImageBuilder::build() {
    if (width_ == 0 || height_ == 0) {
        return Error{"create image", 0, "image size is 0 -- call size(width, height)"};
    }
    if (format_ == VK_FORMAT_UNDEFINED) {
        return Error{"create image", 0, "no format set -- call format(VkFormat)"};
    }
    if (usage_ == 0) {
        return Error{"create image", 0,
                     "no usage flags -- call renderTarget() or sampled()"};
    }

    VkImageCreateInfo imageCI{};
    imageCI.sType         = VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO;
    imageCI.imageType     = VK_IMAGE_TYPE_2D;
    imageCI.format        = format_;
    imageCI.extent        = {width_, height_, 1};
    imageCI.mipLevels     = 1;
    imageCI.arrayLayers   = 1;
    imageCI.samples       = VK_SAMPLE_COUNT_1_BIT;
    imageCI.tiling        = VK_IMAGE_TILING_OPTIMAL;
    imageCI.usage         = usage_;
    imageCI.sharingMode   = VK_SHARING_MODE_EXCLUSIVE;
    imageCI.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;

    VmaAllocationCreateInfo allocCI{};
    allocCI.usage = VMA_MEMORY_USAGE_AUTO;
    if (usage_ & VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT) {
        allocCI.flags = VMA_ALLOCATION_CREATE_DEDICATED_MEMORY_BIT;
    }

    Image img;
    img.allocator_ = allocator_;
    img.device_    = device_;
    img.format_    = format_;
    img.extent_    = {width_, height_};

    VkResult vr = vmaCreateImage(allocator_, &imageCI, &allocCI,
                                 &img.image_, &img.allocation_, nullptr);
    if (vr != VK_SUCCESS) {
        return Error{"create image", static_cast<std::int32_t>(vr),
                     "vmaCreateImage failed for " + std::to_string(width_) + "x" +
                     std::to_string(height_)};
    }

    VkImageViewCreateInfo viewCI{};
    viewCI.sType    = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
    viewCI.image    = img.image_;
    viewCI.viewType = VK_IMAGE_VIEW_TYPE_2D;
    viewCI.format   = format_;
    viewCI.subresourceRange = {VK_IMAGE_ASPECT_COLOR_BIT, 0, 1, 0, 1};

    vr = vkCreateImageView(device_, &viewCI, nullptr, &img.view_);
    if (vr != VK_SUCCESS) {
        return Error{"create image view", static_cast<std::int32_t>(vr),
                     "vkCreateImageView failed"};
    }

    return img;
}

} // namespace layerfx
