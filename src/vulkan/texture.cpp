#include <layerfx/texture.hpp>
#include <layerfx/allocator.hpp>
#include <layerfx/barriers.hpp>
#include <layerfx/buffer.hpp>
#include <layerfx/device.hpp>
#include <layerfx/frames.hpp>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmissing-field-initializers"
#pragma GCC diagnostic ignored "-Wunused-parameter"
#pragma GCC diagnostic ignored "-Wsign-compare"
#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>
#pragma GCC diagnostic pop

#include <cstddef>
#include <cstring>
#include <string>
#include <utility>

namespace layerfx {

ImageData::~ImageData() {
    if (pixels) {
        stbi_image_free(pixels);
    }
}

ImageData::ImageData(ImageData&& o) noexcept
    : pixels(o.pixels), width(o.width), height(o.height) {
    o.pixels = nullptr;
    o.width  = 0;
    o.height = 0;
}

ImageData& ImageData::operator=(ImageData&& o) noexcept {
    if (this != &o) {
        if (pixels) {
            stbi_image_free(pixels);
        }
        pixels   = o.pixels;
        width    = o.width;
        height   = o.height;
        o.pixels = nullptr;
        o.width  = 0;
        o.height = 0;
    }
    return *this;
}

Result<ImageData> loadImage(const std::filesystem::path& path) {
    // Row 0 must be the bottom row, like every other sampled image.
    stbi_set_flip_vertically_on_load_thread(1);

    int w = 0, h = 0, ch = 0;
    unsigned char* pixels = stbi_load(path.string().c_str(), &w, &h, &ch, 4);
    if (!pixels) {
        const char* reason = stbi_failure_reason();
        Error e{"load image", 0,
                std::string(reason ? reason : "unknown error") + " -- path: " + path.string()};
        e.kind = ErrorKind::Io;
        return e;
    }

    ImageData data;
    data.pixels = pixels;
    data.width  = static_cast<std::uint32_t>(w);
    data.height = static_cast<std::uint32_t>(h);
    return data;
}

Result<Image> uploadTexture(const Allocator& allocator, const Device& device,
                            const void* rgba, std::uint32_t width, std::uint32_t height) {
    auto img = ImageBuilder(allocator)
                   .size(width, height)
                   .format(kTextureFormat)
                   .sampled()
                   .build();
    if (!img.ok()) return img.error();

    VkDeviceSize size = static_cast<VkDeviceSize>(width) * height * 4;
    auto staging = BufferBuilder(allocator).size(size).stagingBuffer().build();
    if (!staging.ok()) return staging.error();
    std::memcpy(staging.value().mappedData(), rgba, static_cast<std::size_t>(size));

    VkImage  dst = img.value().vkImage();
    VkBuffer src = staging.value().vkBuffer();

    auto copied = runOneShot(device, [&](VkCommandBuffer cmd) {
        transitionImage(cmd, dst,
                        VK_IMAGE_LAYOUT_UNDEFINED,
                        VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL,
                        VK_PIPELINE_STAGE_2_NONE, 0,
                        VK_PIPELINE_STAGE_2_COPY_BIT,
                        VK_ACCESS_2_TRANSFER_WRITE_BIT);

        VkBufferImageCopy region{};
        region.imageSubresource = {VK_IMAGE_ASPECT_COLOR_BIT, 0, 0, 1};
        region.imageExtent      = {width, height, 1};
        vkCmdCopyBufferToImage(cmd, src, dst, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL,
                               1, &region);

        transitionImage(cmd, dst,
                        VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL,
                        VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL,
                        VK_PIPELINE_STAGE_2_COPY_BIT,
                        VK_ACCESS_2_TRANSFER_WRITE_BIT,
                        VK_PIPELINE_STAGE_2_FRAGMENT_SHADER_BIT,
                        VK_ACCESS_2_SHADER_SAMPLED_READ_BIT);
    });
    if (!copied.ok()) {
        Error e = copied.error();
        e.operation = "upload texture";
        return e;
    }

    return std::move(img).value();
}

Result<Image> uploadTexture(const Allocator& allocator, const Device& device,
                            const ImageData& data) {
    return uploadTexture(allocator, device, data.pixels, data.width, data.height);
}

} // namespace layerfx
