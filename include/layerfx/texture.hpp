#pragma once

#include <layerfx/error.hpp>
#include <layerfx/image.hpp>
#include <layerfx/result.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <filesystem>

namespace layerfx {

class Allocator;
class Device;

// Decoded pixels. Always RGBA, one byte per channel, bottom row first.
// Owns the pixel memory.
struct ImageData {
    ~ImageData();
    ImageData(ImageData&&) noexcept;
    ImageData& operator=(ImageData&&) noexcept;
    ImageData(const ImageData&) = delete;
    ImageData& operator=(const ImageData&) = delete;

    unsigned char* pixels = nullptr;
    std::uint32_t  width  = 0;
    std::uint32_t  height = 0;

    [[nodiscard]] VkDeviceSize sizeBytes() const {
        return static_cast<VkDeviceSize>(width) * height * 4;
    }

private:
    friend Result<ImageData> loadImage(const std::filesystem::path&);
    ImageData() = default;
};

// Decode a PNG/JPG/BMP/TGA file with stb_image. Safe to call from any
// thread. Fails with an Io error.
[[nodiscard]] Result<ImageData> loadImage(const std::filesystem::path& path);

inline constexpr VkFormat kTextureFormat = VK_FORMAT_R8G8B8A8_UNORM;

// Create a sampled kTextureFormat image from tightly packed RGBA pixels and
// leave it in SHADER_READ_ONLY_OPTIMAL. Blocking: render thread, outside
// command recording.
[[nodiscard]] Result<Image> uploadTexture(const Allocator& allocator, const Device& device,
                                          const void* rgba,
                                          std::uint32_t width, std::uint32_t height);

[[nodiscard]] Result<Image> uploadTexture(const Allocator& allocator, const Device& device,
                                          const ImageData& data);

} // namespace layerfx
