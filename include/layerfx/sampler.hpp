#pragma once

#include <layerfx/error.hpp>
#include <layerfx/result.hpp>

#include <vulkan/vulkan.h>

namespace layerfx {

class Device;

// What a sampler reads. Both filter linearly with a single mip level.
enum class SamplerUse {
    RenderTarget, // clamp to edge: uTexture, uBgTexture
    Texture,      // repeat: custom textures, tiled noise and grain
};

// Thread safety: immutable after construction.
class Sampler {
public:
    [[nodiscard]] static Result<Sampler> create(const Device& device, SamplerUse use);

    ~Sampler();
    Sampler(Sampler&&) noexcept;
    Sampler& operator=(Sampler&&) noexcept;
    Sampler(const Sampler&) = delete;
    Sampler& operator=(const Sampler&) = delete;

    [[nodiscard]] VkSampler  vkSampler() const { return sampler_; }
    [[nodiscard]] SamplerUse use()       const { return use_; }

private:
    Sampler() = default;
    void destroy();

    VkDevice   device_  = VK_NULL_HANDLE;
    VkSampler  sampler_ = VK_NULL_HANDLE;
    SamplerUse use_     = SamplerUse::RenderTarget;
};

} // namespace layerfx
