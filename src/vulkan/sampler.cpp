#include <layerfx/sampler.hpp>
#include <layerfx/device.hpp>

#include <cstdint>
#include <utility>

namespace layerfx {

Sampler::~Sampler() { destroy(); }

void Sampler::destroy() {
    if (sampler_ == VK_NULL_HANDLE) return;
    vkDestroySampler(device_, sampler_, nullptr);
    sampler_ = VK_NULL_HANDLE;
}

Sampler::Sampler(Sampler&& o) noexcept
    : device_(std::exchange(o.device_, VK_NULL_HANDLE)),
      sampler_(std::exchange(o.sampler_, VK_NULL_HANDLE)),
      use_(o.use_) {}

Sampler& Sampler::operator=(Sampler&& o) noexcept {
    if (this != &o) {
        destroy();
        device_  = std::exchange(o.device_, VK_NULL_HANDLE);
        sampler_ = std::exchange(o.sampler_, VK_NULL_HANDLE);
        use_     = o.use_;
    }
    return *this;
}

Result<Sampler> Sampler::create(const Device& device, SamplerUse use) {
    const VkSamplerAddressMode address = use == SamplerUse::Texture
        ? VK_SAMPLER_ADDRESS_MODE_REPEAT
        : VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;

    VkSamplerCreateInfo ci{};
    ci.sType        = VK_STRUCTURE_TYPE_SAMPLER_CREATE_INFO;
    ci.magFilter    = VK_FILTER_LINEAR;
    ci.minFilter    = VK_FILTER_LINEAR;
    ci.mipmapMode   = VK_SAMPLER_MIPMAP_MODE_NEAREST;
    ci.addressModeU = address;
    ci.addressModeV = address;
    ci.addressModeW = address;
    ci.maxLod       = 0.0f;

    Sampler s;
    s.device_ = device.vkDevice();
    s.use_    = use;

    VkResult vr = vkCreateSampler(s.device_, &ci, nullptr, &s.sampler_);
    if (vr != VK_SUCCESS) {
        return Error{"create sampler", static_cast<std::int32_t>(vr),
                     use == SamplerUse::Texture ? "texture sampler" : "render target sampler"};
    }
    return s;
}

} // namespace layerfx
