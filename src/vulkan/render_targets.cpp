#include <layerfx/render_targets.hpp>
#include <layerfx/allocator.hpp>
#include <layerfx/barriers.hpp>
#include <layerfx/device.hpp>
#include <layerfx/frames.hpp>

#include <cstdio>
#include <utility>

namespace layerfx {

RenderTargetPair::RenderTargetPair(const Device& device, const Allocator& allocator,
                                   Sampler sampler)
    : device_(&device), allocator_(&allocator), sampler_(std::move(sampler)) {}

Result<RenderTargetPair> RenderTargetPair::create(const Device& device,
                                                  const Allocator& allocator,
                                                  VkExtent2D size) {
    auto sampler = Sampler::create(device, SamplerUse::RenderTarget);
    if (!sampler.ok()) return sampler.error();

    RenderTargetPair pair(device, allocator, std::move(sampler).value());

    auto images = pair.allocate(size);
    if (!images.ok()) return images.error();

    pair.images_ = std::move(images).value();
    pair.extent_ = size;
    return pair;
}

Result<std::vector<Image>> RenderTargetPair::allocate(VkExtent2D size) const {
    std::vector<Image> images;
    images.reserve(3);
    for (int i = 0; i < 3; ++i) {
        auto img = ImageBuilder(*allocator_)
                       .size(size)
                       .format(kRenderTargetFormat)
                       .renderTarget()
                       .build();
        if (!img.ok()) return img.error();
        images.push_back(std::move(img).value());
    }

    auto cleared = runOneShot(*device_, [&](VkCommandBuffer cmd) {
        VkClearColorValue transparent{};
        for (const auto& img : images) clearToSampled(cmd, img.vkImage(), transparent);
    });
    if (!cleared.ok()) return cleared.error();

    return images;
}

void RenderTargetPair::recordSnapshot(VkCommandBuffer cmd, std::uint32_t index) const {
    copySampledImage(cmd, slot(index).vkImage(), snapshot().vkImage(), extent_);
}

Result<void> RenderTargetPair::resize(VkExtent2D size) {
    if (size.width == 0 || size.height == 0) {
        return Error{"resize render targets", 0, "size is 0"};
    }

    auto images = allocate(size);
    if (!images.ok()) return images.error();

    images_ = std::move(images).value();
    extent_ = size;
    std::fprintf(stderr, "[layerfx] render targets resized to %ux%u\n",
                 size.width, size.height);
    return {};
}

} // namespace layerfx
