#pragma once

#include <layerfx/error.hpp>
#include <layerfx/frame_plan.hpp>
#include <layerfx/image.hpp>
#include <layerfx/result.hpp>
#include <layerfx/sampler.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <vector>

namespace layerfx {

class Allocator;
class Device;

inline constexpr VkFormat kRenderTargetFormat = VK_FORMAT_R16G16B16A16_SFLOAT;

// The two offscreen images layers ping-pong between, plus the linear
// clamp-to-edge sampler they are read through. Between draws both images are
// in SHADER_READ_ONLY_OPTIMAL. swap() only relabels; input and output are
// always distinct images.
//
// A third image of the same size holds a copy of the background when a layer
// would otherwise sample the slot it renders into.
//
// Thread safety: thread-confined (render thread).
class RenderTargetPair {
public:
    [[nodiscard]] static Result<RenderTargetPair> create(const Device& device,
                                                         const Allocator& allocator,
                                                         VkExtent2D size);

    RenderTargetPair(RenderTargetPair&&) noexcept = default;
    RenderTargetPair& operator=(RenderTargetPair&&) noexcept = default;
    RenderTargetPair(const RenderTargetPair&) = delete;
    RenderTargetPair& operator=(const RenderTargetPair&) = delete;

    // Reallocate both images at `size`, cleared to transparent black. The
    // previous contents are gone. The device must be idle. On failure the old
    // images are kept.
    [[nodiscard]] Result<void> resize(VkExtent2D size);

    void swap() { labels_.swap(); }

    [[nodiscard]] PingPong&       labels()       { return labels_; }
    [[nodiscard]] const PingPong& labels() const { return labels_; }

    [[nodiscard]] const Image& slot(std::uint32_t index) const { return images_[index & 1u]; }
    [[nodiscard]] const Image& input()  const { return slot(labels_.input()); }
    [[nodiscard]] const Image& output() const { return slot(labels_.output()); }

    [[nodiscard]] const Image& snapshot() const { return images_[2]; }

    // Record a copy of slot `index` into snapshot().
    void recordSnapshot(VkCommandBuffer cmd, std::uint32_t index) const;

    [[nodiscard]] VkExtent2D extent()  const { return extent_; }
    [[nodiscard]] VkSampler  sampler() const { return sampler_.vkSampler(); }

private:
    RenderTargetPair(const Device& device, const Allocator& allocator, Sampler sampler);

    [[nodiscard]] Result<std::vector<Image>> allocate(VkExtent2D size) const;

    const Device*      device_;
    const Allocator*   allocator_;
    Sampler            sampler_;
    std::vector<Image> images_;
    VkExtent2D         extent_ = {0, 0};
    PingPong           labels_;
};

} // namespace layerfx
