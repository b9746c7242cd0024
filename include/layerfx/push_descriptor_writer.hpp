#pragma once

#include <vulkan/vulkan.h>

#include <cstdint>
#include <vector>

namespace layerfx {

// Accumulates combined-image-sampler writes and pushes them with
// vkCmdPushDescriptorSetKHR. No pool, no set allocation.
//
// Thread safety: thread-confined.
//
// Usage:
//   PushDescriptorWriter(device.pushDescriptorFn(), layout, 0)
//       .image(0, view, VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL, sampler)
//       .push(cmd);
class PushDescriptorWriter {
public:
    PushDescriptorWriter(PFN_vkCmdPushDescriptorSetKHR pushFn,
                         VkPipelineLayout layout, std::uint32_t set);

    PushDescriptorWriter& image(std::uint32_t binding, VkImageView view,
                                VkImageLayout imageLayout, VkSampler sampler);

    [[nodiscard]] std::uint32_t count() const {
        return static_cast<std::uint32_t>(bindings_.size());
    }

    // Graphics bind point.
    void push(VkCommandBuffer cmd);

private:
    PFN_vkCmdPushDescriptorSetKHR pushFn_;
    VkPipelineLayout              layout_;
    std::uint32_t                 set_;

    std::vector<std::uint32_t>         bindings_;
    std::vector<VkDescriptorImageInfo> imageInfos_;
};

} // namespace layerfx
