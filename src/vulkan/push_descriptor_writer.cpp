#include <layerfx/push_descriptor_writer.hpp>

#include <cstddef>

namespace layerfx {

PushDescriptorWriter::PushDescriptorWriter(PFN_vkCmdPushDescriptorSetKHR pushFn,
                                           VkPipelineLayout layout, std::uint32_t set)
    : pushFn_(pushFn), layout_(layout), set_(set) {}

PushDescriptorWriter& PushDescriptorWriter::image(std::uint32_t binding, VkImageView view,
                                                  VkImageLayout imageLayout, VkSampler sampler) {
    VkDescriptorImageInfo info{};
    info.sampler     = sampler;
    info.imageView   = view;
    info.imageLayout = imageLayout;
    bindings_.push_back(binding);
    imageInfos_.push_back(info);
    return *this;
}

void PushDescriptorWriter::push(VkCommandBuffer cmd) {
    if (bindings_.empty() || pushFn_ == nullptr) return;

    // imageInfos_ no longer grows, so the pointers below stay valid.
    std::vector<VkWriteDescriptorSet> writes;
    writes.reserve(bindings_.size());

    for (std::size_t i = 0; i < bindings_.size(); ++i) {
        VkWriteDescriptorSet w{};
        w.sType           = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
        w.dstSet          = VK_NULL_HANDLE; // ignored for push descriptors
        w.dstBinding      = bindings_[i];
        w.descriptorCount = 1;
        w.descriptorType  = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
        w.pImageInfo      = &imageInfos_[i];
        writes.push_back(w);
    }

    pushFn_(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, layout_, set_,
            static_cast<std::uint32_t>(writes.size()), writes.data());
}

} // namespace layerfx
