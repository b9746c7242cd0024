#pragma once

#include <vulkan/vulkan.h>

namespace layerfx {

// Color image layout transition using VkImageMemoryBarrier2.
void transitionImage(VkCommandBuffer cmd, VkImage image,
                     VkImageLayout oldLayout, VkImageLayout newLayout,
                     VkPipelineStageFlags2 srcStage, VkAccessFlags2 srcAccess,
                     VkPipelineStageFlags2 dstStage, VkAccessFlags2 dstAccess);

// Swapchain image: UNDEFINED -> COLOR_ATTACHMENT_OPTIMAL.
void transitionToColorAttachment(VkCommandBuffer cmd, VkImage image);

// Swapchain image: COLOR_ATTACHMENT_OPTIMAL -> PRESENT_SRC_KHR.
void transitionToPresent(VkCommandBuffer cmd, VkImage image);

// Render target: SHADER_READ_ONLY_OPTIMAL -> COLOR_ATTACHMENT_OPTIMAL.
// Waits for earlier fragment-shader reads of the target.
void transitionToRenderTarget(VkCommandBuffer cmd, VkImage image);

// Render target: COLOR_ATTACHMENT_OPTIMAL -> SHADER_READ_ONLY_OPTIMAL.
void transitionToSampled(VkCommandBuffer cmd, VkImage image);

// Clear a color image from any layout (contents are discarded) and leave it in
// SHADER_READ_ONLY_OPTIMAL.
void clearToSampled(VkCommandBuffer cmd, VkImage image, VkClearColorValue clearValue);

// Copy `src` into `dst` (same extent). Both start and end in
// SHADER_READ_ONLY_OPTIMAL; the old contents of `dst` are discarded.
void copySampledImage(VkCommandBuffer cmd, VkImage src, VkImage dst, VkExtent2D extent);

} // namespace layerfx
