#pragma once

#include <layerfx/device.hpp>
#include <layerfx/error.hpp>
#include <layerfx/result.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <functional>
#include <vector>

namespace layerfx {

// Per-frame handles returned by FrameSync::nextFrame(). Owns nothing.
// The image-acquire semaphore lives in SwapchainImage.
struct Frame {
    VkCommandBuffer cmd      = VK_NULL_HANDLE; // reset, not begun
    VkSemaphore     drawDone = VK_NULL_HANDLE; // signaled when the frame's commands finish
    VkFence         fence    = VK_NULL_HANDLE;
    std::uint32_t   index    = 0;              // frame-in-flight slot
};

// Command pool, command buffers, semaphores and fences for N frames in flight.
// Everything is allocated up front.
//
// Thread safety: thread-confined (render thread).
class FrameSync {
public:
    [[nodiscard]] static Result<FrameSync> create(const Device& device, std::uint32_t count = 2);

    ~FrameSync();
    FrameSync(FrameSync&&) noexcept;
    FrameSync& operator=(FrameSync&&) noexcept;
    FrameSync(const FrameSync&) = delete;
    FrameSync& operator=(const FrameSync&) = delete;

    // Waits for the slot's previous submission, then resets its fence and
    // command buffer.
    [[nodiscard]] Result<Frame> nextFrame();

    [[nodiscard]] std::uint32_t count() const { return count_; }

private:
    FrameSync() = default;
    void destroy();

    VkDevice      device_  = VK_NULL_HANDLE;
    VkCommandPool pool_    = VK_NULL_HANDLE;
    std::uint32_t count_   = 0;
    std::uint32_t current_ = 0;
    std::vector<VkCommandBuffer> cmds_;
    std::vector<VkSemaphore>     drawDone_;
    std::vector<VkFence>         fences_;
};

[[nodiscard]] Result<void> beginFrameCommands(VkCommandBuffer cmd);
[[nodiscard]] Result<void> endFrameCommands(VkCommandBuffer cmd);

// Waits on imageReady at waitStage, signals frame.drawDone and frame.fence.
[[nodiscard]] Result<void> submitFrame(VkQueue queue, const Frame& frame,
                                       VkSemaphore imageReady,
                                       VkPipelineStageFlags2 waitStage);

// Record with `record`, submit to the graphics queue and wait. Uses its own
// transient pool. Blocking: for creation-time work (clears, uploads) only.
[[nodiscard]] Result<void> runOneShot(const Device& device,
                                      const std::function<void(VkCommandBuffer)>& record);

} // namespace layerfx
