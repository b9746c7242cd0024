#include <layerfx/frames.hpp>

#include <cstdint>
#include <string>

namespace layerfx {

namespace {

Error gpuError(std::string op, VkResult vr, std::string message) {
    return Error{std::move(op), static_cast<std::int32_t>(vr), std::move(message)};
}

} // anonymous namespace

void FrameSync::destroy() {
    if (device_ == VK_NULL_HANDLE) return;

    for (auto s : drawDone_) vkDestroySemaphore(device_, s, nullptr);
    for (auto f : fences_)   vkDestroyFence(device_, f, nullptr);
    if (pool_ != VK_NULL_HANDLE) {
        vkDestroyCommandPool(device_, pool_, nullptr);
    }

    drawDone_.clear();
    fences_.clear();
    cmds_.clear();
    pool_   = VK_NULL_HANDLE;
    device_ = VK_NULL_HANDLE;
}

FrameSync::~FrameSync() { destroy(); }

FrameSync::FrameSync(FrameSync&& o) noexcept
    : device_(o.device_), pool_(o.pool_), count_(o.count_), current_(o.current_),
      cmds_(std::move(o.cmds_)),
      drawDone_(std::move(o.drawDone_)),
      fences_(std::move(o.fences_)) {
    o.device_ = VK_NULL_HANDLE;
    o.pool_   = VK_NULL_HANDLE;
}

FrameSync& FrameSync::operator=(FrameSync&& o) noexcept {
    if (this != &o) {
        destroy();
        device_   = o.device_;
        pool_     = o.pool_;
        count_    = o.count_;
        current_  = o.current_;
        cmds_     = std::move(o.cmds_);
        drawDone_ = std::move(o.drawDone_);
        fences_   = std::move(o.fences_);
        o.device_ = VK_NULL_HANDLE;
        o.pool_   = VK_NULL_HANDLE;
    }
    return *this;
}

Result<FrameSync> FrameSync::create(const Device& device, std::uint32_t count) {
    if (count == 0) {
        return Error{"create frame sync", 0, "need at least one frame in flight"};
    }

    FrameSync fs;
    fs.device_ = device.vkDevice();
    fs.count_  = count;

    VkCommandPoolCreateInfo poolCI{};
    poolCI.sType            = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
    poolCI.flags            = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;
    poolCI.queueFamilyIndex = device.queueFamilies().graphics;

    VkResult vr = vkCreateCommandPool(fs.device_, &poolCI, nullptr, &fs.pool_);
    if (vr != VK_SUCCESS) {
        return gpuError("create command pool", vr, "vkCreateCommandPool failed");
    }

    fs.cmds_.resize(count);
    VkCommandBufferAllocateInfo allocInfo{};
    allocInfo.sType              = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
    allocInfo.commandPool        = fs.pool_;
    allocInfo.level              = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
    allocInfo.commandBufferCount = count;

    vr = vkAllocateCommandBuffers(fs.device_, &allocInfo, fs.cmds_.data());
    if (vr != VK_SUCCESS) {
        return gpuError("allocate command buffers", vr, "vkAllocateCommandBuffers failed");
    }

    VkSemaphoreCreateInfo semCI{};
    semCI.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;

    VkFenceCreateInfo fenceCI{};
    fenceCI.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
    fenceCI.flags = VK_FENCE_CREATE_SIGNALED_BIT;

    fs.drawDone_.assign(count, VK_NULL_HANDLE);
    fs.fences_.assign(count, VK_NULL_HANDLE);

    for (std::uint32_t i = 0; i < count; ++i) {
        vr = vkCreateSemaphore(fs.device_, &semCI, nullptr, &fs.drawDone_[i]);
        if (vr != VK_SUCCESS) {
            return gpuError("create semaphore", vr, "frame " + std::to_string(i));
        }
        vr = vkCreateFence(fs.device_, &fenceCI, nullptr, &fs.fences_[i]);
        if (vr != VK_SUCCESS) {
            return gpuError("create fence", vr, "frame " + std::to_string(i));
        }
    }

    return fs;
}

Result<Frame> FrameSync::nextFrame() {
    std::uint32_t i = current_;

    VkResult vr = vkWaitForFences(device_, 1, &fences_[i], VK_TRUE, UINT64_MAX);
    if (vr != VK_SUCCESS) {
        return gpuError("wait for fence", vr, "frame " + std::to_string(i));
    }
    vr = vkResetFences(device_, 1, &fences_[i]);
    if (vr != VK_SUCCESS) {
        return gpuError("reset fence", vr, "vkResetFences failed");
    }
    vr = vkResetCommandBuffer(cmds_[i], 0);
    if (vr != VK_SUCCESS) {
        return gpuError("reset command buffer", vr, "vkResetCommandBuffer failed");
    }

    current_ = (current_ + 1) % count_;
    return Frame{cmds_[i], drawDone_[i], fences_[i], i};
}

Result<void> beginFrameCommands(VkCommandBuffer cmd) {
    VkCommandBufferBeginInfo bi{};
    bi.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
    bi.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
    VkResult vr = vkBeginCommandBuffer(cmd, &bi);
    if (vr != VK_SUCCESS) {
        return gpuError("begin command buffer", vr, "vkBeginCommandBuffer failed");
    }
    return {};
}

Result<void> endFrameCommands(VkCommandBuffer cmd) {
    VkResult vr = vkEndCommandBuffer(cmd);
    if (vr != VK_SUCCESS) {
        return gpuError("end command buffer", vr, "vkEndCommandBuffer failed");
    }
    return {};
}

Result<void> submitFrame(VkQueue queue, const Frame& frame,
                         VkSemaphore imageReady, VkPipelineStageFlags2 waitStage) {
    VkSemaphoreSubmitInfo wait{};
    wait.sType     = VK_STRUCTURE_TYPE_SEMAPHORE_SUBMIT_INFO;
    wait.semaphore = imageReady;
    wait.stageMask = waitStage;

    VkSemaphoreSubmitInfo signal{};
    signal.sType     = VK_STRUCTURE_TYPE_SEMAPHORE_SUBMIT_INFO;
    signal.semaphore = frame.drawDone;
    signal.stageMask = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT;

    VkCommandBufferSubmitInfo cmdInfo{};
    cmdInfo.sType         = VK_STRUCTURE_TYPE_COMMAND_BUFFER_SUBMIT_INFO;
    cmdInfo.commandBuffer = frame.cmd;

    VkSubmitInfo2 si{};
    si.sType                    = VK_STRUCTURE_TYPE_SUBMIT_INFO_2;
    si.waitSemaphoreInfoCount   = 1;
    si.pWaitSemaphoreInfos      = &wait;
    si.commandBufferInfoCount   = 1;
    si.pCommandBufferInfos      = &cmdInfo;
    si.signalSemaphoreInfoCount = 1;
    si.pSignalSemaphoreInfos    = &signal;

    VkResult vr = vkQueueSubmit2(queue, 1, &si, frame.fence);
    if (vr != VK_SUCCESS) {
        return gpuError("submit frame", vr, "vkQueueSubmit2 failed");
    }
    return {};
}

Result<void> runOneShot(const Device& device,
                        const std::function<void(VkCommandBuffer)>& record) {
    VkDevice dev = device.vkDevice();

    VkCommandPoolCreateInfo poolCI{};
    poolCI.sType            = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
    poolCI.flags            = VK_COMMAND_POOL_CREATE_TRANSIENT_BIT;
    poolCI.queueFamilyIndex = device.queueFamilies().graphics;

    VkCommandPool pool = VK_NULL_HANDLE;
    VkResult vr = vkCreateCommandPool(dev, &poolCI, nullptr, &pool);
    if (vr != VK_SUCCESS) {
        return gpuError("create one-shot pool", vr, "vkCreateCommandPool failed");
    }

    // Destroying the pool frees its command buffer.
    struct PoolGuard {
        VkDevice device; VkCommandPool pool;
        ~PoolGuard() { vkDestroyCommandPool(device, pool, nullptr); }
    } guard{dev, pool};

    VkCommandBufferAllocateInfo allocInfo{};
    allocInfo.sType              = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
    allocInfo.commandPool        = pool;
    allocInfo.level              = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
    allocInfo.commandBufferCount = 1;

    VkCommandBuffer cmd = VK_NULL_HANDLE;
    vr = vkAllocateCommandBuffers(dev, &allocInfo, &cmd);
    if (vr != VK_SUCCESS) {
        return gpuError("allocate one-shot command buffer", vr, "vkAllocateCommandBuffers failed");
    }

    auto begun = beginFrameCommands(cmd);
    if (!begun.ok()) return begun.error();

    record(cmd);

    auto ended = endFrameCommands(cmd);
    if (!ended.ok()) return ended.error();

    VkSubmitInfo si{};
    si.sType              = VK_STRUCTURE_TYPE_SUBMIT_INFO;
    si.commandBufferCount = 1;
    si.pCommandBuffers    = &cmd;

    vr = vkQueueSubmit(device.graphicsQueue(), 1, &si, VK_NULL_HANDLE);
    if (vr != VK_SUCCESS) {
        return gpuError("submit one-shot commands", vr, "vkQueueSubmit failed");
    }

    vr = vkQueueWaitIdle(device.graphicsQueue());
    if (vr != VK_SUCCESS) {
        return gpuError("wait for one-shot commands", vr, "vkQueueWaitIdle failed");
    }
    return {};
}

} // namespace layerfx
