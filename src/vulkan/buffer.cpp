#include <layerfx/buffer.hpp>
#include <layerfx/allocator.hpp>
#include <layerfx/device.hpp>
#include <layerfx/frames.hpp>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmissing-field-initializers"
#pragma GCC diagnostic ignored "-Wunused-parameter"
#pragma GCC diagnostic ignored "-Wunused-variable"
#include <vk_mem_alloc.h>
#pragma GCC diagnostic pop

#include <cstring>
#include <utility>

namespace layerfx {

void Buffer::destroy() {
    if (buffer_ != VK_NULL_HANDLE) {
        vmaDestroyBuffer(allocator_, buffer_, allocation_);
        buffer_     = VK_NULL_HANDLE;
        allocation_ = nullptr;
        mapped_     = nullptr;
    }
}

Buffer::~Buffer() { destroy(); }

Buffer::Buffer(Buffer&& o) noexcept
    : allocator_(o.allocator_), buffer_(o.buffer_), allocation_(o.allocation_),
      size_(o.size_), mapped_(o.mapped_) {
    o.allocator_  = nullptr;
    o.buffer_     = VK_NULL_HANDLE;
    o.allocation_ = nullptr;
    o.size_       = 0;
    o.mapped_     = nullptr;
}

Buffer& Buffer::operator=(Buffer&& o) noexcept {
    if (this != &o) {
        destroy();
        allocator_    = o.allocator_;
        buffer_       = o.buffer_;
        allocation_   = o.allocation_;
        size_         = o.size_;
        mapped_       = o.mapped_;
        o.allocator_  = nullptr;
        o.buffer_     = VK_NULL_HANDLE;
        o.allocation_ = nullptr;
        o.size_       = 0;
        o.mapped_     = nullptr;
    }
    return *this;
}

BufferBuilder::BufferBuilder(const Allocator& allocator)
    : allocator_(allocator.vmaAllocator()) {}

BufferBuilder& BufferBuilder::size(VkDeviceSize bytes) {
    size_ = bytes;
    return *this;
}

BufferBuilder& BufferBuilder::vertexBuffer() {
    usage_    = VK_BUFFER_USAGE_VERTEX_BUFFER_BIT | VK_BUFFER_USAGE_TRANSFER_DST_BIT;
    mapped_   = false;
    hostRead_ = false;
    return *this;
}

BufferBuilder& BufferBuilder::stagingBuffer() {
    usage_    = VK_BUFFER_USAGE_TRANSFER_SRC_BIT;
    mapped_   = true;
    hostRead_ = false;
    return *this;
}

BufferBuilder& BufferBuilder::readbackBuffer() {
    usage_    = VK_BUFFER_USAGE_TRANSFER_DST_BIT;
    mapped_   = true;
    hostRead_ = true;
    return *this;
}

BufferBuilder& BufferBuilder::usage(VkBufferUsageFlags flags) {
    usage_ = flags;
    return *this;
}

BufferBuilder& BufferBuilder::mapped() {
    mapped_ = true;
    return *this;
}

Result<Buffer> BufferBuilder::build() {
    if (size_ == 0) {
        return Error{"create buffer", 0, "buffer size is 0 -- call size(bytes)"};
    }
    if (usage_ == 0) {
        return Error{"create buffer", 0,
                     "no usage flags -- call vertexBuffer() or stagingBuffer()"};
    }

    VkBufferCreateInfo bufCI{};
    bufCI.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
    bufCI.size  = size_;
    bufCI.usage = usage_;

    VmaAllocationCreateInfo allocCI{};
    allocCI.usage = VMA_MEMORY_USAGE_AUTO;
    if (mapped_) {
        allocCI.flags = (hostRead_ ? VMA_ALLOCATION_CREATE_HOST_ACCESS_RANDOM_BIT
                                   : VMA_ALLOCATION_CREATE_HOST_ACCESS_SEQUENTIAL_WRITE_BIT) |
                        VMA_ALLOCATION_CREATE_MAPPED_BIT;
    }

    Buffer buf;
    buf.allocator_ = allocator_;
    buf.size_      = size_;

    VmaAllocationInfo allocInfo{};
    VkResult vr = vmaCreateBuffer(allocator_, &bufCI, &allocCI,
                                  &buf.buffer_, &buf.allocation_, &allocInfo);
    if (vr != VK_SUCCESS) {
        return Error{"create buffer", static_cast<std::int32_t>(vr), "vmaCreateBuffer failed"};
    }
    if (mapped_) {
        buf.mapped_ = allocInfo.pMappedData;
    }

    return buf;
}

Result<void> Buffer::invalidate() const {
    VkResult vr = vmaInvalidateAllocation(allocator_, allocation_, 0, VK_WHOLE_SIZE);
    if (vr != VK_SUCCESS) {
        return Error{"invalidate buffer", static_cast<std::int32_t>(vr),
                     "vmaInvalidateAllocation failed"};
    }
    return {};
}

Result<Buffer> uploadVertexBuffer(const Allocator& allocator, const Device& device,
                                  const void* data, VkDeviceSize size) {
    auto staging = BufferBuilder(allocator).size(size).stagingBuffer().build();
    if (!staging.ok()) return staging.error();

    auto dst = BufferBuilder(allocator).size(size).vertexBuffer().build();
    if (!dst.ok()) return dst.error();

    std::memcpy(staging.value().mappedData(), data, static_cast<std::size_t>(size));

    VkBuffer src = staging.value().vkBuffer();
    VkBuffer out = dst.value().vkBuffer();
    auto copied = runOneShot(device, [&](VkCommandBuffer cmd) {
        VkBufferCopy region{0, 0, size};
        vkCmdCopyBuffer(cmd, src, out, 1, &region);

        VkMemoryBarrier2 toVertexRead{};
        toVertexRead.sType         = VK_STRUCTURE_TYPE_MEMORY_BARRIER_2;
        toVertexRead.srcStageMask  = VK_PIPELINE_STAGE_2_COPY_BIT;
        toVertexRead.srcAccessMask = VK_ACCESS_2_TRANSFER_WRITE_BIT;
        toVertexRead.dstStageMask  = VK_PIPELINE_STAGE_2_VERTEX_ATTRIBUTE_INPUT_BIT;
        toVertexRead.dstAccessMask = VK_ACCESS_2_VERTEX_ATTRIBUTE_READ_BIT;

        VkDependencyInfo dep{};
        dep.sType              = VK_STRUCTURE_TYPE_DEPENDENCY_INFO;
        dep.memoryBarrierCount = 1;
        dep.pMemoryBarriers    = &toVertexRead;
        vkCmdPipelineBarrier2(cmd, &dep);
    });
    if (!copied.ok()) return copied.error();

    return std::move(dst).value();
}

} // namespace layerfx
