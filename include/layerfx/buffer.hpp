#pragma once

#include <layerfx/error.hpp>
#include <layerfx/result.hpp>
#include <layerfx/vma_fwd.hpp>

#include <vulkan/vulkan.h>

#include <cstddef>

namespace layerfx {

class Allocator;
class Device;

// Thread safety: immutable after construction.
class Buffer {
public:
    ~Buffer();
    Buffer(Buffer&&) noexcept;
    Buffer& operator=(Buffer&&) noexcept;
    Buffer(const Buffer&) = delete;
    Buffer& operator=(const Buffer&) = delete;

    [[nodiscard]] VkBuffer     native()     const { return buffer_; }
    [[nodiscard]] VkBuffer     vkBuffer()   const { return native(); }
    [[nodiscard]] VkDeviceSize size()       const { return size_; }
    [[nodiscard]] void*        mappedData() const { return mapped_; }

    // Make GPU writes visible to mappedData() reads on non-coherent memory.
    [[nodiscard]] Result<void> invalidate() const;

private:
    friend class BufferBuilder;
    Buffer() = default;
    void destroy();

    VmaAllocator  allocator_  = nullptr;
    VkBuffer      buffer_     = VK_NULL_HANDLE;
    VmaAllocation allocation_ = nullptr;
    VkDeviceSize  size_       = 0;
    void*         mapped_     = nullptr;
};

class BufferBuilder {
public:
    explicit BufferBuilder(const Allocator& allocator);

    BufferBuilder& size(VkDeviceSize bytes);

    BufferBuilder& vertexBuffer();  // VERTEX_BUFFER | TRANSFER_DST, device-local
    BufferBuilder& stagingBuffer(); // TRANSFER_SRC, host-mapped
    BufferBuilder& readbackBuffer(); // TRANSFER_DST, host-mapped for reads

    BufferBuilder& usage(VkBufferUsageFlags flags);
    BufferBuilder& mapped();

    [[nodiscard]] Result<Buffer> build();

private:
    VmaAllocator       allocator_ = nullptr;
    VkDeviceSize       size_      = 0;
    VkBufferUsageFlags usage_     = 0;
    bool               mapped_    = false;
    bool               hostRead_  = false;
};

// Creates a device-local vertex buffer and copies `data` into it through a
// staging buffer. Blocking -- creation time only.
[[nodiscard]] Result<Buffer> uploadVertexBuffer(const Allocator& allocator, const Device& device,
                                                const void* data, VkDeviceSize size);

} // namespace layerfx
