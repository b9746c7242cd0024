#pragma once

#include <layerfx/error.hpp>
#include <layerfx/result.hpp>
#include <layerfx/vma_fwd.hpp>

#include <vulkan/vulkan.h>

namespace layerfx {

class Instance;
class Device;

// Owns the VMA allocator every image and buffer is carved from.
//
// Thread safety: thread-confined. Texture uploads happen on the render
// thread, so VMA's internal locking is never contended.
class Allocator {
public:
    [[nodiscard]] static Result<Allocator> create(const Instance& instance, const Device& device);

    ~Allocator();
    Allocator(Allocator&&) noexcept;
    Allocator& operator=(Allocator&&) noexcept;
    Allocator(const Allocator&) = delete;
    Allocator& operator=(const Allocator&) = delete;

    [[nodiscard]] VmaAllocator native()       const { return allocator_; }
    [[nodiscard]] VmaAllocator vmaAllocator() const { return native(); }
    [[nodiscard]] VkDevice     vkDevice()     const { return device_; }

private:
    Allocator() = default;

    VmaAllocator allocator_ = nullptr;
    VkDevice     device_    = VK_NULL_HANDLE;
};

} // namespace layerfx
