#include <layerfx/allocator.hpp>
#include <layerfx/device.hpp>
#include <layerfx/instance.hpp>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmissing-field-initializers"
#pragma GCC diagnostic ignored "-Wunused-parameter"
#pragma GCC diagnostic ignored "-Wunused-variable"
#define VMA_IMPLEMENTATION
#include <vk_mem_alloc.h>
#pragma GCC diagnostic pop

#include <cstdint>

namespace layerfx {

Allocator::~Allocator() {
    if (allocator_ != nullptr) {
        vmaDestroyAllocator(allocator_);
    }
}

Allocator::Allocator(Allocator&& o) noexcept
    : allocator_(o.allocator_), device_(o.device_) {
    o.allocator_ = nullptr;
    o.device_    = VK_NULL_HANDLE;
}

Allocator& Allocator::operator=(Allocator&& o) noexcept {
    if (this != &o) {
        if (allocator_ != nullptr) {
            vmaDestroyAllocator(allocator_);
        }
        allocator_   = o.allocator_;
        device_      = o.device_;
        o.allocator_ = nullptr;
        o.device_    = VK_NULL_HANDLE;
    }
    return *this;
}

Result<Allocator> Allocator::create(const Instance& instance, const Device& device) {
    VmaAllocatorCreateInfo ci{};
    ci.instance         = instance.vkInstance();
    ci.physicalDevice   = device.vkPhysicalDevice();
    ci.device           = device.vkDevice();
    ci.vulkanApiVersion = VK_API_VERSION_1_3;

    Allocator a;
    a.device_ = device.vkDevice();

    VkResult vr = vmaCreateAllocator(&ci, &a.allocator_);
    if (vr != VK_SUCCESS) {
        Error e{"create allocator", static_cast<std::int32_t>(vr), "vmaCreateAllocator failed"};
        e.kind = ErrorKind::Startup;
        return e;
    }

    return a;
}

} // namespace layerfx
