#pragma once

#include <layerfx/error.hpp>
#include <layerfx/result.hpp>

#include <vulkan/vulkan.h>

#include <cstdint>
#include <string>
#include <vector>

namespace layerfx {

class Instance;
class Surface;

enum class GpuPrefer {
    Discrete,
    Integrated,
    Any,
};

struct QueueFamilies {
    std::uint32_t graphics = UINT32_MAX;
    std::uint32_t present  = UINT32_MAX;

    [[nodiscard]] bool valid()  const { return graphics != UINT32_MAX && present != UINT32_MAX; }
    [[nodiscard]] bool shared() const { return graphics == present; }
};

// Logical device with one graphics and one present queue. Always created with
// dynamic rendering, synchronization2 and VK_KHR_push_descriptor; the layer
// programs bind their samplers through push descriptors.
//
// Thread safety: immutable after construction. Queues follow Vulkan's
// externally-synchronized rules.
class Device {
public:
    ~Device();
    Device(Device&&) noexcept;
    Device& operator=(Device&&) noexcept;
    Device(const Device&) = delete;
    Device& operator=(const Device&) = delete;

    [[nodiscard]] VkDevice         native()           const { return device_; }
    [[nodiscard]] VkDevice         vkDevice()         const { return native(); }
    [[nodiscard]] VkPhysicalDevice vkPhysicalDevice() const { return physicalDevice_; }
    [[nodiscard]] VkQueue          graphicsQueue()    const { return graphicsQueue_; }
    [[nodiscard]] VkQueue          presentQueue()     const { return presentQueue_; }
    [[nodiscard]] QueueFamilies    queueFamilies()    const { return families_; }
    [[nodiscard]] const char*      gpuName()          const { return gpuName_.c_str(); }
    [[nodiscard]] std::uint32_t    maxPushConstantsSize() const { return maxPushConstants_; }

    [[nodiscard]] PFN_vkCmdPushDescriptorSetKHR pushDescriptorFn() const { return pfnPushDescriptor_; }

    void waitIdle() const;

private:
    friend class DeviceBuilder;
    Device() = default;

    VkDevice         device_         = VK_NULL_HANDLE;
    VkPhysicalDevice physicalDevice_ = VK_NULL_HANDLE;
    VkQueue          graphicsQueue_  = VK_NULL_HANDLE;
    VkQueue          presentQueue_   = VK_NULL_HANDLE;
    QueueFamilies    families_;
    std::string      gpuName_;
    std::uint32_t    maxPushConstants_ = 128;

    PFN_vkCmdPushDescriptorSetKHR pfnPushDescriptor_ = nullptr;
};

class DeviceBuilder {
public:
    DeviceBuilder(const Instance& instance, const Surface& surface);

    DeviceBuilder& preferGpu(GpuPrefer pref);
    DeviceBuilder& requireExtension(const char* name);

    [[nodiscard]] Result<Device> build();

private:
    [[nodiscard]] QueueFamilies findQueueFamilies(VkPhysicalDevice gpu) const;
    [[nodiscard]] bool          supportsExtensions(VkPhysicalDevice gpu) const;
    [[nodiscard]] bool          supportsFeatures(VkPhysicalDevice gpu) const;
    [[nodiscard]] int           scoreDevice(VkPhysicalDevice gpu) const;

    VkInstance               instance_ = VK_NULL_HANDLE;
    VkSurfaceKHR             surface_  = VK_NULL_HANDLE;
    GpuPrefer                gpuPref_  = GpuPrefer::Discrete;
    std::vector<const char*> extensions_;
};

} // namespace layerfx
