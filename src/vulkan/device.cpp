#include <layerfx/device.hpp>
#include <layerfx/instance.hpp>
#include <layerfx/surface.hpp>

#include <cstdio>
#include <cstring>
#include <set>
#include <string>
#include <vector>

namespace layerfx {

Device::~Device() {
    if (device_ != VK_NULL_HANDLE) {
        vkDestroyDevice(device_, nullptr);
    }
}

Device::Device(Device&& o) noexcept
    : device_(o.device_),
      physicalDevice_(o.physicalDevice_),
      graphicsQueue_(o.graphicsQueue_),
      presentQueue_(o.presentQueue_),
      families_(o.families_),
      gpuName_(std::move(o.gpuName_)),
      maxPushConstants_(o.maxPushConstants_),
      pfnPushDescriptor_(o.pfnPushDescriptor_) {
    o.device_            = VK_NULL_HANDLE;
    o.physicalDevice_    = VK_NULL_HANDLE;
    o.graphicsQueue_     = VK_NULL_HANDLE;
    o.presentQueue_      = VK_NULL_HANDLE;
    o.families_          = {};
    o.pfnPushDescriptor_ = nullptr;
}

Device& Device::operator=(Device&& o) noexcept {
    if (this != &o) {
        if (device_ != VK_NULL_HANDLE) {
            vkDestroyDevice(device_, nullptr);
        }
        device_            = o.device_;
        physicalDevice_    = o.physicalDevice_;
        graphicsQueue_     = o.graphicsQueue_;
        presentQueue_      = o.presentQueue_;
        families_          = o.families_;
        gpuName_           = std::move(o.gpuName_);
        maxPushConstants_  = o.maxPushConstants_;
        pfnPushDescriptor_ = o.pfnPushDescriptor_;
        o.device_            = VK_NULL_HANDLE;
        o.physicalDevice_    = VK_NULL_HANDLE;
        o.graphicsQueue_     = VK_NULL_HANDLE;
        o.presentQueue_      = VK_NULL_HANDLE;
        o.families_          = {};
        o.pfnPushDescriptor_ = nullptr;
    }
    return *this;
}

void Device::waitIdle() const {
    if (device_ != VK_NULL_HANDLE) {
        vkDeviceWaitIdle(device_);
    }
}

DeviceBuilder::DeviceBuilder(const Instance& instance, const Surface& surface)
    : instance_(instance.vkInstance()), surface_(surface.vkSurface()) {
    extensions_.push_back(VK_KHR_SWAPCHAIN_EXTENSION_NAME);
    extensions_.push_back(VK_KHR_PUSH_DESCRIPTOR_EXTENSION_NAME);
}

DeviceBuilder& DeviceBuilder::preferGpu(GpuPrefer pref) {
    gpuPref_ = pref;
    return *this;
}

DeviceBuilder& DeviceBuilder::requireExtension(const char* name) {
    for (const char* existing : extensions_) {
        if (std::strcmp(existing, name) == 0) return *this;
    }
    extensions_.push_back(name);
    return *this;
}

QueueFamilies DeviceBuilder::findQueueFamilies(VkPhysicalDevice gpu) const {
    QueueFamilies result;

    std::uint32_t count = 0;
    vkGetPhysicalDeviceQueueFamilyProperties(gpu, &count, nullptr);
    std::vector<VkQueueFamilyProperties> families(count);
    vkGetPhysicalDeviceQueueFamilyProperties(gpu, &count, families.data());

    for (std::uint32_t i = 0; i < count; ++i) {
        bool graphics = (families[i].queueFlags & VK_QUEUE_GRAPHICS_BIT) != 0;

        VkBool32 present = VK_FALSE;
        vkGetPhysicalDeviceSurfaceSupportKHR(gpu, i, surface_, &present);

        // One family doing both is the common case and always wins.
        if (graphics && present) {
            result.graphics = i;
            result.present  = i;
            break;
        }
        if (graphics && result.graphics == UINT32_MAX) result.graphics = i;
        if (present && result.present == UINT32_MAX)   result.present  = i;
    }

    return result;
}

bool DeviceBuilder::supportsExtensions(VkPhysicalDevice gpu) const {
    std::uint32_t count = 0;
    vkEnumerateDeviceExtensionProperties(gpu, nullptr, &count, nullptr);
    std::vector<VkExtensionProperties> available(count);
    vkEnumerateDeviceExtensionProperties(gpu, nullptr, &count, available.data());

    for (const char* required : extensions_) {
        bool found = false;
        for (const auto& ext : available) {
            if (std::strcmp(ext.extensionName, required) == 0) {
                found = true;
                break;
            }
        }
        if (!found) return false;
    }
    return true;
}

bool DeviceBuilder::supportsFeatures(VkPhysicalDevice gpu) const {
    VkPhysicalDeviceProperties props;
    vkGetPhysicalDeviceProperties(gpu, &props);
    if (props.apiVersion < VK_API_VERSION_1_3) return false;

    VkPhysicalDeviceVulkan13Features f13{};
    f13.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_3_FEATURES;
    VkPhysicalDeviceFeatures2 f2{};
    f2.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2;
    f2.pNext = &f13;
    vkGetPhysicalDeviceFeatures2(gpu, &f2);

    return f13.dynamicRendering == VK_TRUE && f13.synchronization2 == VK_TRUE;
}

int DeviceBuilder::scoreDevice(VkPhysicalDevice gpu) const {
    QueueFamilies families = findQueueFamilies(gpu);
    if (!families.valid()) return -1;
    if (!supportsExtensions(gpu)) return -1;
    if (!supportsFeatures(gpu)) return -1;

    VkPhysicalDeviceProperties props;
    vkGetPhysicalDeviceProperties(gpu, &props);

    int score = 0;
    switch (gpuPref_) {
    case GpuPrefer::Discrete:
        if (props.deviceType == VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU) score += 10000;
        break;
    case GpuPrefer::Integrated:
        if (props.deviceType == VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU) score += 10000;
        break;
    case GpuPrefer::Any:
        break;
    }
    if (families.shared()) score += 100;
    // Software rasterizers still work, but only as a last resort.
    if (props.deviceType != VK_PHYSICAL_DEVICE_TYPE_CPU) score += 10;

    return score;
}

Result<Device> DeviceBuilder::build() {
    auto startupError = [](std::string op, std::string message, VkResult vr = VK_SUCCESS) {
        Error e{std::move(op), static_cast<std::int32_t>(vr), std::move(message)};
        e.kind = ErrorKind::Startup;
        return e;
    };

    std::uint32_t gpuCount = 0;
    vkEnumeratePhysicalDevices(instance_, &gpuCount, nullptr);
    if (gpuCount == 0) {
        return startupError("select GPU", "no Vulkan-capable GPU found");
    }
    std::vector<VkPhysicalDevice> gpus(gpuCount);
    vkEnumeratePhysicalDevices(instance_, &gpuCount, gpus.data());

    VkPhysicalDevice best = VK_NULL_HANDLE;
    int bestScore = -1;
    for (auto gpu : gpus) {
        int score = scoreDevice(gpu);
        if (score > bestScore) {
            bestScore = score;
            best      = gpu;
        }
    }

    if (best == VK_NULL_HANDLE) {
        std::string msg = "no GPU offers Vulkan 1.3 with dynamic rendering, "
                          "synchronization2, graphics+present queues and:";
        for (const char* ext : extensions_) {
            msg += ' ';
            msg += ext;
        }
        return startupError("select GPU", msg);
    }

    QueueFamilies families = findQueueFamilies(best);

    std::set<std::uint32_t> unique = {families.graphics, families.present};
    std::vector<VkDeviceQueueCreateInfo> queueCIs;
    float priority = 1.0f;
    for (auto family : unique) {
        VkDeviceQueueCreateInfo qci{};
        qci.sType            = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
        qci.queueFamilyIndex = family;
        qci.queueCount       = 1;
        qci.pQueuePriorities = &priority;
        queueCIs.push_back(qci);
    }

    VkPhysicalDeviceVulkan13Features features13{};
    features13.sType            = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_3_FEATURES;
    features13.dynamicRendering = VK_TRUE;
    features13.synchronization2 = VK_TRUE;

    VkPhysicalDeviceFeatures2 features2{};
    features2.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2;
    features2.pNext = &features13;

    VkDeviceCreateInfo ci{};
    ci.sType                   = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
    ci.pNext                   = &features2;
    ci.queueCreateInfoCount    = static_cast<std::uint32_t>(queueCIs.size());
    ci.pQueueCreateInfos       = queueCIs.data();
    ci.enabledExtensionCount   = static_cast<std::uint32_t>(extensions_.size());
    ci.ppEnabledExtensionNames = extensions_.data();

    Device dev;
    dev.physicalDevice_ = best;
    dev.families_       = families;

    VkResult vr = vkCreateDevice(best, &ci, nullptr, &dev.device_);
    if (vr != VK_SUCCESS) {
        return startupError("create device", "vkCreateDevice failed", vr);
    }

    vkGetDeviceQueue(dev.device_, families.graphics, 0, &dev.graphicsQueue_);
    vkGetDeviceQueue(dev.device_, families.present,  0, &dev.presentQueue_);

    // Extension entry points are not exported by the loader library.
    dev.pfnPushDescriptor_ = reinterpret_cast<PFN_vkCmdPushDescriptorSetKHR>(
        vkGetDeviceProcAddr(dev.device_, "vkCmdPushDescriptorSetKHR"));
    if (!dev.pfnPushDescriptor_) {
        return startupError("create device", "vkCmdPushDescriptorSetKHR not found");
    }

    VkPhysicalDeviceProperties props;
    vkGetPhysicalDeviceProperties(best, &props);
    dev.gpuName_          = props.deviceName;
    dev.maxPushConstants_ = props.limits.maxPushConstantsSize;

    std::fprintf(stderr, "[layerfx] using GPU '%s'\n", dev.gpuName_.c_str());
    return dev;
}

} // namespace layerfx
