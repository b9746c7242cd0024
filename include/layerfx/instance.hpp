#pragma once

#include <layerfx/error.hpp>
#include <layerfx/result.hpp>

#include <vulkan/vulkan.h>

#include <string>
#include <string_view>
#include <vector>

namespace layerfx {

enum class Validation {
    Off,
    On,
};

#ifdef NDEBUG
inline constexpr Validation DefaultValidation = Validation::Off;
#else
inline constexpr Validation DefaultValidation = Validation::On;
#endif

// Vulkan 1.3 instance, optionally with the Khronos validation layer and a
// debug messenger that prints "layerfx [LEVEL]: ..." to stderr.
//
// Thread safety: immutable after construction.
class Instance {
public:
    ~Instance();
    Instance(Instance&&) noexcept;
    Instance& operator=(Instance&&) noexcept;
    Instance(const Instance&) = delete;
    Instance& operator=(const Instance&) = delete;

    [[nodiscard]] VkInstance native()     const { return instance_; }
    [[nodiscard]] VkInstance vkInstance() const { return native(); }
    [[nodiscard]] bool validationEnabled() const { return messenger_ != VK_NULL_HANDLE; }

private:
    friend class InstanceBuilder;
    Instance() = default;
    void destroy();

    VkInstance               instance_  = VK_NULL_HANDLE;
    VkDebugUtilsMessengerEXT messenger_ = VK_NULL_HANDLE;
};

class InstanceBuilder {
public:
    InstanceBuilder& appName(std::string_view name);
    InstanceBuilder& validation(Validation v);
    InstanceBuilder& addExtension(const char* name);

    // Surface extensions for the current video driver (SDL must be initialized).
    InstanceBuilder& enableWindowSupport();

    [[nodiscard]] Result<Instance> build();

private:
    std::string              appName_       = "layerfx";
    Validation               validation_    = DefaultValidation;
    std::vector<const char*> extensions_;
    bool                     windowSupport_ = false;
};

} // namespace layerfx
