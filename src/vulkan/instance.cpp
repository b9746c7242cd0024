#include <layerfx/instance.hpp>
#include <layerfx/vulkan_wsi.hpp>

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

namespace layerfx {

namespace {

constexpr const char* kValidationLayer = "VK_LAYER_KHRONOS_validation";

VKAPI_ATTR VkBool32 VKAPI_CALL onValidationMessage(
    VkDebugUtilsMessageSeverityFlagBitsEXT severity,
    VkDebugUtilsMessageTypeFlagsEXT /*type*/,
    const VkDebugUtilsMessengerCallbackDataEXT* data,
    void* /*userData*/) {
    const char* level = "INFO";
    if (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT) {
        level = "ERROR";
    } else if (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT) {
        level = "WARN";
    }
    std::fprintf(stderr, "layerfx [%s]: %s\n", level, data->pMessage);
    return VK_FALSE;
}

VkDebugUtilsMessengerCreateInfoEXT messengerInfo() {
    VkDebugUtilsMessengerCreateInfoEXT ci{};
    ci.sType           = VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT;
    ci.messageSeverity = VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT |
                         VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT;
    ci.messageType     = VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT |
                         VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT;
    ci.pfnUserCallback = onValidationMessage;
    return ci;
}

bool hasLayer(const char* name) {
    std::uint32_t count = 0;
    vkEnumerateInstanceLayerProperties(&count, nullptr);
    std::vector<VkLayerProperties> layers(count);
    vkEnumerateInstanceLayerProperties(&count, layers.data());
    for (const auto& l : layers) {
        if (std::strcmp(l.layerName, name) == 0) return true;
    }
    return false;
}

// First requested extension the loader does not offer, or nullptr.
const char* firstMissingExtension(const std::vector<const char*>& wanted) {
    std::uint32_t count = 0;
    vkEnumerateInstanceExtensionProperties(nullptr, &count, nullptr);
    std::vector<VkExtensionProperties> available(count);
    vkEnumerateInstanceExtensionProperties(nullptr, &count, available.data());

    for (const char* name : wanted) {
        bool found = false;
        for (const auto& ext : available) {
            if (std::strcmp(ext.extensionName, name) == 0) {
                found = true;
                break;
            }
        }
        if (!found) return name;
    }
    return nullptr;
}

void appendUnique(std::vector<const char*>& list, const char* name) {
    for (const char* existing : list) {
        if (std::strcmp(existing, name) == 0) return;
    }
    list.push_back(name);
}

} // anonymous namespace

Instance::~Instance() {
    destroy();
}

void Instance::destroy() {
    if (messenger_ != VK_NULL_HANDLE) {
        auto destroyMessenger = reinterpret_cast<PFN_vkDestroyDebugUtilsMessengerEXT>(
            vkGetInstanceProcAddr(instance_, "vkDestroyDebugUtilsMessengerEXT"));
        if (destroyMessenger) destroyMessenger(instance_, messenger_, nullptr);
        messenger_ = VK_NULL_HANDLE;
    }
    if (instance_ != VK_NULL_HANDLE) {
        vkDestroyInstance(instance_, nullptr);
        instance_ = VK_NULL_HANDLE;
    }
}

Instance::Instance(Instance&& o) noexcept
    : instance_(o.instance_), messenger_(o.messenger_) {
    o.instance_  = VK_NULL_HANDLE;
    o.messenger_ = VK_NULL_HANDLE;
}

Instance& Instance::operator=(Instance&& o) noexcept {
    if (this != &o) {
        destroy();
        instance_    = o.instance_;
        messenger_   = o.messenger_;
        o.instance_  = VK_NULL_HANDLE;
        o.messenger_ = VK_NULL_HANDLE;
    }
    return *this;
}

InstanceBuilder& InstanceBuilder::appName(std::string_view name) {
    appName_ = name;
    return *this;
}

InstanceBuilder& InstanceBuilder::validation(Validation v) {
    validation_ = v;
    return *this;
}

InstanceBuilder& InstanceBuilder::addExtension(const char* name) {
    extensions_.push_back(name);
    return *this;
}

InstanceBuilder& InstanceBuilder::enableWindowSupport() {
    windowSupport_ = true;
    return *this;
}

Result<Instance> InstanceBuilder::build() {
    auto startupError = [](std::string message, VkResult vr = VK_SUCCESS) {
        Error e{"create instance", static_cast<std::int32_t>(vr), std::move(message)};
        e.kind = ErrorKind::Startup;
        return e;
    };

    std::vector<const char*> extensions;
    for (const char* ext : extensions_) appendUnique(extensions, ext);
    if (windowSupport_) {
        for (const char* ext : wsi::requiredInstanceExtensions()) appendUnique(extensions, ext);
    }

    std::vector<const char*> layers;
    bool useValidation = (validation_ == Validation::On);
    if (useValidation && !hasLayer(kValidationLayer)) {
        std::fprintf(stderr, "[layerfx] warning: %s not installed, running without validation\n",
                     kValidationLayer);
        useValidation = false;
    }
    if (useValidation) {
        layers.push_back(kValidationLayer);
        appendUnique(extensions, VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
    }

    if (const char* missing = firstMissingExtension(extensions)) {
        return startupError("instance extension '" + std::string(missing) +
                            "' is not available; update the GPU driver");
    }

    VkApplicationInfo appInfo{};
    appInfo.sType            = VK_STRUCTURE_TYPE_APPLICATION_INFO;
    appInfo.pApplicationName = appName_.c_str();
    appInfo.pEngineName      = "layerfx";
    appInfo.apiVersion       = VK_API_VERSION_1_3;

    VkDebugUtilsMessengerCreateInfoEXT debugCI = messengerInfo();

    VkInstanceCreateInfo ci{};
    ci.sType                   = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
    ci.pApplicationInfo        = &appInfo;
    ci.enabledExtensionCount   = static_cast<std::uint32_t>(extensions.size());
    ci.ppEnabledExtensionNames = extensions.data();
    ci.enabledLayerCount       = static_cast<std::uint32_t>(layers.size());
    ci.ppEnabledLayerNames     = layers.data();
    // Covers vkCreateInstance / vkDestroyInstance themselves.
    if (useValidation) ci.pNext = &debugCI;

    Instance inst;
    VkResult vr = vkCreateInstance(&ci, nullptr, &inst.instance_);
    if (vr == VK_ERROR_INCOMPATIBLE_DRIVER) {
        return startupError("the installed driver does not support Vulkan 1.3", vr);
    }
    if (vr != VK_SUCCESS) {
        return startupError("vkCreateInstance failed", vr);
    }

    if (useValidation) {
        auto createMessenger = reinterpret_cast<PFN_vkCreateDebugUtilsMessengerEXT>(
            vkGetInstanceProcAddr(inst.instance_, "vkCreateDebugUtilsMessengerEXT"));
        if (createMessenger) {
            vr = createMessenger(inst.instance_, &debugCI, nullptr, &inst.messenger_);
            if (vr != VK_SUCCESS) {
                std::fprintf(stderr, "[layerfx] warning: debug messenger unavailable (VkResult %d)\n",
                             static_cast<int>(vr));
            }
        }
    }

    return inst;
}

} // namespace layerfx
