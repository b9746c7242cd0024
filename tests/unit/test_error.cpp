#include <layerfx/error.hpp>

#include <cassert>
#include <cstdio>
#include <cstring>
#include <string>

int main() {
    // Vulkan failure
    {
        layerfx::Error e{"create render target", -2, "out of device memory"};
        std::string s = e.format();
        assert(s.rfind("layerfx: create render target failed", 0) == 0);
        assert(s.find("VkResult -2") != std::string::npos);
        assert(s.find("out of device memory") != std::string::npos);
        assert(e.kind == layerfx::ErrorKind::Gpu);
    }

    // No VkResult for document problems
    {
        layerfx::Error e{"load document", 0, "history is not an array"};
        e.kind = layerfx::ErrorKind::Startup;
        std::string s = e.format();
        assert(s == "layerfx: load document failed: history is not an array");
    }

    // Empty message drops the colon
    {
        layerfx::Error e{"compile fragment shader", 0, ""};
        assert(e.format() == "layerfx: compile fragment shader failed");
    }

    // Kind names
    {
        assert(std::strcmp(layerfx::errorKindName(layerfx::ErrorKind::Startup), "startup") == 0);
        assert(std::strcmp(layerfx::errorKindName(layerfx::ErrorKind::Build), "build") == 0);
        assert(std::strcmp(layerfx::errorKindName(layerfx::ErrorKind::Gpu), "gpu") == 0);
        assert(std::strcmp(layerfx::errorKindName(layerfx::ErrorKind::Io), "io") == 0);
    }

    std::printf("error tests passed\n");
    return 0;
}
