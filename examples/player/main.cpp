#include <layerfx/layerfx.hpp>

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <string>

namespace {

struct Options {
    std::filesystem::path document;
    std::uint32_t         width      = 1280;
    std::uint32_t         height     = 720;
    layerfx::Validation   validation = layerfx::DefaultValidation;
    bool                  vsync      = true;
};

void printUsage(const char* exe) {
    std::fprintf(stderr,
                 "usage: %s [document.json] [--width N] [--height N] "
                 "[--validation] [--no-vsync]\n",
                 exe);
}

bool parseSize(const char* text, std::uint32_t& out) {
    char* end = nullptr;
    unsigned long v = std::strtoul(text, &end, 10);
    if (end == text || *end != '\0' || v == 0 || v > 16384) return false;
    out = static_cast<std::uint32_t>(v);
    return true;
}

bool parseOptions(int argc, char** argv, Options& opts) {
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (std::strcmp(arg, "--width") == 0 && i + 1 < argc) {
            if (!parseSize(argv[++i], opts.width)) return false;
        } else if (std::strcmp(arg, "--height") == 0 && i + 1 < argc) {
            if (!parseSize(argv[++i], opts.height)) return false;
        } else if (std::strcmp(arg, "--validation") == 0) {
            opts.validation = layerfx::Validation::On;
        } else if (std::strcmp(arg, "--no-vsync") == 0) {
            opts.vsync = false;
        } else if (arg[0] != '-' && opts.document.empty()) {
            opts.document = arg;
        } else {
            return false;
        }
    }
    if (opts.document.empty()) {
        opts.document = layerfx::exeDir() / "demoscript.json";
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    Options opts;
    if (!parseOptions(argc, argv, opts)) {
        printUsage(argv[0]);
        return 2;
    }

    // The document is fatal at startup: nothing else is created without it.
    auto description = layerfx::loadDescriptionFile(opts.document);
    if (!description.ok()) {
        std::fprintf(stderr, "[layerfx] error: %s\n", description.error().format().c_str());
        return 1;
    }

    auto app = layerfx::App::create().value();
    auto window = app.createWindow("layerfx", opts.width, opts.height).value();

    auto instance = layerfx::InstanceBuilder{}
        .appName("layerfx_player")
        .validation(opts.validation)
        .enableWindowSupport()
        .build().value();

    auto surface = layerfx::Surface::create(instance, window).value();

    auto device = layerfx::DeviceBuilder(instance, surface)
        .preferGpu(layerfx::GpuPrefer::Discrete)
        .build().value();

    std::printf("GPU: %s\n", device.gpuName());

    auto swapchain = layerfx::SwapchainBuilder(device, surface)
        .forWindow(window)
        .presentMode(opts.vsync ? layerfx::PresentMode::Fifo
                                : layerfx::PresentMode::Immediate)
        .build().value();

    auto allocator = layerfx::Allocator::create(instance, device).value();

    layerfx::CompositorConfig config;
    config.size = {swapchain.extent().width, swapchain.extent().height};

    auto frames = layerfx::FrameSync::create(device, config.framesInFlight).value();

    auto compositor = layerfx::Compositor::create(device, allocator, swapchain.format(),
                                                  description.value(), config);
    if (!compositor.ok()) {
        std::fprintf(stderr, "[layerfx] error: %s\n", compositor.error().format().c_str());
        return 1;
    }

    auto titled = window.setTitle("layerfx - " + opts.document.filename().string());
    if (!titled.ok()) {
        std::fprintf(stderr, "[layerfx] warning: %s\n", titled.error().format().c_str());
    }

    layerfx::FrameDriver driver(window, device, swapchain, frames, *compositor.value());
    auto ran = driver.run();
    if (!ran.ok()) {
        std::fprintf(stderr, "[layerfx] error: %s\n", ran.error().format().c_str());
        return 1;
    }

    return 0;
}
