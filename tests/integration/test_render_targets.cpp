#include <layerfx/layerfx.hpp>

#include <cassert>
#include <cstdio>
#include <utility>

// CTest SKIP_RETURN_CODE: no display or no Vulkan 1.3 device.
static constexpr int kSkip = 77;

int main() {
    auto app = layerfx::App::create();
    if (!app.ok()) {
        std::printf("skipped: %s\n", app.error().format().c_str());
        return kSkip;
    }

    auto window = app.value().createWindow("render target test", 320, 240);
    if (!window.ok()) {
        std::printf("skipped: %s\n", window.error().format().c_str());
        return kSkip;
    }

    auto instance = layerfx::InstanceBuilder{}
        .appName("test_render_targets")
        .validation(layerfx::Validation::Off)
        .enableWindowSupport()
        .build();
    if (!instance.ok()) {
        std::printf("skipped: %s\n", instance.error().format().c_str());
        return kSkip;
    }

    auto surface = layerfx::Surface::create(instance.value(), window.value());
    assert(surface.ok());

    auto device = layerfx::DeviceBuilder(instance.value(), surface.value())
        .preferGpu(layerfx::GpuPrefer::Any)
        .build();
    if (!device.ok()) {
        std::printf("skipped: %s\n", device.error().format().c_str());
        return kSkip;
    }

    auto allocator = layerfx::Allocator::create(instance.value(), device.value());
    assert(allocator.ok());

    // Create
    {
        auto pair = layerfx::RenderTargetPair::create(device.value(), allocator.value(),
                                                      {256, 128});
        assert(pair.ok());
        auto& rt = pair.value();

        assert(rt.extent().width == 256 && rt.extent().height == 128);
        assert(rt.sampler() != VK_NULL_HANDLE);
        assert(rt.slot(0).vkImage() != rt.slot(1).vkImage());
        assert(rt.snapshot().vkImage() != rt.slot(0).vkImage());
        assert(rt.snapshot().vkImage() != rt.slot(1).vkImage());
        for (std::uint32_t i = 0; i < 2; ++i) {
            assert(rt.slot(i).format() == layerfx::kRenderTargetFormat);
            assert(rt.slot(i).extent().width == 256);
            assert(rt.slot(i).vkImageView() != VK_NULL_HANDLE);
        }
        assert(rt.input().vkImage() != rt.output().vkImage());
        std::printf("  create: ok\n");

        // swap; swap restores identity and never reallocates
        VkImage in  = rt.input().vkImage();
        VkImage out = rt.output().vkImage();
        rt.swap();
        assert(rt.input().vkImage() == out);
        assert(rt.output().vkImage() == in);
        rt.swap();
        assert(rt.input().vkImage() == in);
        assert(rt.output().vkImage() == out);
        std::printf("  swap: ok\n");

        // Resize
        auto resized = rt.resize({640, 360});
        assert(resized.ok());
        assert(rt.extent().width == 640 && rt.extent().height == 360);
        assert(rt.slot(0).extent().width == 640 && rt.slot(0).extent().height == 360);
        assert(rt.slot(1).extent().width == 640 && rt.slot(1).extent().height == 360);
        assert(rt.snapshot().extent().width == 640);
        assert(rt.input().vkImage() != rt.output().vkImage());
        std::printf("  resize: ok\n");

        // Zero size is refused and the old images stay
        VkImage before = rt.slot(0).vkImage();
        auto zero = rt.resize({0, 360});
        assert(!zero.ok());
        assert(rt.slot(0).vkImage() == before);
        assert(rt.extent().width == 640);
        std::printf("  zero resize: ok\n");

        // Snapshot copy records and submits
        auto copied = layerfx::runOneShot(device.value(), [&](VkCommandBuffer cmd) {
            rt.recordSnapshot(cmd, rt.labels().input());
        });
        assert(copied.ok());
        std::printf("  snapshot: ok\n");
    }

    device.value().waitIdle();
    std::printf("render target tests passed\n");
    return 0;
}
