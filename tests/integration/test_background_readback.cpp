#include <layerfx/layerfx.hpp>

#include <cassert>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <vector>

static constexpr int kSkip = 77;

// RGBA16F bit patterns
static constexpr std::uint16_t kHalfZero    = 0x0000;
static constexpr std::uint16_t kHalfQuarter = 0x3400;
static constexpr std::uint16_t kHalfHalf    = 0x3800;
static constexpr std::uint16_t kHalfOne     = 0x3C00;

// Four layers, three offscreen draws. The second layer overwrites the slot
// the first one read, and the third reads the background after that.
static const char* kDocument = R"({
  "history": [
    {
      "type": "red",
      "compiledVertexShaders": ["layout(location = 0) out vec2 vUv;\nvoid main() { vUv = uv; gl_Position = vec4(position, 1.0); }\n"],
      "compiledFragmentShaders": ["layout(location = 0) out vec4 o;\nvoid main() { o = vec4(1.0, 0.0, 0.0, 1.0); }\n"]
    },
    {
      "type": "green",
      "compiledVertexShaders": ["layout(location = 0) out vec2 vUv;\nvoid main() { vUv = uv; gl_Position = vec4(position, 1.0); }\n"],
      "compiledFragmentShaders": ["layout(location = 0) out vec4 o;\nvoid main() { o = vec4(0.0, 1.0, 0.0, 1.0); }\n"]
    },
    {
      "type": "background",
      "compiledVertexShaders": ["layout(location = 0) out vec2 vUv;\nvoid main() { vUv = uv; gl_Position = vec4(position, 1.0); }\n"],
      "compiledFragmentShaders": ["layout(location = 0) in vec2 vUv;\nlayout(location = 0) out vec4 o;\nvoid main() { vec4 bg = texture(uBgTexture, vUv); o = vec4(bg.rg, 1.0, 1.0); }\n"]
    },
    {
      "type": "copy",
      "compiledVertexShaders": ["layout(location = 0) out vec2 vUv;\nvoid main() { vUv = uv; gl_Position = vec4(position, 1.0); }\n"],
      "compiledFragmentShaders": ["layout(location = 0) in vec2 vUv;\nlayout(location = 0) out vec4 o;\nvoid main() { o = texture(uTexture, vUv); }\n"]
    }
  ]
})";

// Copy a whole RGBA16F image into host memory. `layout` is the image's
// layout before and after the copy.
static std::vector<std::uint16_t> readImage(const layerfx::Device& device,
                                            const layerfx::Allocator& allocator,
                                            VkImage image, VkExtent2D extent,
                                            VkImageLayout layout) {
    const VkDeviceSize bytes = static_cast<VkDeviceSize>(extent.width) * extent.height * 8;
    auto buffer = layerfx::BufferBuilder(allocator).size(bytes).readbackBuffer().build();
    assert(buffer.ok());
    VkBuffer dst = buffer.value().vkBuffer();

    auto copied = layerfx::runOneShot(device, [&](VkCommandBuffer cmd) {
        layerfx::transitionImage(cmd, image, layout, VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL,
                                 VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT,
                                 VK_ACCESS_2_MEMORY_WRITE_BIT,
                                 VK_PIPELINE_STAGE_2_COPY_BIT,
                                 VK_ACCESS_2_TRANSFER_READ_BIT);

        VkBufferImageCopy region{};
        region.imageSubresource = {VK_IMAGE_ASPECT_COLOR_BIT, 0, 0, 1};
        region.imageExtent      = {extent.width, extent.height, 1};
        vkCmdCopyImageToBuffer(cmd, image, VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL,
                               dst, 1, &region);

        VkMemoryBarrier2 toHost{};
        toHost.sType         = VK_STRUCTURE_TYPE_MEMORY_BARRIER_2;
        toHost.srcStageMask  = VK_PIPELINE_STAGE_2_COPY_BIT;
        toHost.srcAccessMask = VK_ACCESS_2_TRANSFER_WRITE_BIT;
        toHost.dstStageMask  = VK_PIPELINE_STAGE_2_HOST_BIT;
        toHost.dstAccessMask = VK_ACCESS_2_HOST_READ_BIT;
        VkDependencyInfo dep{};
        dep.sType              = VK_STRUCTURE_TYPE_DEPENDENCY_INFO;
        dep.memoryBarrierCount = 1;
        dep.pMemoryBarriers    = &toHost;
        vkCmdPipelineBarrier2(cmd, &dep);

        layerfx::transitionImage(cmd, image, VK_IMAGE_LAYOUT_TRANSFER_SRC_OPTIMAL, layout,
                                 VK_PIPELINE_STAGE_2_COPY_BIT, 0,
                                 VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT,
                                 VK_ACCESS_2_MEMORY_READ_BIT);
    });
    assert(copied.ok());
    assert(buffer.value().invalidate().ok());

    std::vector<std::uint16_t> texels(static_cast<std::size_t>(bytes / 2));
    std::memcpy(texels.data(), buffer.value().mappedData(), static_cast<std::size_t>(bytes));
    return texels;
}

static bool everyTexelIs(const std::vector<std::uint16_t>& texels,
                         std::uint16_t r, std::uint16_t g, std::uint16_t b, std::uint16_t a) {
    for (std::size_t i = 0; i + 3 < texels.size(); i += 4) {
        if (texels[i] != r || texels[i + 1] != g || texels[i + 2] != b || texels[i + 3] != a) {
            return false;
        }
    }
    return true;
}

int main() {
    auto description = layerfx::parseDescription(kDocument);
    assert(description.ok());

    auto app = layerfx::App::create();
    if (!app.ok()) {
        std::printf("skipped: %s\n", app.error().format().c_str());
        return kSkip;
    }
    auto window = app.value().createWindow("background readback test", 320, 240);
    if (!window.ok()) {
        std::printf("skipped: %s\n", window.error().format().c_str());
        return kSkip;
    }
    auto instance = layerfx::InstanceBuilder{}
        .appName("test_background_readback")
        .validation(layerfx::Validation::Off)
        .enableWindowSupport()
        .build();
    if (!instance.ok()) {
        std::printf("skipped: %s\n", instance.error().format().c_str());
        return kSkip;
    }
    assert(!instance.value().validationEnabled());

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

    const VkExtent2D extent = {64, 32};

    // Stand-in for a swapchain image that can be read back
    auto screen = layerfx::ImageBuilder(allocator.value())
        .size(extent)
        .format(layerfx::kRenderTargetFormat)
        .renderTarget()
        .build();
    assert(screen.ok());

    layerfx::CompositorConfig config;
    config.size = {extent.width, extent.height};

    {
        auto created = layerfx::Compositor::create(device.value(), allocator.value(),
                                                   layerfx::kRenderTargetFormat,
                                                   description.value(), config);
        assert(created.ok());
        layerfx::Compositor& c = *created.value();
        assert(c.layers().size() == 4);
        assert(c.layers()[2].needsBackgroundImage);

        // Known pre-pipeline contents in the frame's first input slot
        const std::uint32_t firstInput = c.targets().labels().input();
        auto seeded = layerfx::runOneShot(device.value(), [&](VkCommandBuffer cmd) {
            VkClearColorValue color{};
            color.float32[0] = 0.5f;
            color.float32[1] = 0.25f;
            color.float32[2] = 0.0f;
            color.float32[3] = 1.0f;
            layerfx::clearToSampled(cmd, c.targets().slot(firstInput).vkImage(), color);
        });
        assert(seeded.ok());

        layerfx::ScreenTarget target{screen.value().vkImage(), screen.value().vkImageView(),
                                     extent};
        layerfx::FramePlan plan;
        auto rendered = layerfx::runOneShot(device.value(), [&](VkCommandBuffer cmd) {
            plan = c.renderFrame(cmd, 0.0f, target);
        });
        assert(rendered.ok());
        assert(c.bindFailures() == 0);

        assert(plan.steps.size() == 4);
        assert(plan.swaps == 3);
        assert(*plan.steps[2].backgroundSlot == firstInput);
        assert(plan.steps[1].outputSlot == firstInput);
        assert(layerfx::backgroundNeedsSnapshot(plan));

        constexpr VkImageLayout kSampled = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL;

        // The second layer really overwrote the background slot
        auto overwritten = readImage(device.value(), allocator.value(),
                                     c.targets().slot(firstInput).vkImage(), extent, kSampled);
        assert(everyTexelIs(overwritten, kHalfZero, kHalfOne, kHalfZero, kHalfOne));

        // The copy holds what the slot held before the first draw
        auto snapshot = readImage(device.value(), allocator.value(),
                                  c.targets().snapshot().vkImage(), extent, kSampled);
        assert(everyTexelIs(snapshot, kHalfHalf, kHalfQuarter, kHalfZero, kHalfOne));

        // The background layer sampled the pre-pipeline image, not green
        auto background = readImage(device.value(), allocator.value(),
                                    c.targets().slot(plan.steps[2].outputSlot).vkImage(),
                                    extent, kSampled);
        assert(everyTexelIs(background, kHalfHalf, kHalfQuarter, kHalfOne, kHalfOne));

        // And that result reached the screen
        auto presented = readImage(device.value(), allocator.value(),
                                   screen.value().vkImage(), extent,
                                   VK_IMAGE_LAYOUT_PRESENT_SRC_KHR);
        assert(everyTexelIs(presented, kHalfHalf, kHalfQuarter, kHalfOne, kHalfOne));
        std::printf("  background after overwrite: ok\n");
    }

    device.value().waitIdle();
    std::printf("background readback tests passed\n");
    return 0;
}
