#include <layerfx/layerfx.hpp>

#include <cassert>
#include <cstdio>
#include <string>

static constexpr int kSkip = 77;

static const char* kDocument = R"({
  "history": [
    {
      "type": "gradient",
      "data": { "uniforms": { "speed": { "name": "uSpeed", "type": "1f", "value": 0.5 } } },
      "compiledVertexShaders": ["layout(location = 0) out vec2 vUv;\nvoid main() { vUv = uv; gl_Position = vec4(position, 1.0); }\n"],
      "compiledFragmentShaders": ["layout(location = 0) in vec2 vUv;\nlayout(location = 0) out vec4 o;\nvoid main() { o = vec4(vUv, 0.5 + 0.5 * sin(uTime * uSpeed), 1.0); }\n"]
    },
    {
      "type": "hidden",
      "visible": false,
      "compiledVertexShaders": ["layout(location = 0) out vec2 vUv;\nvoid main() { vUv = uv; gl_Position = vec4(position, 1.0); }\n"],
      "compiledFragmentShaders": ["layout(location = 0) in vec2 vUv;\nlayout(location = 0) out vec4 o;\nvoid main() { o = vec4(1.0); }\n"]
    },
    {
      "type": "invert",
      "compiledVertexShaders": ["layout(location = 0) out vec2 vUv;\nvoid main() { vUv = uv; gl_Position = vec4(position, 1.0); }\n"],
      "compiledFragmentShaders": ["layout(location = 0) in vec2 vUv;\nlayout(location = 0) out vec4 o;\nvoid main() { vec4 c = texture(uTexture, vUv); o = vec4(1.0 - c.rgb, c.a); }\n"]
    },
    {
      "type": "blend",
      "compiledVertexShaders": ["layout(location = 0) out vec2 vUv;\nvoid main() { vUv = uv; gl_Position = vec4(position, 1.0); }\n"],
      "compiledFragmentShaders": ["layout(location = 0) in vec2 vUv;\nlayout(location = 0) out vec4 o;\nvoid main() { o = mix(texture(uTexture, vUv), texture(uBgTexture, vUv), uMousePos.x); }\n"]
    },
    {
      "type": "no vertex",
      "compiledFragmentShaders": ["void main() {}"]
    }
  ]
})";

int main() {
    auto description = layerfx::parseDescription(kDocument);
    assert(description.ok());
    assert(description.value().history.size() == 5);

    auto app = layerfx::App::create();
    if (!app.ok()) {
        std::printf("skipped: %s\n", app.error().format().c_str());
        return kSkip;
    }
    auto window = app.value().createWindow("compositor test", 320, 240);
    if (!window.ok()) {
        std::printf("skipped: %s\n", window.error().format().c_str());
        return kSkip;
    }
    auto instance = layerfx::InstanceBuilder{}
        .appName("test_compositor")
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

    auto swapchain = layerfx::SwapchainBuilder(device.value(), surface.value())
        .forWindow(window.value())
        .presentMode(layerfx::PresentMode::Fifo)
        .build();
    assert(swapchain.ok());
    assert(swapchain.value().vkSwapchain() != VK_NULL_HANDLE);
    assert(swapchain.value().imageCount() > 0);
    auto frames = layerfx::FrameSync::create(device.value(), 2);
    assert(frames.ok());

    layerfx::CompositorConfig config;
    config.size = {swapchain.value().extent().width, swapchain.value().extent().height};

    // Layer list, several frames
    {
        auto created = layerfx::Compositor::create(device.value(), allocator.value(),
                                                   swapchain.value().format(),
                                                   description.value(), config);
        assert(created.ok());
        layerfx::Compositor& c = *created.value();

        assert(c.layers().size() == 4);
        assert(!c.layers()[1].visible);
        assert(c.layers()[3].needsBackgroundImage);
        assert(c.programs().size() == 5); // fallback + one per layer

        layerfx::FrameDriver driver(window.value(), device.value(), swapchain.value(),
                                    frames.value(), c);
        auto ran = driver.run(4);
        assert(ran.ok());
        assert(driver.framesPresented() == 4);
        assert(driver.running());

        // Any swapchain recreation carried the compositor along with it
        const VkExtent2D ext = swapchain.value().extent();
        if (driver.recreations() == 0) {
            assert(c.size() == config.size);
        } else {
            assert((c.size() == layerfx::Size{ext.width, ext.height}));
        }

        const layerfx::FramePlan& plan = c.lastPlan();
        assert(!plan.fallback);
        assert(plan.steps.size() == 3);
        assert(plan.swaps == 2);
        assert(plan.screenDraws() == 1);
        assert(*plan.steps[2].backgroundSlot == plan.steps[0].inputSlot);
        assert(c.bindFailures() == 0);
        for (const auto& layer : c.layers()) {
            assert(layer.uniforms.time() > 0.0f);
        }
        std::printf("  frames: ok\n");

        // Pointer
        c.setPointer({0.25f, 0.75f});
        assert(driver.run(driver.framesPresented() + 1).ok());
        assert((c.layers()[0].uniforms.pointer() == layerfx::Vec2{0.25f, 0.75f}));
        std::printf("  pointer: ok\n");

        // Resize
        auto resized = c.resize({200, 100});
        assert(resized.ok());
        assert(c.targets().extent().width == 200 && c.targets().extent().height == 100);
        for (const auto& layer : c.layers()) {
            assert((layer.uniforms.resolution() == layerfx::Vec2{200.0f, 100.0f}));
        }
        assert(c.resize({0, 0}).ok());
        assert(c.targets().extent().width == 200);
        std::printf("  resize: ok\n");

        // A program that cannot be bound is skipped, its swap still happens
        c.layers()[0].programs[0] = 999;
        layerfx::FrameDriver again(window.value(), device.value(), swapchain.value(),
                                   frames.value(), c);
        assert(again.run(2).ok());
        assert(c.bindFailures() == 1);
        assert(c.lastPlan().swaps == 2);
        std::printf("  bind failure: ok\n");

        // A stopped driver presents nothing more
        layerfx::FrameDriver stopped(window.value(), device.value(), swapchain.value(),
                                     frames.value(), c);
        stopped.requestStop();
        assert(!stopped.running());
        assert(stopped.run().ok());
        assert(stopped.framesPresented() == 0);
        assert(stopped.recreations() == 0);
        std::printf("  stop: ok\n");
    }

    // Empty history: fallback every frame, nothing thrown
    {
        auto empty = layerfx::parseDescription(R"({"history": []})");
        assert(empty.ok());
        auto created = layerfx::Compositor::create(device.value(), allocator.value(),
                                                   swapchain.value().format(),
                                                   empty.value(), config);
        assert(created.ok());
        layerfx::Compositor& c = *created.value();
        assert(c.layers().empty());

        layerfx::FrameDriver driver(window.value(), device.value(), swapchain.value(),
                                    frames.value(), c);
        assert(driver.run(3).ok());
        assert(c.lastPlan().fallback);
        std::printf("  fallback: ok\n");
    }

    device.value().waitIdle();
    std::printf("compositor tests passed\n");
    return 0;
}
