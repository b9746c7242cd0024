#include <layerfx/layerfx.hpp>

#include <cassert>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <string>
#include <thread>

static constexpr int kSkip = 77;

int main() {
    const std::filesystem::path dataDir = LAYERFX_TEST_DATA_DIR;

    // Decoding needs no GPU
    {
        auto img = layerfx::loadImage(dataDir / "checker.bmp");
        assert(img.ok());
        assert(img.value().width == 2 && img.value().height == 2);
        assert(img.value().sizeBytes() == 16);

        // Flipped on load: row 0 is the file's bottom row (red, green).
        const unsigned char* p = img.value().pixels;
        assert(p[0] == 255 && p[1] == 0 && p[2] == 0 && p[3] == 255);
        assert(p[4] == 0 && p[5] == 255 && p[6] == 0);

        auto missing = layerfx::loadImage(dataDir / "does_not_exist.png");
        assert(!missing.ok());
        assert(missing.error().kind == layerfx::ErrorKind::Io);
        std::printf("  loadImage: ok\n");
    }

    auto app = layerfx::App::create();
    if (!app.ok()) {
        std::printf("skipped: %s\n", app.error().format().c_str());
        return kSkip;
    }
    auto window = app.value().createWindow("texture loader test", 320, 240);
    if (!window.ok()) {
        std::printf("skipped: %s\n", window.error().format().c_str());
        return kSkip;
    }
    auto instance = layerfx::InstanceBuilder{}
        .appName("test_texture_loader")
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

    {
        layerfx::TextureLoader loader(device.value(), allocator.value());

        const std::string checker = (dataDir / "checker.bmp").string();
        layerfx::TextureHandle a = loader.request(checker);
        layerfx::TextureHandle b = loader.request(checker);
        layerfx::TextureHandle bad = loader.request((dataDir / "missing.png").string());

        assert(a.sharesSlotWith(b));
        assert(a.view() == VK_NULL_HANDLE);
        assert(loader.pendingCount() == 2);

        // Poll without blocking until both decodes land
        for (int i = 0; i < 500 && loader.pendingCount() > 0; ++i) {
            loader.poll();
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        loader.finish();

        assert(loader.pendingCount() == 0);
        assert(loader.loadedCount() == 1);
        assert(a.isReady() && b.isReady());
        assert(a.view() != VK_NULL_HANDLE);
        assert(bad.state() == layerfx::TextureHandle::State::Failed);
        assert(bad.view() == VK_NULL_HANDLE);

        // Requests after completion reuse the finished handle
        layerfx::TextureHandle again = loader.request(checker);
        assert(again.sharesSlotWith(a));
        assert(again.isReady());
        std::printf("  async load: ok\n");

        device.value().waitIdle();
    }

    std::printf("texture loader tests passed\n");
    return 0;
}
