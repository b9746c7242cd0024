#include <layerfx/frame_driver.hpp>
#include <layerfx/compositor.hpp>
#include <layerfx/device.hpp>
#include <layerfx/frames.hpp>
#include <layerfx/pointer.hpp>
#include <layerfx/swapchain.hpp>

#include <cstdio>

namespace layerfx {

FrameDriver::FrameDriver(Window& window, const Device& device, Swapchain& swapchain,
                         FrameSync& frames, Compositor& compositor)
    : window_(&window),
      device_(&device),
      swapchain_(&swapchain),
      frames_(&frames),
      compositor_(&compositor),
      start_(std::chrono::steady_clock::now()) {}

float FrameDriver::elapsedSeconds() const {
    std::chrono::duration<float> dt = std::chrono::steady_clock::now() - start_;
    return dt.count();
}

void FrameDriver::handleEvent(const Event& event) {
    switch (event.type) {
    case EventType::Quit:
    case EventType::CloseRequested:
        running_ = false;
        break;
    case EventType::KeyDown:
        if (event.keyCode == Key::Escape) running_ = false;
        break;
    case EventType::Resized:
        resizePending_ = true;
        break;
    case EventType::PointerMoved:
        if (auto p = normalizePointer(event.pointerX, event.pointerY, window_->size())) {
            compositor_->setPointer(*p);
        }
        break;
    default:
        break;
    }
}

Result<void> FrameDriver::resizeToWindow() {
    Size size = window_->pixelSize();
    if (size.empty()) return {};

    device_->waitIdle();
    auto recreated = swapchain_->recreate(size);
    if (!recreated.ok()) return recreated;
    ++recreations_;

    VkExtent2D extent = swapchain_->extent();
    auto resized = compositor_->resize({extent.width, extent.height});
    if (!resized.ok()) return resized;

    resizePending_ = false;
    return {};
}

Result<void> FrameDriver::drawFrame() {
    auto frame = frames_->nextFrame();
    if (!frame.ok()) return frame.error();

    auto image = swapchain_->nextImage();
    if (!image.ok()) {
        if (image.error().vkResult != VK_ERROR_OUT_OF_DATE_KHR) return image.error();

        // Out of date: recreate and retry once.
        auto resized = resizeToWindow();
        if (!resized.ok()) return resized;
        image = swapchain_->nextImage();
        if (!image.ok()) return image.error();
    }

    compositor_->pollTextures();

    VkCommandBuffer cmd = frame.value().cmd;
    auto begun = beginFrameCommands(cmd);
    if (!begun.ok()) return begun;

    ScreenTarget screen;
    screen.image  = image.value().image;
    screen.view   = image.value().view;
    screen.extent = swapchain_->extent();
    compositor_->renderFrame(cmd, elapsedSeconds(), screen);

    auto ended = endFrameCommands(cmd);
    if (!ended.ok()) return ended;

    auto submitted = submitFrame(device_->graphicsQueue(), frame.value(),
                                 image.value().imageReady,
                                 VK_PIPELINE_STAGE_2_COLOR_ATTACHMENT_OUTPUT_BIT);
    if (!submitted.ok()) return submitted;

    VkResult presented = swapchain_->present(device_->presentQueue(), image.value().index,
                                             frame.value().drawDone);
    ++presented_;

    if (presented == VK_ERROR_OUT_OF_DATE_KHR || presented == VK_SUBOPTIMAL_KHR) {
        resizePending_ = true;
    } else if (presented != VK_SUCCESS) {
        Error e{"present", static_cast<std::int32_t>(presented), "vkQueuePresentKHR failed"};
        e.kind = ErrorKind::Gpu;
        return e;
    }
    return {};
}

Result<bool> FrameDriver::tick() {
    Event event;
    while (window_->pollEvent(event)) {
        handleEvent(event);
    }
    if (window_->consumeResize()) resizePending_ = true;
    if (!running_) return false;

    // Minimized: nothing to draw into.
    if (window_->pixelSize().empty()) return true;

    if (resizePending_) {
        auto resized = resizeToWindow();
        if (!resized.ok()) return resized.error();
    }

    auto drawn = drawFrame();
    if (!drawn.ok()) return drawn.error();
    return true;
}

Result<void> FrameDriver::run(std::uint64_t maxFrames) {
    while (running_) {
        auto more = tick();
        if (!more.ok()) {
            device_->waitIdle();
            return more.error();
        }
        if (!more.value()) break;
        if (maxFrames != 0 && presented_ >= maxFrames) break;
    }

    device_->waitIdle();
    std::fprintf(stderr, "[layerfx] %llu frame(s) in %.2fs\n",
                 static_cast<unsigned long long>(presented_), elapsedSeconds());
    return {};
}

} // namespace layerfx
