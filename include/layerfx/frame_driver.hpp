#pragma once

#include <layerfx/error.hpp>
#include <layerfx/result.hpp>
#include <layerfx/window.hpp>

#include <chrono>
#include <cstdint>

namespace layerfx {

class Compositor;
class Device;
class FrameSync;
class Swapchain;

// Owns the loop: drains window events, keeps the swapchain and the
// compositor sized to the window, and records/submits/presents one frame per
// tick. Elapsed time is seconds since construction on a steady clock.
// Escape, quit and window close stop the loop. While the window is minimized
// ticks only pump events.
//
// Borrows everything; all of it must outlive the driver.
//
// Thread safety: thread-confined (render thread).
class FrameDriver {
public:
    FrameDriver(Window& window, const Device& device, Swapchain& swapchain,
                FrameSync& frames, Compositor& compositor);

    // One iteration. Returns false once the loop should end.
    [[nodiscard]] Result<bool> tick();

    // tick() until it returns false, or `maxFrames` frames were presented
    // (0 = no limit). Waits for the device before returning.
    [[nodiscard]] Result<void> run(std::uint64_t maxFrames = 0);

    void requestStop() { running_ = false; }

    [[nodiscard]] bool          running()         const { return running_; }
    [[nodiscard]] std::uint64_t framesPresented() const { return presented_; }
    [[nodiscard]] std::uint32_t recreations()     const { return recreations_; }
    [[nodiscard]] float         elapsedSeconds()  const;

private:
    void handleEvent(const Event& event);
    [[nodiscard]] Result<void> resizeToWindow();
    [[nodiscard]] Result<void> drawFrame();

    Window*       window_;
    const Device* device_;
    Swapchain*    swapchain_;
    FrameSync*    frames_;
    Compositor*   compositor_;

    std::chrono::steady_clock::time_point start_;
    bool          running_       = true;
    bool          resizePending_ = false;
    std::uint64_t presented_     = 0;
    std::uint32_t recreations_   = 0;
};

} // namespace layerfx
