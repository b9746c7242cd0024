#pragma once

#include <layerfx/layer.hpp>
#include <layerfx/uniforms.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace layerfx {

// Which of the two render targets is currently "input" and which is
// "output". swap() only exchanges the labels; the targets themselves never
// move. The state persists across frames.
class PingPong {
public:
    [[nodiscard]] std::uint32_t input()  const { return input_; }
    [[nodiscard]] std::uint32_t output() const { return input_ ^ 1u; }

    void swap() { input_ ^= 1u; }

private:
    std::uint32_t input_ = 0;
};

enum class Destination : std::uint8_t {
    Screen,
    Offscreen,
};

// One full-screen draw. Slots index the render target pair.
struct DrawStep {
    std::size_t                  layer   = 0; // index into the layer list
    ProgramId                    program = 0;
    std::uint32_t                inputSlot = 0;
    std::optional<std::uint32_t> backgroundSlot; // set iff the layer reads the background
    Destination                  destination = Destination::Screen;
    std::uint32_t                outputSlot  = 0; // meaningful for Offscreen only
};

// Everything one frame does, decided before any GPU work is recorded.
// `fallback` means the layer list is empty and the fallback indicator is
// drawn instead. A plan with no steps and no fallback clears the screen.
struct FramePlan {
    bool                  fallback = false;
    std::vector<DrawStep> steps;
    std::uint32_t         swaps = 0;

    [[nodiscard]] std::size_t offscreenDraws() const;
    [[nodiscard]] std::size_t screenDraws() const;
};

// Walk the layers in order and decide each draw. Hidden layers and layers
// without a program take no slot and cause no swap. The final drawn layer
// renders to the screen; every earlier one renders to the current output
// slot, after which `targets` is swapped. The background slot is the input
// of the first drawn layer, captured once per frame.
[[nodiscard]] FramePlan planFrame(const std::vector<Layer>& layers, PingPong& targets);

// True when an offscreen step of `plan` writes the background slot before or
// while a later step reads it. The frame then has to sample a copy of the
// slot taken before the first draw.
[[nodiscard]] bool backgroundNeedsSnapshot(const FramePlan& plan);

// Per-frame reserved uniforms for every layer, hidden ones included.
void refreshFrameUniforms(std::vector<Layer>& layers, float elapsedSeconds, Vec2 pointer);

// Resize bookkeeping: every layer's uResolution becomes `resolution`.
void applyResolution(std::vector<Layer>& layers, Vec2 resolution);

} // namespace layerfx
