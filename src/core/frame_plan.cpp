#include <layerfx/frame_plan.hpp>

#include <algorithm>

namespace layerfx {

namespace {

bool drawable(const Layer& layer) {
    return layer.visible && !layer.programs.empty();
}

} // anonymous namespace

std::size_t FramePlan::offscreenDraws() const {
    return static_cast<std::size_t>(std::count_if(steps.begin(), steps.end(),
        [](const DrawStep& s) { return s.destination == Destination::Offscreen; }));
}

std::size_t FramePlan::screenDraws() const {
    return steps.size() - offscreenDraws();
}

FramePlan planFrame(const std::vector<Layer>& layers, PingPong& targets) {
    FramePlan plan;

    if (layers.empty()) {
        plan.fallback = true;
        return plan;
    }

    std::optional<std::size_t> last;
    for (std::size_t i = layers.size(); i-- > 0;) {
        if (drawable(layers[i])) {
            last = i;
            break;
        }
    }
    if (!last) return plan;

    std::optional<std::uint32_t> background;

    for (std::size_t i = 0; i <= *last; ++i) {
        const Layer& layer = layers[i];
        if (!drawable(layer)) continue;

        if (!background) background = targets.input();

        DrawStep step;
        step.layer     = i;
        step.program   = layer.programs.front();
        step.inputSlot = targets.input();
        if (layer.needsBackgroundImage) step.backgroundSlot = background;

        if (i == *last) {
            step.destination = Destination::Screen;
            plan.steps.push_back(step);
            break;
        }

        step.destination = Destination::Offscreen;
        step.outputSlot  = targets.output();
        plan.steps.push_back(step);

        targets.swap();
        ++plan.swaps;
    }

    return plan;
}

bool backgroundNeedsSnapshot(const FramePlan& plan) {
    std::optional<std::uint32_t> background;
    for (const auto& step : plan.steps) {
        if (step.backgroundSlot) background = step.backgroundSlot;
    }
    if (!background) return false;

    bool overwritten = false;
    for (const auto& step : plan.steps) {
        bool writes = step.destination == Destination::Offscreen &&
                      step.outputSlot == *background;
        if (step.backgroundSlot && (overwritten || writes)) return true;
        if (writes) overwritten = true;
    }
    return false;
}

void refreshFrameUniforms(std::vector<Layer>& layers, float elapsedSeconds, Vec2 pointer) {
    for (auto& layer : layers) {
        layer.uniforms.setTime(elapsedSeconds);
        layer.uniforms.setPointer(pointer);
    }
}

void applyResolution(std::vector<Layer>& layers, Vec2 resolution) {
    for (auto& layer : layers) {
        layer.uniforms.setResolution(resolution);
    }
}

} // namespace layerfx
