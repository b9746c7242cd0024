#include <layerfx/frame_plan.hpp>

#include <cassert>
#include <cstdio>
#include <vector>

using namespace layerfx;

static Layer makeLayer(ProgramId program, bool visible = true, bool background = false) {
    Layer l;
    l.visible              = visible;
    l.programs             = {program};
    l.needsBackgroundImage = background;
    l.uniforms             = UniformTable::withDefaults({100.0f, 100.0f});
    return l;
}

int main() {
    // Scenario A: one layer straight to the screen
    {
        std::vector<Layer> layers = {makeLayer(7)};
        PingPong pp;
        FramePlan plan = planFrame(layers, pp);
        assert(!plan.fallback);
        assert(plan.steps.size() == 1);
        assert(plan.steps[0].destination == Destination::Screen);
        assert(plan.steps[0].program == 7);
        assert(plan.steps[0].inputSlot == 0);
        assert(!plan.steps[0].backgroundSlot);
        assert(plan.swaps == 0);
        assert(plan.offscreenDraws() == 0);
        assert(plan.screenDraws() == 1);
        assert(pp.input() == 0);
    }

    // Scenario B: three layers, two swaps, outputs feed the next input
    {
        std::vector<Layer> layers = {makeLayer(0), makeLayer(1), makeLayer(2)};
        PingPong pp;
        FramePlan plan = planFrame(layers, pp);
        assert(plan.steps.size() == 3);
        assert(plan.swaps == 2);
        assert(plan.offscreenDraws() == 2);
        assert(plan.screenDraws() == 1);

        assert(plan.steps[0].destination == Destination::Offscreen);
        assert(plan.steps[0].inputSlot == 0 && plan.steps[0].outputSlot == 1);
        assert(plan.steps[1].destination == Destination::Offscreen);
        assert(plan.steps[1].inputSlot == 1 && plan.steps[1].outputSlot == 0);
        assert(plan.steps[2].destination == Destination::Screen);
        assert(plan.steps[2].inputSlot == 0);

        for (const auto& s : plan.steps) {
            assert(!s.backgroundSlot);
            if (s.destination == Destination::Offscreen) assert(s.inputSlot != s.outputSlot);
        }

        // Same every frame
        FramePlan again = planFrame(layers, pp);
        assert(again.swaps == 2);
        assert(again.steps[0].inputSlot == plan.steps[0].inputSlot);
    }

    // Scenario C: background is the first layer's input, not its output
    {
        std::vector<Layer> layers = {makeLayer(0), makeLayer(1, true, true)};
        PingPong pp;
        FramePlan plan = planFrame(layers, pp);
        assert(plan.steps.size() == 2);
        assert(plan.steps[1].backgroundSlot);
        assert(*plan.steps[1].backgroundSlot == plan.steps[0].inputSlot);
        assert(*plan.steps[1].backgroundSlot != plan.steps[0].outputSlot);
        assert(plan.steps[1].inputSlot == plan.steps[0].outputSlot);

        // Deeper in the stack it is still the first input
        std::vector<Layer> three = {makeLayer(0), makeLayer(1), makeLayer(2, true, true)};
        PingPong pp3;
        FramePlan p3 = planFrame(three, pp3);
        assert(*p3.steps[2].backgroundSlot == p3.steps[0].inputSlot);

        // A hidden first layer does not capture the background
        std::vector<Layer> hiddenFirst = {makeLayer(0, false), makeLayer(1), makeLayer(2, true, true)};
        PingPong pph;
        FramePlan ph = planFrame(hiddenFirst, pph);
        assert(ph.steps.size() == 2);
        assert(ph.steps[0].layer == 1);
        assert(*ph.steps[1].backgroundSlot == ph.steps[0].inputSlot);
    }

    // Scenario D: empty list, fallback every frame
    {
        std::vector<Layer> layers;
        PingPong pp;
        for (int i = 0; i < 3; ++i) {
            FramePlan plan = planFrame(layers, pp);
            assert(plan.fallback);
            assert(plan.steps.empty());
            assert(plan.swaps == 0);
        }
        assert(pp.input() == 0);
    }

    // Hidden layers take no slot and cause no swap
    {
        std::vector<Layer> layers = {makeLayer(0), makeLayer(1, false), makeLayer(2)};
        PingPong pp;
        FramePlan plan = planFrame(layers, pp);
        assert(plan.steps.size() == 2);
        assert(plan.swaps == 1);
        assert(plan.steps[0].layer == 0);
        assert(plan.steps[1].layer == 2);
        assert(plan.steps[1].destination == Destination::Screen);
    }

    // A trailing hidden layer: the last visible one goes to the screen
    {
        std::vector<Layer> layers = {makeLayer(0), makeLayer(1), makeLayer(2, false)};
        PingPong pp;
        FramePlan plan = planFrame(layers, pp);
        assert(plan.steps.size() == 2);
        assert(plan.steps[1].layer == 1);
        assert(plan.steps[1].destination == Destination::Screen);
        assert(plan.swaps == 1);
    }

    // Nothing visible: no fallback, nothing drawn, just the clear
    {
        std::vector<Layer> layers = {makeLayer(0, false), makeLayer(1, false)};
        PingPong pp;
        FramePlan plan = planFrame(layers, pp);
        assert(!plan.fallback);
        assert(plan.steps.empty());
        assert(plan.swaps == 0);
    }

    // Label state persists across frames: an odd swap count alternates
    {
        std::vector<Layer> layers = {makeLayer(0), makeLayer(1)};
        PingPong pp;
        FramePlan first = planFrame(layers, pp);
        assert(first.swaps == 1);
        assert(first.steps[0].inputSlot == 0);
        FramePlan second = planFrame(layers, pp);
        assert(second.steps[0].inputSlot == 1);
        assert(second.steps[0].outputSlot == 0);
    }

    // Only the first program of a multi-pass layer is drawn
    {
        Layer multi = makeLayer(4);
        multi.programs = {4, 5, 6};
        std::vector<Layer> layers = {multi};
        PingPong pp;
        FramePlan plan = planFrame(layers, pp);
        assert(plan.steps.size() == 1);
        assert(plan.steps[0].program == 4);
    }

    // Planning never looks programs up: an id that will fail to bind still
    // takes its slot and its swap
    {
        std::vector<Layer> layers = {makeLayer(999), makeLayer(1)};
        PingPong pp;
        FramePlan plan = planFrame(layers, pp);
        assert(plan.steps.size() == 2);
        assert(plan.steps[0].program == 999);
        assert(plan.swaps == 1);
        assert(plan.steps[1].inputSlot == plan.steps[0].outputSlot);
    }

    // Background copy: needed only once the background slot gets overwritten
    {
        PingPong pp;
        std::vector<Layer> single = {makeLayer(0, true, true)};
        assert(!backgroundNeedsSnapshot(planFrame(single, pp)));

        PingPong ppb;
        std::vector<Layer> plain = {makeLayer(0), makeLayer(1), makeLayer(2)};
        assert(!backgroundNeedsSnapshot(planFrame(plain, ppb)));

        // Scenario C: the second layer reads slot 0, nothing wrote it
        PingPong ppc;
        std::vector<Layer> two = {makeLayer(0), makeLayer(1, true, true)};
        assert(!backgroundNeedsSnapshot(planFrame(two, ppc)));

        // Third layer reads the first input after the second layer wrote it
        PingPong pp3;
        std::vector<Layer> three = {makeLayer(0), makeLayer(1), makeLayer(2, true, true)};
        FramePlan p3 = planFrame(three, pp3);
        assert(p3.steps[1].outputSlot == *p3.steps[2].backgroundSlot);
        assert(backgroundNeedsSnapshot(p3));

        // Same stack on the following frame, labels shifted by the odd swap count
        PingPong pp4;
        std::vector<Layer> four = {makeLayer(0), makeLayer(1), makeLayer(2, true, true),
                                   makeLayer(3)};
        assert(backgroundNeedsSnapshot(planFrame(four, pp4)));
        assert(backgroundNeedsSnapshot(planFrame(four, pp4)));

        FramePlan fallback;
        fallback.fallback = true;
        assert(!backgroundNeedsSnapshot(fallback));
    }

    // Uniform refresh reaches hidden layers; resolution only on resize
    {
        std::vector<Layer> layers = {makeLayer(0), makeLayer(1, false)};
        refreshFrameUniforms(layers, 1.5f, {0.2f, 0.8f});
        for (const auto& l : layers) {
            assert(l.uniforms.time() == 1.5f);
            assert((l.uniforms.pointer() == Vec2{0.2f, 0.8f}));
            assert((l.uniforms.resolution() == Vec2{100.0f, 100.0f}));
        }

        applyResolution(layers, {1920.0f, 1080.0f});
        for (const auto& l : layers) {
            assert((l.uniforms.resolution() == Vec2{1920.0f, 1080.0f}));
            assert(l.uniforms.time() == 1.5f);
        }
    }

    std::printf("frame plan tests passed\n");
    return 0;
}
