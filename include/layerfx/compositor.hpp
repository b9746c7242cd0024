#pragma once

#include <layerfx/buffer.hpp>
#include <layerfx/description.hpp>
#include <layerfx/error.hpp>
#include <layerfx/frame_plan.hpp>
#include <layerfx/image.hpp>
#include <layerfx/layer.hpp>
#include <layerfx/program.hpp>
#include <layerfx/render_targets.hpp>
#include <layerfx/result.hpp>
#include <layerfx/sampler.hpp>
#include <layerfx/texture_loader.hpp>
#include <layerfx/uniforms.hpp>
#include <layerfx/window.hpp>

#include <vulkan/vulkan.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <vector>

namespace layerfx {

class Allocator;
class Device;

struct CompositorConfig {
    Size          size           = {1280, 720};
    Vec4          clearColor     = {0.0f, 0.0f, 0.0f, 1.0f};
    Vec4          fallbackColor  = {1.0f, 0.0f, 0.0f, 1.0f};
    std::uint32_t framesInFlight = 2;
};

// The swapchain image a frame ends on. Expected in UNDEFINED layout; left in
// PRESENT_SRC_KHR.
struct ScreenTarget {
    VkImage     image  = VK_NULL_HANDLE;
    VkImageView view   = VK_NULL_HANDLE;
    VkExtent2D  extent = {0, 0};
};

// Owns the layer list, every compiled program, the render target pair and
// custom textures, and records one frame at a time.
//
// Each frame: refresh uTime/uMousePos on every layer, plan the draws
// (planFrame), then record them. Every layer but the last visible one renders
// into the cleared output target followed by a swap; the last renders to the
// screen. An empty layer list draws the fallback indicator instead.
//
// Thread safety: thread-confined (render thread).
class Compositor {
public:
    // Builds every layer from `description`. Layer defects are logged and
    // dropped; only GPU resource creation can fail here.
    [[nodiscard]] static Result<std::unique_ptr<Compositor>> create(
        const Device& device, const Allocator& allocator, VkFormat screenFormat,
        const Description& description, const CompositorConfig& config = {});

    Compositor(const Compositor&) = delete;
    Compositor& operator=(const Compositor&) = delete;

    // Normalized pointer, shared by every layer from the next frame on.
    void setPointer(Vec2 normalized) { pointer_ = normalized; }
    [[nodiscard]] Vec2 pointer() const { return pointer_; }

    // Waits for the device, reallocates both render targets and sets every
    // layer's uResolution. Call between frames. A zero size is ignored.
    [[nodiscard]] Result<void> resize(Size size);

    // Uploads finished texture decodes. Returns the number resolved or failed.
    std::size_t pollTextures() { return textures_.poll(); }

    // Records the whole frame into `cmd` (already begun). Never fails: a
    // layer that cannot be bound is skipped and reported once.
    const FramePlan& renderFrame(VkCommandBuffer cmd, float elapsedSeconds,
                                 const ScreenTarget& screen);

    [[nodiscard]] const std::vector<Layer>& layers()   const { return layers_; }
    [[nodiscard]] std::vector<Layer>&       layers()         { return layers_; }
    [[nodiscard]] const FramePlan&          lastPlan() const { return plan_; }
    [[nodiscard]] const RenderTargetPair&   targets()  const { return targets_; }
    [[nodiscard]] const ProgramStore&       programs() const { return programs_; }
    [[nodiscard]] TextureLoader&            textures()       { return textures_; }
    [[nodiscard]] Size                      size()     const { return size_; }

    // Layers that failed to bind at least once.
    [[nodiscard]] std::size_t bindFailures() const { return reportedLayers_.size(); }

private:
    Compositor(const Device& device, const Allocator& allocator,
               const CompositorConfig& config, VkFormat screenFormat, RenderTargetPair targets, Image defaultTexture,
               Buffer quad, Sampler textureSampler);

    [[nodiscard]] Result<void> buildFallback();
    void refreshTargetHandles();

    [[nodiscard]] bool canBind(const Program& program, const UniformTable& table) const;
    void pushTextures(VkCommandBuffer cmd, const Program& program,
                      const UniformTable& table) const;
    void drawQuad(VkCommandBuffer cmd, const Program& program, const UniformTable& table,
                  Destination destination, VkExtent2D extent) const;
    void recordStep(VkCommandBuffer cmd, const DrawStep& step);
    void reportBindFailure(std::size_t layerIndex, const char* reason);

    [[nodiscard]] VkImageView viewOrDefault(const TextureHandle& handle) const;

    const Device*            device_;
    const Allocator*         allocator_;
    CompositorConfig         config_;
    Size                     size_;
    ProgramStore             programs_;
    TextureLoader            textures_;
    RenderTargetPair         targets_;
    Image                    defaultTexture_;
    Buffer                   quad_;
    Sampler                  textureSampler_;
    std::vector<Layer>       layers_;
    std::optional<ProgramId> fallbackProgram_;
    UniformTable             fallbackUniforms_;
    Vec2                     pointer_ = {0.5f, 0.5f};
    FramePlan                plan_;

    // Ready handles over slot 0, slot 1 and the snapshot image.
    std::array<TextureHandle, 3> targetHandles_;
    bool                         backgroundFromSnapshot_ = false;
    VkExtent2D                   screenExtent_ = {0, 0};
    std::set<std::size_t>        reportedLayers_;
};

} // namespace layerfx
