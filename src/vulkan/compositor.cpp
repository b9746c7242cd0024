#include <layerfx/compositor.hpp>
#include <layerfx/allocator.hpp>
#include <layerfx/barriers.hpp>
#include <layerfx/device.hpp>
#include <layerfx/push_descriptor_writer.hpp>
#include <layerfx/shader_source.hpp>
#include <layerfx/texture.hpp>

#include <cstdio>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace layerfx {

namespace {

constexpr const char* kFallbackVertex = R"(
void main() {
    gl_Position = vec4(position, 1.0);
}
)";

constexpr const char* kFallbackFragment = R"(
layout(location = 0) out vec4 outColor;

void main() {
    outColor = uFallbackColor;
}
)";

constexpr std::string_view kFallbackColorName = "uFallbackColor";

Vec2 toVec2(Size size) {
    return {static_cast<float>(size.width), static_cast<float>(size.height)};
}

VkExtent2D toExtent(Size size) {
    return {size.width, size.height};
}

VkClearValue toClear(Vec4 c) {
    VkClearValue v{};
    v.color.float32[0] = c.x;
    v.color.float32[1] = c.y;
    v.color.float32[2] = c.z;
    v.color.float32[3] = c.w;
    return v;
}

void beginRendering(VkCommandBuffer cmd, VkImageView view, VkExtent2D extent,
                    VkClearValue clear) {
    VkRenderingAttachmentInfo color{};
    color.sType       = VK_STRUCTURE_TYPE_RENDERING_ATTACHMENT_INFO;
    color.imageView   = view;
    color.imageLayout = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;
    color.loadOp      = VK_ATTACHMENT_LOAD_OP_CLEAR;
    color.storeOp     = VK_ATTACHMENT_STORE_OP_STORE;
    color.clearValue  = clear;

    VkRenderingInfo info{};
    info.sType                = VK_STRUCTURE_TYPE_RENDERING_INFO;
    info.renderArea           = {{0, 0}, extent};
    info.layerCount           = 1;
    info.colorAttachmentCount = 1;
    info.pColorAttachments    = &color;

    vkCmdBeginRendering(cmd, &info);
}

// Offscreen targets keep row 0 at the bottom with a standard viewport; the
// screen pass flips so the bottom row lands at the bottom of the window.
void setViewport(VkCommandBuffer cmd, VkExtent2D extent, Destination destination) {
    VkViewport viewport{};
    viewport.x        = 0.0f;
    viewport.width    = static_cast<float>(extent.width);
    viewport.minDepth = 0.0f;
    viewport.maxDepth = 1.0f;
    if (destination == Destination::Screen) {
        viewport.y      = static_cast<float>(extent.height);
        viewport.height = -static_cast<float>(extent.height);
    } else {
        viewport.y      = 0.0f;
        viewport.height = static_cast<float>(extent.height);
    }
    vkCmdSetViewport(cmd, 0, 1, &viewport);

    VkRect2D scissor{{0, 0}, extent};
    vkCmdSetScissor(cmd, 0, 1, &scissor);
}

} // anonymous namespace

Compositor::Compositor(const Device& device, const Allocator& allocator,
                       const CompositorConfig& config, VkFormat screenFormat,
                       RenderTargetPair targets, Image defaultTexture, Buffer quad,
                       Sampler textureSampler)
    : device_(&device),
      allocator_(&allocator),
      config_(config),
      size_(config.size),
      programs_(device, kRenderTargetFormat, screenFormat),
      textures_(device, allocator),
      targets_(std::move(targets)),
      defaultTexture_(std::move(defaultTexture)),
      quad_(std::move(quad)),
      textureSampler_(std::move(textureSampler)),
      fallbackUniforms_(UniformTable::withDefaults(toVec2(config.size))) {}

Result<std::unique_ptr<Compositor>> Compositor::create(
    const Device& device, const Allocator& allocator, VkFormat screenFormat,
    const Description& description, const CompositorConfig& config) {
    if (config.size.empty()) {
        Error e{"create compositor", 0, "initial size is 0"};
        e.kind = ErrorKind::Startup;
        return e;
    }

    auto targets = RenderTargetPair::create(device, allocator, toExtent(config.size));
    if (!targets.ok()) return targets.error();

    const unsigned char transparent[4] = {0, 0, 0, 0};
    auto defaultTexture = uploadTexture(allocator, device, transparent, 1, 1);
    if (!defaultTexture.ok()) return defaultTexture.error();

    auto quad = uploadVertexBuffer(allocator, device, kQuadVertices, sizeof(kQuadVertices));
    if (!quad.ok()) return quad.error();

    auto sampler = Sampler::create(device, SamplerUse::Texture);
    if (!sampler.ok()) return sampler.error();

    std::unique_ptr<Compositor> c(new Compositor(
        device, allocator, config, screenFormat,
        std::move(targets).value(), std::move(defaultTexture).value(),
        std::move(quad).value(), std::move(sampler).value()));

    c->refreshTargetHandles();

    auto fallback = c->buildFallback();
    if (!fallback.ok()) return fallback.error();

    LayerBuildHooks hooks;
    Compositor* self = c.get();
    hooks.compile = [self](const UniformTable& uniforms, std::string_view vert,
                           std::string_view frag, const std::string& label) {
        return self->programs_.compile(uniforms, vert, frag, label);
    };
    hooks.requestTexture = [self](const std::string& source) {
        return self->textures_.request(source);
    };

    c->layers_ = buildLayers(description.history, toVec2(config.size), hooks);

    if (c->layers_.empty()) {
        std::fprintf(stderr, "[layerfx] warning: no usable layers, drawing fallback\n");
    } else {
        std::fprintf(stderr, "[layerfx] %zu layer(s), %zu program(s)\n",
                     c->layers_.size(), c->programs_.size());
    }
    return c;
}

Result<void> Compositor::buildFallback() {
    fallbackUniforms_.declare(std::string(kFallbackColorName), config_.fallbackColor);

    auto id = programs_.compile(fallbackUniforms_, kFallbackVertex, kFallbackFragment,
                                "fallback");
    if (!id.ok()) {
        Error e = id.error();
        e.kind = ErrorKind::Startup;
        return e;
    }
    fallbackProgram_ = id.value();
    return {};
}

void Compositor::refreshTargetHandles() {
    targetHandles_[0] = TextureHandle::ready(targets_.slot(0).vkImageView());
    targetHandles_[1] = TextureHandle::ready(targets_.slot(1).vkImageView());
    targetHandles_[2] = TextureHandle::ready(targets_.snapshot().vkImageView());
}

Result<void> Compositor::resize(Size size) {
    if (size.empty() || size == size_) return {};

    device_->waitIdle();

    auto resized = targets_.resize(toExtent(size));
    if (!resized.ok()) return resized;

    size_ = size;
    refreshTargetHandles();
    applyResolution(layers_, toVec2(size));
    fallbackUniforms_.setResolution(toVec2(size));
    return {};
}

VkImageView Compositor::viewOrDefault(const TextureHandle& handle) const {
    VkImageView view = handle.view();
    return view != VK_NULL_HANDLE ? view : defaultTexture_.vkImageView();
}

bool Compositor::canBind(const Program& program, const UniformTable& table) const {
    for (const auto& name : program.uniformLayout().customTextures) {
        if (!table.get<TextureHandle>(name)) return false;
    }
    return true;
}

void Compositor::pushTextures(VkCommandBuffer cmd, const Program& program,
                              const UniformTable& table) const {
    constexpr VkImageLayout kRead = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL;

    PushDescriptorWriter writer(device_->pushDescriptorFn(), program.vkPipelineLayout(), 0);
    writer.image(kInputImageBinding, viewOrDefault(table.inputImage()), kRead,
                 targets_.sampler());
    writer.image(kBackgroundImageBinding, viewOrDefault(table.backgroundImage()), kRead,
                 targets_.sampler());

    const auto& custom = program.uniformLayout().customTextures;
    for (std::size_t i = 0; i < custom.size(); ++i) {
        const TextureHandle* handle = table.get<TextureHandle>(custom[i]);
        writer.image(kFirstCustomBinding + static_cast<std::uint32_t>(i),
                     handle ? viewOrDefault(*handle) : defaultTexture_.vkImageView(),
                     kRead, textureSampler_.vkSampler());
    }
    writer.push(cmd);
}

void Compositor::drawQuad(VkCommandBuffer cmd, const Program& program,
                          const UniformTable& table, Destination destination,
                          VkExtent2D extent) const {
    program.bind(cmd, destination);
    setViewport(cmd, extent, destination);
    pushTextures(cmd, program, table);
    program.pushUniforms(cmd, table);

    VkBuffer     vb     = quad_.vkBuffer();
    VkDeviceSize offset = 0;
    vkCmdBindVertexBuffers(cmd, 0, 1, &vb, &offset);
    vkCmdDraw(cmd, 6, 1, 0, 0);
}

void Compositor::reportBindFailure(std::size_t layerIndex, const char* reason) {
    if (!reportedLayers_.insert(layerIndex).second) return;
    std::fprintf(stderr, "[layerfx] error: layer %zu (%s) not drawn: %s\n",
                 layerIndex, layers_[layerIndex].kind.c_str(), reason);
}

void Compositor::recordStep(VkCommandBuffer cmd, const DrawStep& step) {
    Layer& layer = layers_[step.layer];

    layer.uniforms.setInputImage(targetHandles_[step.inputSlot]);
    if (step.backgroundSlot) {
        layer.uniforms.setBackgroundImage(
            targetHandles_[backgroundFromSnapshot_ ? 2 : *step.backgroundSlot]);
    } else {
        layer.uniforms.setBackgroundImage(TextureHandle{});
    }

    const Program* program = programs_.find(step.program);
    const char*    failure = nullptr;
    if (!program) {
        failure = "unknown program";
    } else if (!canBind(*program, layer.uniforms)) {
        failure = "a sampler has no texture slot";
    }

    if (step.destination == Destination::Offscreen) {
        const Image& output = targets_.slot(step.outputSlot);
        transitionToRenderTarget(cmd, output.vkImage());
        beginRendering(cmd, output.vkImageView(), targets_.extent(), VkClearValue{});
        if (!failure) {
            drawQuad(cmd, *program, layer.uniforms, Destination::Offscreen, targets_.extent());
        }
        vkCmdEndRendering(cmd);
        transitionToSampled(cmd, output.vkImage());
    } else if (!failure) {
        drawQuad(cmd, *program, layer.uniforms, Destination::Screen, screenExtent_);
    }

    if (failure) reportBindFailure(step.layer, failure);
}

const FramePlan& Compositor::renderFrame(VkCommandBuffer cmd, float elapsedSeconds,
                                         const ScreenTarget& screen) {
    screenExtent_ = screen.extent;

    refreshFrameUniforms(layers_, elapsedSeconds, pointer_);
    fallbackUniforms_.setTime(elapsedSeconds);
    fallbackUniforms_.setPointer(pointer_);

    plan_ = planFrame(layers_, targets_.labels());

    backgroundFromSnapshot_ = backgroundNeedsSnapshot(plan_);
    if (backgroundFromSnapshot_) {
        for (const auto& step : plan_.steps) {
            if (step.backgroundSlot) {
                targets_.recordSnapshot(cmd, *step.backgroundSlot);
                break;
            }
        }
    }

    for (const auto& step : plan_.steps) {
        if (step.destination == Destination::Offscreen) recordStep(cmd, step);
    }

    transitionToColorAttachment(cmd, screen.image);
    beginRendering(cmd, screen.view, screen.extent, toClear(config_.clearColor));

    if (plan_.fallback) {
        if (const Program* fallback = programs_.find(*fallbackProgram_)) {
            drawQuad(cmd, *fallback, fallbackUniforms_, Destination::Screen, screen.extent);
        }
    } else {
        for (const auto& step : plan_.steps) {
            if (step.destination == Destination::Screen) recordStep(cmd, step);
        }
    }

    vkCmdEndRendering(cmd);
    transitionToPresent(cmd, screen.image);
    return plan_;
}

} // namespace layerfx
