#pragma once

#include <layerfx/error.hpp>
#include <layerfx/frame_plan.hpp>
#include <layerfx/layer.hpp>
#include <layerfx/result.hpp>
#include <layerfx/shader_compiler.hpp>
#include <layerfx/shader_source.hpp>
#include <layerfx/uniforms.hpp>

#include <vulkan/vulkan.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace layerfx {

class Device;

// Full-screen quad vertex: location 0 position, location 1 uv.
struct QuadVertex {
    float position[3];
    float uv[2];
};

// Two triangles covering clip space, uv = (position + 1) / 2.
inline constexpr QuadVertex kQuadVertices[6] = {
    {{-1.0f, -1.0f, 0.0f}, {0.0f, 0.0f}},
    {{ 1.0f, -1.0f, 0.0f}, {1.0f, 0.0f}},
    {{-1.0f,  1.0f, 0.0f}, {0.0f, 1.0f}},
    {{-1.0f,  1.0f, 0.0f}, {0.0f, 1.0f}},
    {{ 1.0f, -1.0f, 0.0f}, {1.0f, 0.0f}},
    {{ 1.0f,  1.0f, 0.0f}, {1.0f, 1.0f}},
};

// One compiled layer pass: a push-descriptor set layout for its samplers, a
// pipeline layout with the uniform push-constant block, and one pipeline per
// destination (the render targets and the swapchain differ in format).
// Destroys pipelines before the layouts they reference.
//
// Thread safety: immutable after construction.
class Program {
public:
    ~Program();
    Program(Program&&) noexcept;
    Program& operator=(Program&&) noexcept;
    Program(const Program&) = delete;
    Program& operator=(const Program&) = delete;

    [[nodiscard]] VkPipeline         pipelineFor(Destination destination) const;
    [[nodiscard]] VkPipelineLayout   vkPipelineLayout() const { return layout_; }
    [[nodiscard]] const UniformBlockLayout& uniformLayout() const { return uniforms_; }
    [[nodiscard]] const std::string& label() const { return label_; }

    void bind(VkCommandBuffer cmd, Destination destination) const;

    // Packs `table` into the push-constant block and records the push.
    void pushUniforms(VkCommandBuffer cmd, const UniformTable& table) const;

private:
    friend class ProgramBuilder;
    Program() = default;
    void destroy();

    VkDevice              device_    = VK_NULL_HANDLE;
    VkDescriptorSetLayout setLayout_ = VK_NULL_HANDLE;
    VkPipelineLayout      layout_    = VK_NULL_HANDLE;
    VkPipeline            offscreen_ = VK_NULL_HANDLE;
    VkPipeline            screen_    = VK_NULL_HANDLE;
    UniformBlockLayout    uniforms_;
    std::string           label_;
};

class ProgramBuilder {
public:
    explicit ProgramBuilder(const Device& device);

    ProgramBuilder& vertexCode(std::vector<std::uint32_t> spirv);
    ProgramBuilder& fragmentCode(std::vector<std::uint32_t> spirv);
    ProgramBuilder& uniformLayout(UniformBlockLayout layout);

    // Color formats of the two destinations.
    ProgramBuilder& offscreenFormat(VkFormat format);
    ProgramBuilder& screenFormat(VkFormat format);

    ProgramBuilder& label(std::string name);

    [[nodiscard]] Result<Program> build();

private:
    [[nodiscard]] Result<VkShaderModule> createModule(const std::vector<std::uint32_t>& code) const;
    [[nodiscard]] Result<VkPipeline> createPipeline(VkPipelineLayout layout,
                                                    VkShaderModule vert, VkShaderModule frag,
                                                    VkFormat colorFormat) const;

    VkDevice                   device_          = VK_NULL_HANDLE;
    std::vector<std::uint32_t> vertCode_;
    std::vector<std::uint32_t> fragCode_;
    UniformBlockLayout         uniforms_;
    bool                       hasUniforms_     = false;
    VkFormat                   offscreenFormat_ = VK_FORMAT_UNDEFINED;
    VkFormat                   screenFormat_    = VK_FORMAT_UNDEFINED;
    std::string                label_           = "program";
};

// Owns every program built for the layer list. Program ids are indices and
// stay valid for the store's lifetime.
//
// Thread safety: thread-confined (render thread).
class ProgramStore {
public:
    ProgramStore(const Device& device, VkFormat offscreenFormat, VkFormat screenFormat);

    // Generate the preludes for `uniforms`, compile both stages and build the
    // pipelines. Build errors carry the compiler log.
    [[nodiscard]] Result<ProgramId> compile(const UniformTable& uniforms,
                                            std::string_view vertexSource,
                                            std::string_view fragmentSource,
                                            const std::string& label);

    [[nodiscard]] const Program* find(ProgramId id) const;
    [[nodiscard]] std::size_t    size() const { return programs_.size(); }

private:
    const Device*        device_;
    VkFormat             offscreenFormat_;
    VkFormat             screenFormat_;
    ShaderCompiler       compiler_;
    std::vector<Program> programs_;
};

} // namespace layerfx
