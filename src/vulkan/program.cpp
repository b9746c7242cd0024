#include <layerfx/program.hpp>
#include <layerfx/device.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace layerfx {

namespace {

constexpr VkShaderStageFlags kUniformStages =
    VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_FRAGMENT_BIT;

Error buildError(std::string op, VkResult vr, std::string message) {
    Error e{std::move(op), static_cast<std::int32_t>(vr), std::move(message)};
    e.kind = ErrorKind::Build;
    return e;
}

} // anonymous namespace

void Program::destroy() {
    if (device_ == VK_NULL_HANDLE) return;
    if (offscreen_ != VK_NULL_HANDLE) vkDestroyPipeline(device_, offscreen_, nullptr);
    if (screen_ != VK_NULL_HANDLE)    vkDestroyPipeline(device_, screen_, nullptr);
    if (layout_ != VK_NULL_HANDLE)    vkDestroyPipelineLayout(device_, layout_, nullptr);
    if (setLayout_ != VK_NULL_HANDLE) vkDestroyDescriptorSetLayout(device_, setLayout_, nullptr);
    offscreen_ = VK_NULL_HANDLE;
    screen_    = VK_NULL_HANDLE;
    layout_    = VK_NULL_HANDLE;
    setLayout_ = VK_NULL_HANDLE;
    device_    = VK_NULL_HANDLE;
}

Program::~Program() { destroy(); }

Program::Program(Program&& o) noexcept
    : device_(o.device_), setLayout_(o.setLayout_), layout_(o.layout_),
      offscreen_(o.offscreen_), screen_(o.screen_),
      uniforms_(std::move(o.uniforms_)), label_(std::move(o.label_)) {
    o.device_    = VK_NULL_HANDLE;
    o.setLayout_ = VK_NULL_HANDLE;
    o.layout_    = VK_NULL_HANDLE;
    o.offscreen_ = VK_NULL_HANDLE;
    o.screen_    = VK_NULL_HANDLE;
}

Program& Program::operator=(Program&& o) noexcept {
    if (this != &o) {
        destroy();
        device_    = o.device_;
        setLayout_ = o.setLayout_;
        layout_    = o.layout_;
        offscreen_ = o.offscreen_;
        screen_    = o.screen_;
        uniforms_  = std::move(o.uniforms_);
        label_     = std::move(o.label_);
        o.device_    = VK_NULL_HANDLE;
        o.setLayout_ = VK_NULL_HANDLE;
        o.layout_    = VK_NULL_HANDLE;
        o.offscreen_ = VK_NULL_HANDLE;
        o.screen_    = VK_NULL_HANDLE;
    }
    return *this;
}

VkPipeline Program::pipelineFor(Destination destination) const {
    return destination == Destination::Screen ? screen_ : offscreen_;
}

void Program::bind(VkCommandBuffer cmd, Destination destination) const {
    vkCmdBindPipeline(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, pipelineFor(destination));
}

void Program::pushUniforms(VkCommandBuffer cmd, const UniformTable& table) const {
    std::vector<std::byte> bytes = packUniforms(uniforms_, table);
    vkCmdPushConstants(cmd, layout_, kUniformStages, 0,
                       static_cast<std::uint32_t>(bytes.size()), bytes.data());
}

ProgramBuilder::ProgramBuilder(const Device& device)
    : device_(device.vkDevice()) {}

ProgramBuilder& ProgramBuilder::vertexCode(std::vector<std::uint32_t> spirv) {
    vertCode_ = std::move(spirv);
    return *this;
}

ProgramBuilder& ProgramBuilder::fragmentCode(std::vector<std::uint32_t> spirv) {
    fragCode_ = std::move(spirv);
    return *this;
}

ProgramBuilder& ProgramBuilder::uniformLayout(UniformBlockLayout layout) {
    uniforms_    = std::move(layout);
    hasUniforms_ = true;
    return *this;
}

ProgramBuilder& ProgramBuilder::offscreenFormat(VkFormat format) {
    offscreenFormat_ = format;
    return *this;
}

ProgramBuilder& ProgramBuilder::screenFormat(VkFormat format) {
    screenFormat_ = format;
    return *this;
}

ProgramBuilder& ProgramBuilder::label(std::string name) {
    label_ = std::move(name);
    return *this;
}

Result<VkShaderModule> ProgramBuilder::createModule(const std::vector<std::uint32_t>& code) const {
    VkShaderModuleCreateInfo ci{};
    ci.sType    = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO;
    ci.codeSize = code.size() * sizeof(std::uint32_t);
    ci.pCode    = code.data();

    VkShaderModule module = VK_NULL_HANDLE;
    VkResult vr = vkCreateShaderModule(device_, &ci, nullptr, &module);
    if (vr != VK_SUCCESS) {
        return buildError("create shader module", vr, label_ + ": vkCreateShaderModule failed");
    }
    return module;
}

Result<VkPipeline> ProgramBuilder::createPipeline(VkPipelineLayout layout,
                                                  VkShaderModule vert, VkShaderModule frag,
                                                  VkFormat colorFormat) const {
    VkPipelineShaderStageCreateInfo stages[2]{};
    stages[0].sType  = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
    stages[0].stage  = VK_SHADER_STAGE_VERTEX_BIT;
    stages[0].module = vert;
    stages[0].pName  = "main";
    stages[1].sType  = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
    stages[1].stage  = VK_SHADER_STAGE_FRAGMENT_BIT;
    stages[1].module = frag;
    stages[1].pName  = "main";

    VkVertexInputBindingDescription binding{0, sizeof(QuadVertex), VK_VERTEX_INPUT_RATE_VERTEX};
    VkVertexInputAttributeDescription attributes[2] = {
        {0, 0, VK_FORMAT_R32G32B32_SFLOAT, offsetof(QuadVertex, position)},
        {1, 0, VK_FORMAT_R32G32_SFLOAT,    offsetof(QuadVertex, uv)},
    };

    VkPipelineVertexInputStateCreateInfo vertexInput{};
    vertexInput.sType = VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO;
    vertexInput.vertexBindingDescriptionCount   = 1;
    vertexInput.pVertexBindingDescriptions      = &binding;
    vertexInput.vertexAttributeDescriptionCount = 2;
    vertexInput.pVertexAttributeDescriptions    = attributes;

    VkPipelineInputAssemblyStateCreateInfo inputAssembly{};
    inputAssembly.sType    = VK_STRUCTURE_TYPE_PIPELINE_INPUT_ASSEMBLY_STATE_CREATE_INFO;
    inputAssembly.topology = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;

    VkPipelineViewportStateCreateInfo viewportState{};
    viewportState.sType         = VK_STRUCTURE_TYPE_PIPELINE_VIEWPORT_STATE_CREATE_INFO;
    viewportState.viewportCount = 1;
    viewportState.scissorCount  = 1;

    VkPipelineRasterizationStateCreateInfo rasterizer{};
    rasterizer.sType       = VK_STRUCTURE_TYPE_PIPELINE_RASTERIZATION_STATE_CREATE_INFO;
    rasterizer.polygonMode = VK_POLYGON_MODE_FILL;
    rasterizer.lineWidth   = 1.0f;
    rasterizer.cullMode    = VK_CULL_MODE_NONE;
    rasterizer.frontFace   = VK_FRONT_FACE_COUNTER_CLOCKWISE;

    VkPipelineMultisampleStateCreateInfo multisampling{};
    multisampling.sType                = VK_STRUCTURE_TYPE_PIPELINE_MULTISAMPLE_STATE_CREATE_INFO;
    multisampling.rasterizationSamples = VK_SAMPLE_COUNT_1_BIT;

    // Layers replace their destination; compositing happens in the shaders.
    VkPipelineColorBlendAttachmentState colorBlendAttachment{};
    colorBlendAttachment.colorWriteMask =
        VK_COLOR_COMPONENT_R_BIT | VK_COLOR_COMPONENT_G_BIT |
        VK_COLOR_COMPONENT_B_BIT | VK_COLOR_COMPONENT_A_BIT;

    VkPipelineColorBlendStateCreateInfo colorBlend{};
    colorBlend.sType           = VK_STRUCTURE_TYPE_PIPELINE_COLOR_BLEND_STATE_CREATE_INFO;
    colorBlend.attachmentCount = 1;
    colorBlend.pAttachments    = &colorBlendAttachment;

    VkPipelineDepthStencilStateCreateInfo depthStencil{};
    depthStencil.sType = VK_STRUCTURE_TYPE_PIPELINE_DEPTH_STENCIL_STATE_CREATE_INFO;

    VkDynamicState dynamicStates[] = {VK_DYNAMIC_STATE_VIEWPORT, VK_DYNAMIC_STATE_SCISSOR};
    VkPipelineDynamicStateCreateInfo dynamicState{};
    dynamicState.sType             = VK_STRUCTURE_TYPE_PIPELINE_DYNAMIC_STATE_CREATE_INFO;
    dynamicState.dynamicStateCount = 2;
    dynamicState.pDynamicStates    = dynamicStates;

    VkPipelineRenderingCreateInfo renderingInfo{};
    renderingInfo.sType                   = VK_STRUCTURE_TYPE_PIPELINE_RENDERING_CREATE_INFO;
    renderingInfo.colorAttachmentCount    = 1;
    renderingInfo.pColorAttachmentFormats = &colorFormat;

    VkGraphicsPipelineCreateInfo pipelineCI{};
    pipelineCI.sType               = VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO;
    pipelineCI.pNext               = &renderingInfo;
    pipelineCI.stageCount          = 2;
    pipelineCI.pStages             = stages;
    pipelineCI.pVertexInputState   = &vertexInput;
    pipelineCI.pInputAssemblyState = &inputAssembly;
    pipelineCI.pViewportState      = &viewportState;
    pipelineCI.pRasterizationState = &rasterizer;
    pipelineCI.pMultisampleState   = &multisampling;
    pipelineCI.pDepthStencilState  = &depthStencil;
    pipelineCI.pColorBlendState    = &colorBlend;
    pipelineCI.pDynamicState       = &dynamicState;
    pipelineCI.layout              = layout;
    pipelineCI.renderPass          = VK_NULL_HANDLE;

    VkPipeline pipeline = VK_NULL_HANDLE;
    VkResult vr = vkCreateGraphicsPipelines(device_, VK_NULL_HANDLE, 1, &pipelineCI,
                                            nullptr, &pipeline);
    if (vr != VK_SUCCESS) {
        return buildError("create pipeline", vr, label_ + ": vkCreateGraphicsPipelines failed");
    }
    return pipeline;
}

Result<Program> ProgramBuilder::build() {
    if (vertCode_.empty()) {
        return buildError("create program", VK_SUCCESS, label_ + ": no vertex code");
    }
    if (fragCode_.empty()) {
        return buildError("create program", VK_SUCCESS, label_ + ": no fragment code");
    }
    if (!hasUniforms_) {
        return buildError("create program", VK_SUCCESS,
                          label_ + ": no uniform layout -- call uniformLayout()");
    }
    if (offscreenFormat_ == VK_FORMAT_UNDEFINED || screenFormat_ == VK_FORMAT_UNDEFINED) {
        return buildError("create program", VK_SUCCESS,
                          label_ + ": both destination formats must be set");
    }

    Program p;
    p.device_   = device_;
    p.uniforms_ = uniforms_;
    p.label_    = label_;

    std::vector<VkDescriptorSetLayoutBinding> bindings(uniforms_.textureCount());
    for (std::uint32_t i = 0; i < bindings.size(); ++i) {
        bindings[i].binding         = i;
        bindings[i].descriptorType  = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
        bindings[i].descriptorCount = 1;
        bindings[i].stageFlags      = VK_SHADER_STAGE_FRAGMENT_BIT;
    }

    VkDescriptorSetLayoutCreateInfo setCI{};
    setCI.sType        = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
    setCI.flags        = VK_DESCRIPTOR_SET_LAYOUT_CREATE_PUSH_DESCRIPTOR_BIT_KHR;
    setCI.bindingCount = static_cast<std::uint32_t>(bindings.size());
    setCI.pBindings    = bindings.data();

    VkResult vr = vkCreateDescriptorSetLayout(device_, &setCI, nullptr, &p.setLayout_);
    if (vr != VK_SUCCESS) {
        return buildError("create descriptor set layout", vr,
                          label_ + ": vkCreateDescriptorSetLayout failed");
    }

    VkPushConstantRange range{kUniformStages, 0, uniforms_.size};

    VkPipelineLayoutCreateInfo layoutCI{};
    layoutCI.sType                  = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
    layoutCI.setLayoutCount         = 1;
    layoutCI.pSetLayouts            = &p.setLayout_;
    layoutCI.pushConstantRangeCount = 1;
    layoutCI.pPushConstantRanges    = &range;

    vr = vkCreatePipelineLayout(device_, &layoutCI, nullptr, &p.layout_);
    if (vr != VK_SUCCESS) {
        return buildError("create pipeline layout", vr,
                          label_ + ": vkCreatePipelineLayout failed");
    }

    auto vert = createModule(vertCode_);
    if (!vert.ok()) return vert.error();
    auto frag = createModule(fragCode_);
    if (!frag.ok()) {
        vkDestroyShaderModule(device_, vert.value(), nullptr);
        return frag.error();
    }

    auto offscreen = createPipeline(p.layout_, vert.value(), frag.value(), offscreenFormat_);
    Result<VkPipeline> screen = offscreen.ok()
        ? createPipeline(p.layout_, vert.value(), frag.value(), screenFormat_)
        : Result<VkPipeline>(offscreen.error());

    // Pipelines keep no reference to their modules.
    vkDestroyShaderModule(device_, vert.value(), nullptr);
    vkDestroyShaderModule(device_, frag.value(), nullptr);

    if (!offscreen.ok()) return offscreen.error();
    p.offscreen_ = offscreen.value();
    if (!screen.ok()) return screen.error();
    p.screen_ = screen.value();

    return p;
}

ProgramStore::ProgramStore(const Device& device, VkFormat offscreenFormat, VkFormat screenFormat)
    : device_(&device), offscreenFormat_(offscreenFormat), screenFormat_(screenFormat) {}

Result<ProgramId> ProgramStore::compile(const UniformTable& uniforms,
                                        std::string_view vertexSource,
                                        std::string_view fragmentSource,
                                        const std::string& label) {
    auto layout = layoutUniformBlock(uniforms);
    if (!layout.ok()) {
        Error e = layout.error();
        e.message = label + ": " + e.message;
        return e;
    }

    auto vert = compiler_.compile(assembleShader(vertexPrelude(layout.value()), vertexSource),
                                  ShaderStage::Vertex, label + ".vert");
    if (!vert.ok()) return vert.error();

    auto frag = compiler_.compile(assembleShader(fragmentPrelude(layout.value()), fragmentSource),
                                  ShaderStage::Fragment, label + ".frag");
    if (!frag.ok()) return frag.error();

    auto program = ProgramBuilder(*device_)
                       .vertexCode(std::move(vert).value())
                       .fragmentCode(std::move(frag).value())
                       .uniformLayout(std::move(layout).value())
                       .offscreenFormat(offscreenFormat_)
                       .screenFormat(screenFormat_)
                       .label(label)
                       .build();
    if (!program.ok()) return program.error();

    auto id = static_cast<ProgramId>(programs_.size());
    programs_.push_back(std::move(program).value());
    return id;
}

const Program* ProgramStore::find(ProgramId id) const {
    if (id >= programs_.size()) return nullptr;
    return &programs_[id];
}

} // namespace layerfx
